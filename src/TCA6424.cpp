/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * This software is distrubuted in the hope it will be useful, but without any warranty, including the implied warrranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See LICENSE.txt for details.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-ioexp/TCA6424.hpp"

#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <mutex>

TCA6424::TCA6424(I2C_transport& bus, const uint8_t id) : I2C_dev_base(bus, id)
{

}
TCA6424::~TCA6424()
{

}

std::error_code TCA6424::write_register(const CMD_CODE reg, const uint8_t val)
{
	if( ! is_valid(reg) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	const std::array<uint8_t, 2> frame = {get_cmd(reg, false), val};

	SPDLOG_TRACE("TCA6424 0x{:02X} wr {:02X}", m_dev_addr, fmt::join(frame, " "));

	std::unique_lock<I2C_transport> lock(m_bus);
	return m_bus.write(m_dev_addr, frame);
}
std::error_code TCA6424::read_register(const CMD_CODE reg, uint8_t* const out_val)
{
	if( ! is_valid(reg) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	const std::array<uint8_t, 1> cmd = {get_cmd(reg, false)};
	std::array<uint8_t, 1> val = {0};

	std::unique_lock<I2C_transport> lock(m_bus);
	std::error_code ec = m_bus.write_read(m_dev_addr, cmd, val);
	if(ec)
	{
		return ec;
	}

	SPDLOG_TRACE("TCA6424 0x{:02X} rd {:02X}: {:02X}", m_dev_addr, cmd[0], val[0]);

	if(out_val)
	{
		*out_val = val[0];
	}

	return std::error_code();
}
std::error_code TCA6424::write_registers_ai(const CMD_CODE start_reg, const std::span<const uint8_t>& vals)
{
	if( ! is_valid(start_reg) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	const size_t len = std::min(vals.size(), MAX_AI_LEN);

	std::array<uint8_t, 1U + MAX_AI_LEN> frame {};
	frame[0] = get_cmd(start_reg, true);
	std::copy_n(vals.begin(), len, frame.begin() + 1);

	const std::span<const uint8_t> payload(frame.data(), len + 1U);

	SPDLOG_TRACE("TCA6424 0x{:02X} wr {:02X}", m_dev_addr, fmt::join(payload, " "));

	std::unique_lock<I2C_transport> lock(m_bus);
	return m_bus.write(m_dev_addr, payload);
}
std::error_code TCA6424::read_registers_ai(const CMD_CODE start_reg, const std::span<uint8_t>& out_vals)
{
	if( ! is_valid(start_reg) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	const std::array<uint8_t, 1> cmd = {get_cmd(start_reg, true)};

	std::unique_lock<I2C_transport> lock(m_bus);
	std::error_code ec = m_bus.write_read(m_dev_addr, cmd, out_vals);
	if(ec)
	{
		return ec;
	}

	SPDLOG_TRACE("TCA6424 0x{:02X} rd {:02X}: {:02X}", m_dev_addr, cmd[0], fmt::join(out_vals, " "));

	return std::error_code();
}

std::error_code TCA6424::set_pin_bit(const REG_KIND kind, const PIN pin, const bool value)
{
	if( ! is_valid(pin) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	const CMD_CODE reg = get_reg(kind, get_port(pin));

	// hold the bus over both halves so no one in this process lands in between
	std::unique_lock<I2C_transport> lock(m_bus);

	uint8_t val = 0;
	std::error_code ec = read_register(reg, &val);
	if(ec)
	{
		return ec;
	}

	if(value)
	{
		val |= get_bit_mask(pin);
	}
	else
	{
		val &= ~get_bit_mask(pin);
	}

	return write_register(reg, val);
}
std::error_code TCA6424::get_pin_bit(const REG_KIND kind, const PIN pin, bool* const out_value)
{
	if( ! is_valid(pin) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	uint8_t val = 0;
	std::error_code ec = read_register(get_reg(kind, get_port(pin)), &val);
	if(ec)
	{
		return ec;
	}

	if(out_value)
	{
		*out_value = (val & get_bit_mask(pin)) != 0;
	}

	return std::error_code();
}

std::error_code TCA6424::set_port_reg(const REG_KIND kind, const PORT port, const uint8_t reg)
{
	if( ! is_valid(port) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	return write_register(get_reg(kind, port), reg);
}
std::error_code TCA6424::get_port_reg(const REG_KIND kind, const PORT port, uint8_t* const out_reg)
{
	if( ! is_valid(port) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	return read_register(get_reg(kind, port), out_reg);
}

std::error_code TCA6424::set_ports_reg_ai(const REG_KIND kind, const PORT start_port, const std::span<const uint8_t>& regs)
{
	if( ! is_valid(start_port) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	return write_registers_ai(get_reg(kind, start_port), regs);
}
std::error_code TCA6424::get_ports_reg_ai(const REG_KIND kind, const PORT start_port, const std::span<uint8_t>& out_regs)
{
	if( ! is_valid(start_port) )
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	return read_registers_ai(get_reg(kind, start_port), out_regs);
}

std::error_code TCA6424::set_pin_direction(const PIN pin, const PIN_DIRECTION dir)
{
	return set_pin_bit(REG_KIND::CONFIG, pin, dir == PIN_DIRECTION::INPUT);
}
std::error_code TCA6424::get_pin_direction(const PIN pin, PIN_DIRECTION* const out_dir)
{
	bool is_input = false;
	std::error_code ec = get_pin_bit(REG_KIND::CONFIG, pin, &is_input);
	if(ec)
	{
		return ec;
	}

	if(out_dir)
	{
		*out_dir = is_input ? PIN_DIRECTION::INPUT : PIN_DIRECTION::OUTPUT;
	}

	return std::error_code();
}
std::error_code TCA6424::set_port_direction(const PORT port, const uint8_t reg)
{
	return set_port_reg(REG_KIND::CONFIG, port, reg);
}
std::error_code TCA6424::get_port_direction(const PORT port, uint8_t* const out_reg)
{
	return get_port_reg(REG_KIND::CONFIG, port, out_reg);
}
std::error_code TCA6424::set_ports_direction_ai(const PORT start_port, const std::span<const uint8_t>& regs)
{
	return set_ports_reg_ai(REG_KIND::CONFIG, start_port, regs);
}
std::error_code TCA6424::get_ports_direction_ai(const PORT start_port, const std::span<uint8_t>& out_regs)
{
	return get_ports_reg_ai(REG_KIND::CONFIG, start_port, out_regs);
}

std::error_code TCA6424::set_pin_output(const PIN pin, const PIN_STATE state)
{
	return set_pin_bit(REG_KIND::OUTPUT, pin, state == PIN_STATE::HIGH);
}
std::error_code TCA6424::get_pin_output_state(const PIN pin, PIN_STATE* const out_state)
{
	bool is_high = false;
	std::error_code ec = get_pin_bit(REG_KIND::OUTPUT, pin, &is_high);
	if(ec)
	{
		return ec;
	}

	if(out_state)
	{
		*out_state = is_high ? PIN_STATE::HIGH : PIN_STATE::LOW;
	}

	return std::error_code();
}
std::error_code TCA6424::set_port_output(const PORT port, const uint8_t reg)
{
	return set_port_reg(REG_KIND::OUTPUT, port, reg);
}
std::error_code TCA6424::get_port_output_state(const PORT port, uint8_t* const out_reg)
{
	return get_port_reg(REG_KIND::OUTPUT, port, out_reg);
}
std::error_code TCA6424::set_ports_output_ai(const PORT start_port, const std::span<const uint8_t>& regs)
{
	return set_ports_reg_ai(REG_KIND::OUTPUT, start_port, regs);
}
std::error_code TCA6424::get_ports_output_state_ai(const PORT start_port, const std::span<uint8_t>& out_regs)
{
	return get_ports_reg_ai(REG_KIND::OUTPUT, start_port, out_regs);
}

std::error_code TCA6424::get_pin_input_state(const PIN pin, PIN_STATE* const out_state)
{
	bool is_high = false;
	std::error_code ec = get_pin_bit(REG_KIND::INPUT, pin, &is_high);
	if(ec)
	{
		return ec;
	}

	if(out_state)
	{
		*out_state = is_high ? PIN_STATE::HIGH : PIN_STATE::LOW;
	}

	return std::error_code();
}
std::error_code TCA6424::get_port_input_state(const PORT port, uint8_t* const out_reg)
{
	return get_port_reg(REG_KIND::INPUT, port, out_reg);
}
std::error_code TCA6424::get_ports_input_state_ai(const PORT start_port, const std::span<uint8_t>& out_regs)
{
	return get_ports_reg_ai(REG_KIND::INPUT, start_port, out_regs);
}

std::error_code TCA6424::set_pin_polarity_inversion(const PIN pin, const bool invert)
{
	return set_pin_bit(REG_KIND::POLARITY_INV, pin, invert);
}
std::error_code TCA6424::get_pin_polarity_inversion(const PIN pin, bool* const out_invert)
{
	return get_pin_bit(REG_KIND::POLARITY_INV, pin, out_invert);
}
std::error_code TCA6424::set_port_polarity_inversion(const PORT port, const uint8_t reg)
{
	return set_port_reg(REG_KIND::POLARITY_INV, port, reg);
}
std::error_code TCA6424::get_port_polarity_inversion(const PORT port, uint8_t* const out_reg)
{
	return get_port_reg(REG_KIND::POLARITY_INV, port, out_reg);
}
std::error_code TCA6424::set_ports_polarity_inversion_ai(const PORT start_port, const std::span<const uint8_t>& regs)
{
	return set_ports_reg_ai(REG_KIND::POLARITY_INV, start_port, regs);
}
std::error_code TCA6424::get_ports_polarity_inversion_ai(const PORT start_port, const std::span<uint8_t>& out_regs)
{
	return get_ports_reg_ai(REG_KIND::POLARITY_INV, start_port, out_regs);
}

std::error_code TCA6424::set_pin_interrupt_mask(const PIN pin, const bool mask)
{
	return set_pin_bit(REG_KIND::INT_MASK, pin, mask);
}
std::error_code TCA6424::get_pin_interrupt_mask(const PIN pin, bool* const out_mask)
{
	return get_pin_bit(REG_KIND::INT_MASK, pin, out_mask);
}
std::error_code TCA6424::set_port_interrupt_mask(const PORT port, const uint8_t reg)
{
	return set_port_reg(REG_KIND::INT_MASK, port, reg);
}
std::error_code TCA6424::get_port_interrupt_mask(const PORT port, uint8_t* const out_reg)
{
	return get_port_reg(REG_KIND::INT_MASK, port, out_reg);
}
std::error_code TCA6424::set_ports_interrupt_mask_ai(const PORT start_port, const std::span<const uint8_t>& regs)
{
	return set_ports_reg_ai(REG_KIND::INT_MASK, start_port, regs);
}
std::error_code TCA6424::get_ports_interrupt_mask_ai(const PORT start_port, const std::span<uint8_t>& out_regs)
{
	return get_ports_reg_ai(REG_KIND::INT_MASK, start_port, out_regs);
}

std::error_code TCA6424::set_initial_output_state(const uint8_t port0, const uint8_t port1, const uint8_t port2)
{
	const std::array<uint8_t, 3> regs = {port0, port1, port2};
	return write_registers_ai(CMD_CODE::OUT0, regs);
}

std::error_code TCA6424::set_line(const unsigned int idx, const int value)
{
	if(idx >= get_num_lines())
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	return set_pin_output(PIN(idx), value ? PIN_STATE::HIGH : PIN_STATE::LOW);
}
std::error_code TCA6424::get_line(const unsigned int idx, int* const out_value)
{
	if(idx >= get_num_lines())
	{
		return make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN);
	}

	PIN_STATE state = PIN_STATE::LOW;
	std::error_code ec = get_pin_input_state(PIN(idx), &state);
	if(ec)
	{
		return ec;
	}

	if(out_value)
	{
		*out_value = (state == PIN_STATE::HIGH) ? (1) : (0);
	}

	return std::error_code();
}

std::error_code TCA6424::set_all_lines(const uint64_t value)
{
	const std::array<uint8_t, NUM_PORTS> regs =
	{
		uint8_t((value >>  0) & 0xFFU),
		uint8_t((value >>  8) & 0xFFU),
		uint8_t((value >> 16) & 0xFFU)
	};

	return set_ports_output_ai(PORT::PORT0, regs);
}
std::error_code TCA6424::get_all_lines(uint64_t* const out_value)
{
	std::array<uint8_t, NUM_PORTS> regs {};
	std::error_code ec = get_ports_input_state_ai(PORT::PORT0, regs);
	if(ec)
	{
		return ec;
	}

	if(out_value)
	{
		*out_value = (uint64_t(regs[2]) << 16) | (uint64_t(regs[1]) << 8) | (uint64_t(regs[0]) << 0);
	}

	return std::error_code();
}
