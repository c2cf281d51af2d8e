/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * This software is distrubuted in the hope it will be useful, but without any warranty, including the implied warrranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See LICENSE.txt for details.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#pragma once

#include "emb-lin-ioexp/I2C_dev_base.hpp"
#include "emb-lin-ioexp/TCA6424_error.hpp"
#include "emb-lin-ioexp/TCA6424_regs.hpp"
#include "emb-lin-ioexp/gpio_base.hpp"

#include <span>
#include <system_error>

#include <cstdint>

// TI TCA6424 24 bit I/O expander
//
// Nothing is cached, every call is a bus transfer against the live registers.
// All calls return an empty error_code on success, see TCA6424_errc for the failure kinds.
//
// set_pin_* is a read-modify-write of the port register, two transfers. The bus lock is held
// across both, but another master on the wire or another process using the same
// device can still change the register between the read and the write and that change is lost.
// A failed read skips the write. A failed write leaves the register in an unknown state.
class TCA6424 : public I2C_dev_base, public gpio_base, public TCA6424_regs
{
public:
	// ADDR low
	static constexpr uint8_t DEFAULT_ADDRESS = 0x22U;
	// ADDR high
	static constexpr uint8_t ALT_ADDRESS     = 0x23U;

	// max registers of one kind, a longer AI write is truncated
	static constexpr size_t MAX_AI_LEN = NUM_PORTS;

	TCA6424(I2C_transport& bus, const uint8_t id = DEFAULT_ADDRESS);
	~TCA6424() override;

	// register access
	std::error_code write_register(const CMD_CODE reg, const uint8_t val);
	std::error_code read_register(const CMD_CODE reg, uint8_t* const out_val);
	// writes min(vals.size(), MAX_AI_LEN) registers starting at start_reg in one transfer
	std::error_code write_registers_ai(const CMD_CODE start_reg, const std::span<const uint8_t>& vals);
	// reads out_vals.size() registers starting at start_reg in one transfer, the length is not checked
	std::error_code read_registers_ai(const CMD_CODE start_reg, const std::span<uint8_t>& out_vals);

	// direction, CONFIG bit 1 is input
	std::error_code set_pin_direction(const PIN pin, const PIN_DIRECTION dir);
	std::error_code get_pin_direction(const PIN pin, PIN_DIRECTION* const out_dir);
	std::error_code set_port_direction(const PORT port, const uint8_t reg);
	std::error_code get_port_direction(const PORT port, uint8_t* const out_reg);
	std::error_code set_ports_direction_ai(const PORT start_port, const std::span<const uint8_t>& regs);
	std::error_code get_ports_direction_ai(const PORT start_port, const std::span<uint8_t>& out_regs);

	// output latch, reads back the latch and not the pin
	std::error_code set_pin_output(const PIN pin, const PIN_STATE state);
	std::error_code get_pin_output_state(const PIN pin, PIN_STATE* const out_state);
	std::error_code set_port_output(const PORT port, const uint8_t reg);
	std::error_code get_port_output_state(const PORT port, uint8_t* const out_reg);
	std::error_code set_ports_output_ai(const PORT start_port, const std::span<const uint8_t>& regs);
	std::error_code get_ports_output_state_ai(const PORT start_port, const std::span<uint8_t>& out_regs);

	// input level, after polarity inversion
	std::error_code get_pin_input_state(const PIN pin, PIN_STATE* const out_state);
	std::error_code get_port_input_state(const PORT port, uint8_t* const out_reg);
	std::error_code get_ports_input_state_ai(const PORT start_port, const std::span<uint8_t>& out_regs);

	// true is inverted
	std::error_code set_pin_polarity_inversion(const PIN pin, const bool invert);
	std::error_code get_pin_polarity_inversion(const PIN pin, bool* const out_invert);
	std::error_code set_port_polarity_inversion(const PORT port, const uint8_t reg);
	std::error_code get_port_polarity_inversion(const PORT port, uint8_t* const out_reg);
	std::error_code set_ports_polarity_inversion_ai(const PORT start_port, const std::span<const uint8_t>& regs);
	std::error_code get_ports_polarity_inversion_ai(const PORT start_port, const std::span<uint8_t>& out_regs);

	// true is masked, the pin does not raise INT
	std::error_code set_pin_interrupt_mask(const PIN pin, const bool mask);
	std::error_code get_pin_interrupt_mask(const PIN pin, bool* const out_mask);
	std::error_code set_port_interrupt_mask(const PORT port, const uint8_t reg);
	std::error_code get_port_interrupt_mask(const PORT port, uint8_t* const out_reg);
	std::error_code set_ports_interrupt_mask_ai(const PORT start_port, const std::span<const uint8_t>& regs);
	std::error_code get_ports_interrupt_mask_ai(const PORT start_port, const std::span<uint8_t>& out_regs);

	// OUT0..OUT2 in one AI transfer, use before switching pins to output
	std::error_code set_initial_output_state(const uint8_t port0, const uint8_t port1, const uint8_t port2);

	// gpio_base
	// set_line drives the output latch, get_line reads the input level
	// all_lines is P00 in bit 0 through P27 in bit 23
	std::error_code set_line(const unsigned int idx, const int value) override;
	std::error_code get_line(const unsigned int idx, int* const out_value) override;

	std::error_code set_all_lines(const uint64_t value) override;
	std::error_code get_all_lines(uint64_t* const out_value) override;

	size_t get_num_lines() const override
	{
		return NUM_PINS;
	}

protected:
	std::error_code set_pin_bit(const REG_KIND kind, const PIN pin, const bool value);
	std::error_code get_pin_bit(const REG_KIND kind, const PIN pin, bool* const out_value);

	std::error_code set_port_reg(const REG_KIND kind, const PORT port, const uint8_t reg);
	std::error_code get_port_reg(const REG_KIND kind, const PORT port, uint8_t* const out_reg);

	std::error_code set_ports_reg_ai(const REG_KIND kind, const PORT start_port, const std::span<const uint8_t>& regs);
	std::error_code get_ports_reg_ai(const REG_KIND kind, const PORT start_port, const std::span<uint8_t>& out_regs);
};
