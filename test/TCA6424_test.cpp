/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-ioexp/TCA6424.hpp"

#include "I2C_transport_mock.hpp"

#include <gtest/gtest.h>

#include <array>
#include <vector>

typedef I2C_transport_mock::Transaction Trx;

namespace
{
	constexpr uint8_t ADDR = TCA6424::DEFAULT_ADDRESS;

	std::error_code bus_fault()
	{
		return std::make_error_code(std::errc::io_error);
	}
}

TEST(TCA6424, ctor_issues_no_transactions)
{
	I2C_transport_mock i2c;
	TCA6424 tca(i2c);

	EXPECT_EQ(tca.get_dev_addr(), 0x22U);
	EXPECT_EQ(tca.get_num_lines(), 24U);
	EXPECT_TRUE(i2c.get_issued().empty());
}

TEST(TCA6424, set_pin_direction_only_touches_target_bit)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x0C}, {0xFF}),
		Trx::write(ADDR, {0x0C, 0xFE}),

		Trx::write_read(ADDR, {0x0D}, {0x00}),
		Trx::write(ADDR, {0x0D, 0x80})
	});
	TCA6424 tca(i2c, ADDR);

	EXPECT_FALSE(tca.set_pin_direction(TCA6424::PIN::P00, TCA6424::PIN_DIRECTION::OUTPUT));
	EXPECT_FALSE(tca.set_pin_direction(TCA6424::PIN::P17, TCA6424::PIN_DIRECTION::INPUT));

	i2c.done();
}

TEST(TCA6424, pin_direction_round_trip_all_pins)
{
	for(uint8_t i = 0; i < TCA6424::NUM_PINS; i++)
	{
		const TCA6424::PIN pin = TCA6424::PIN(i);
		const uint8_t reg      = 0x0CU + i / 8U;
		const uint8_t cleared  = 0xFFU & ~(1U << (i % 8U));

		I2C_transport_mock i2c({
			Trx::write_read(ADDR, {reg}, {0xFF}),
			Trx::write(ADDR, {reg, cleared}),
			Trx::write_read(ADDR, {reg}, {cleared})
		});
		TCA6424 tca(i2c, ADDR);

		EXPECT_FALSE(tca.set_pin_direction(pin, TCA6424::PIN_DIRECTION::OUTPUT));

		TCA6424::PIN_DIRECTION dir = TCA6424::PIN_DIRECTION::INPUT;
		EXPECT_FALSE(tca.get_pin_direction(pin, &dir));
		EXPECT_EQ(dir, TCA6424::PIN_DIRECTION::OUTPUT) << "pin " << int(i);

		i2c.done();
	}
}

TEST(TCA6424, get_pin_direction_bit_sense)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x0E}, {0x08}),
		Trx::write_read(ADDR, {0x0E}, {0xF7})
	});
	TCA6424 tca(i2c, ADDR);

	TCA6424::PIN_DIRECTION dir = TCA6424::PIN_DIRECTION::OUTPUT;
	EXPECT_FALSE(tca.get_pin_direction(TCA6424::PIN::P23, &dir));
	EXPECT_EQ(dir, TCA6424::PIN_DIRECTION::INPUT);

	EXPECT_FALSE(tca.get_pin_direction(TCA6424::PIN::P23, &dir));
	EXPECT_EQ(dir, TCA6424::PIN_DIRECTION::OUTPUT);

	i2c.done();
}

TEST(TCA6424, set_and_get_pin_output)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x04}, {0x00}),
		Trx::write(ADDR, {0x04, 0x01}),

		Trx::write_read(ADDR, {0x06}, {0xFF}),
		Trx::write(ADDR, {0x06, 0x7F}),

		Trx::write_read(ADDR, {0x05}, {0x20}),
		Trx::write_read(ADDR, {0x05}, {0xDF})
	});
	TCA6424 tca(i2c, ADDR);

	EXPECT_FALSE(tca.set_pin_output(TCA6424::PIN::P00, TCA6424::PIN_STATE::HIGH));
	EXPECT_FALSE(tca.set_pin_output(TCA6424::PIN::P27, TCA6424::PIN_STATE::LOW));

	TCA6424::PIN_STATE state = TCA6424::PIN_STATE::LOW;
	EXPECT_FALSE(tca.get_pin_output_state(TCA6424::PIN::P15, &state));
	EXPECT_EQ(state, TCA6424::PIN_STATE::HIGH);
	EXPECT_FALSE(tca.get_pin_output_state(TCA6424::PIN::P15, &state));
	EXPECT_EQ(state, TCA6424::PIN_STATE::LOW);

	i2c.done();
}

TEST(TCA6424, get_pin_input_state)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x00}, {0x02}),
		Trx::write_read(ADDR, {0x02}, {0x7F})
	});
	TCA6424 tca(i2c, ADDR);

	TCA6424::PIN_STATE state = TCA6424::PIN_STATE::LOW;
	EXPECT_FALSE(tca.get_pin_input_state(TCA6424::PIN::P01, &state));
	EXPECT_EQ(state, TCA6424::PIN_STATE::HIGH);

	EXPECT_FALSE(tca.get_pin_input_state(TCA6424::PIN::P27, &state));
	EXPECT_EQ(state, TCA6424::PIN_STATE::LOW);

	i2c.done();
}

TEST(TCA6424, polarity_inversion_round_trip)
{
	const uint8_t prior    = 0x41U;
	const uint8_t expected = prior | 0x08U;

	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x09}, {prior}),
		Trx::write(ADDR, {0x09, expected}),
		Trx::write_read(ADDR, {0x09}, {expected})
	});
	TCA6424 tca(i2c, ADDR);

	EXPECT_FALSE(tca.set_pin_polarity_inversion(TCA6424::PIN::P13, true));

	bool invert = false;
	EXPECT_FALSE(tca.get_pin_polarity_inversion(TCA6424::PIN::P13, &invert));
	EXPECT_TRUE(invert);

	i2c.done();

	// only the target bit differs from the prior value
	ASSERT_EQ(i2c.get_issued().size(), 3U);
	EXPECT_EQ(i2c.get_issued()[1].wr_data[1] ^ prior, 0x08);
}

TEST(TCA6424, interrupt_mask_pin)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x10}, {0xFF}),
		Trx::write(ADDR, {0x10, 0xEF}),

		Trx::write_read(ADDR, {0x12}, {0x00}),
		Trx::write(ADDR, {0x12, 0x40}),

		Trx::write_read(ADDR, {0x11}, {0x01})
	});
	TCA6424 tca(i2c, ADDR);

	// enable P04 interrupt
	EXPECT_FALSE(tca.set_pin_interrupt_mask(TCA6424::PIN::P04, false));
	// mask P26
	EXPECT_FALSE(tca.set_pin_interrupt_mask(TCA6424::PIN::P26, true));

	bool mask = false;
	EXPECT_FALSE(tca.get_pin_interrupt_mask(TCA6424::PIN::P10, &mask));
	EXPECT_TRUE(mask);

	i2c.done();
}

TEST(TCA6424, port_access_per_kind)
{
	I2C_transport_mock i2c({
		Trx::write(ADDR, {0x0C, 0xF0}),
		Trx::write_read(ADDR, {0x0D}, {0x0F}),
		Trx::write(ADDR, {0x05, 0x55}),
		Trx::write_read(ADDR, {0x06}, {0xA5}),
		Trx::write_read(ADDR, {0x02}, {0x3C}),
		Trx::write(ADDR, {0x08, 0xAA}),
		Trx::write_read(ADDR, {0x0A}, {0x81}),
		Trx::write(ADDR, {0x11, 0x7E}),
		Trx::write_read(ADDR, {0x12}, {0xC3})
	});
	TCA6424 tca(i2c, ADDR);

	uint8_t reg = 0;

	EXPECT_FALSE(tca.set_port_direction(TCA6424::PORT::PORT0, 0xF0));
	EXPECT_FALSE(tca.get_port_direction(TCA6424::PORT::PORT1, &reg));
	EXPECT_EQ(reg, 0x0FU);

	EXPECT_FALSE(tca.set_port_output(TCA6424::PORT::PORT1, 0x55));
	EXPECT_FALSE(tca.get_port_output_state(TCA6424::PORT::PORT2, &reg));
	EXPECT_EQ(reg, 0xA5U);

	EXPECT_FALSE(tca.get_port_input_state(TCA6424::PORT::PORT2, &reg));
	EXPECT_EQ(reg, 0x3CU);

	EXPECT_FALSE(tca.set_port_polarity_inversion(TCA6424::PORT::PORT0, 0xAA));
	EXPECT_FALSE(tca.get_port_polarity_inversion(TCA6424::PORT::PORT2, &reg));
	EXPECT_EQ(reg, 0x81U);

	EXPECT_FALSE(tca.set_port_interrupt_mask(TCA6424::PORT::PORT1, 0x7E));
	EXPECT_FALSE(tca.get_port_interrupt_mask(TCA6424::PORT::PORT2, &reg));
	EXPECT_EQ(reg, 0xC3U);

	i2c.done();
}

TEST(TCA6424, set_port_output_is_not_cached)
{
	I2C_transport_mock i2c({
		Trx::write(ADDR, {0x05, 0x55}),
		Trx::write(ADDR, {0x05, 0x55})
	});
	TCA6424 tca(i2c, ADDR);

	EXPECT_FALSE(tca.set_port_output(TCA6424::PORT::PORT1, 0x55));
	EXPECT_FALSE(tca.set_port_output(TCA6424::PORT::PORT1, 0x55));

	i2c.done();
	ASSERT_EQ(i2c.get_issued().size(), 2U);
	EXPECT_EQ(i2c.get_issued()[0].wr_data, i2c.get_issued()[1].wr_data);
}

TEST(TCA6424, set_ports_direction_ai_single_transfer)
{
	I2C_transport_mock i2c({
		Trx::write(ADDR, {0x8C, 0xAA, 0x55, 0xCC})
	});
	TCA6424 tca(i2c, ADDR);

	const std::array<uint8_t, 3> regs = {0xAA, 0x55, 0xCC};
	EXPECT_FALSE(tca.set_ports_direction_ai(TCA6424::PORT::PORT0, regs));

	i2c.done();
	EXPECT_EQ(i2c.get_issued().size(), 1U);
}

TEST(TCA6424, set_ports_output_ai_from_port1)
{
	I2C_transport_mock i2c({
		Trx::write(ADDR, {0x85, 0x12, 0x34})
	});
	TCA6424 tca(i2c, ADDR);

	const std::array<uint8_t, 2> regs = {0x12, 0x34};
	EXPECT_FALSE(tca.set_ports_output_ai(TCA6424::PORT::PORT1, regs));

	i2c.done();
}

TEST(TCA6424, write_registers_ai_truncates_to_three)
{
	I2C_transport_mock i2c({
		Trx::write(ADDR, {0x88, 0x01, 0x02, 0x03}),
		Trx::write(ADDR, {0x90, 0x0A, 0x0B, 0x0C})
	});
	TCA6424 tca(i2c, ADDR);

	const std::vector<uint8_t> regs = {0x01, 0x02, 0x03, 0x04, 0x05};
	EXPECT_FALSE(tca.set_ports_polarity_inversion_ai(TCA6424::PORT::PORT0, regs));

	const std::vector<uint8_t> masks = {0x0A, 0x0B, 0x0C, 0x0D};
	EXPECT_FALSE(tca.set_ports_interrupt_mask_ai(TCA6424::PORT::PORT0, masks));

	i2c.done();
}

TEST(TCA6424, get_ports_input_state_ai_single_transfer)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x80}, {0x11, 0x22, 0x33})
	});
	TCA6424 tca(i2c, ADDR);

	std::array<uint8_t, 3> regs {};
	EXPECT_FALSE(tca.get_ports_input_state_ai(TCA6424::PORT::PORT0, regs));

	EXPECT_EQ(regs[0], 0x11U);
	EXPECT_EQ(regs[1], 0x22U);
	EXPECT_EQ(regs[2], 0x33U);

	i2c.done();
	EXPECT_EQ(i2c.get_issued().size(), 1U);
}

TEST(TCA6424, get_ports_ai_per_kind)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x8D}, {0xF0, 0x0F}),
		Trx::write_read(ADDR, {0x86}, {0x5A}),
		Trx::write_read(ADDR, {0x88}, {0x01, 0x02, 0x03}),
		Trx::write_read(ADDR, {0x91}, {0xFE, 0xFD})
	});
	TCA6424 tca(i2c, ADDR);

	std::array<uint8_t, 2> dir {};
	EXPECT_FALSE(tca.get_ports_direction_ai(TCA6424::PORT::PORT1, dir));
	EXPECT_EQ(dir[0], 0xF0U);
	EXPECT_EQ(dir[1], 0x0FU);

	std::array<uint8_t, 1> out {};
	EXPECT_FALSE(tca.get_ports_output_state_ai(TCA6424::PORT::PORT2, out));
	EXPECT_EQ(out[0], 0x5AU);

	std::array<uint8_t, 3> pol {};
	EXPECT_FALSE(tca.get_ports_polarity_inversion_ai(TCA6424::PORT::PORT0, pol));
	EXPECT_EQ(pol[2], 0x03U);

	std::array<uint8_t, 2> mask {};
	EXPECT_FALSE(tca.get_ports_interrupt_mask_ai(TCA6424::PORT::PORT1, mask));
	EXPECT_EQ(mask[0], 0xFEU);
	EXPECT_EQ(mask[1], 0xFDU);

	i2c.done();
}

TEST(TCA6424, set_initial_output_state_matches_ai_write)
{
	I2C_transport_mock i2c_a({
		Trx::write(ADDR, {0x84, 0x01, 0x80, 0xFF})
	});
	I2C_transport_mock i2c_b({
		Trx::write(ADDR, {0x84, 0x01, 0x80, 0xFF})
	});

	TCA6424 tca_a(i2c_a, ADDR);
	TCA6424 tca_b(i2c_b, ADDR);

	EXPECT_FALSE(tca_a.set_initial_output_state(0x01, 0x80, 0xFF));

	const std::array<uint8_t, 3> regs = {0x01, 0x80, 0xFF};
	EXPECT_FALSE(tca_b.write_registers_ai(TCA6424::CMD_CODE::OUT0, regs));

	i2c_a.done();
	i2c_b.done();

	ASSERT_EQ(i2c_a.get_issued().size(), 1U);
	ASSERT_EQ(i2c_b.get_issued().size(), 1U);
	EXPECT_EQ(i2c_a.get_issued()[0].wr_data, i2c_b.get_issued()[0].wr_data);
}

TEST(TCA6424, register_primitives)
{
	I2C_transport_mock i2c({
		Trx::write(ADDR, {0x0E, 0x3C}),
		Trx::write_read(ADDR, {0x01}, {0x9A}),
		Trx::write_read(ADDR, {0x84}, {0x01, 0x02})
	});
	TCA6424 tca(i2c, ADDR);

	EXPECT_FALSE(tca.write_register(TCA6424::CMD_CODE::CONF2, 0x3C));

	uint8_t val = 0;
	EXPECT_FALSE(tca.read_register(TCA6424::CMD_CODE::IN1, &val));
	EXPECT_EQ(val, 0x9AU);

	std::array<uint8_t, 2> vals {};
	EXPECT_FALSE(tca.read_registers_ai(TCA6424::CMD_CODE::OUT0, vals));
	EXPECT_EQ(vals[1], 0x02U);

	i2c.done();
}

TEST(TCA6424, alternate_address)
{
	I2C_transport_mock i2c({
		Trx::write(TCA6424::ALT_ADDRESS, {0x04, 0x00})
	});
	TCA6424 tca(i2c, TCA6424::ALT_ADDRESS);

	EXPECT_FALSE(tca.set_port_output(TCA6424::PORT::PORT0, 0x00));

	i2c.done();
}

TEST(TCA6424, transport_error_propagates_unchanged)
{
	I2C_transport_mock i2c({
		Trx::write(ADDR, {0x05, 0x55}, bus_fault())
	});
	TCA6424 tca(i2c, ADDR);

	std::error_code ec = tca.set_port_output(TCA6424::PORT::PORT1, 0x55);
	EXPECT_EQ(ec, bus_fault());
	EXPECT_TRUE(ec.category() == std::generic_category());
	EXPECT_TRUE(ec == TCA6424_errc::TRANSPORT);
	EXPECT_FALSE(ec == TCA6424_errc::INVALID_REGISTER_OR_PIN);

	i2c.done();
	EXPECT_EQ(i2c.get_issued().size(), 1U);
}

TEST(TCA6424, rmw_read_failure_skips_write)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x0C}, {0x00}, bus_fault())
	});
	TCA6424 tca(i2c, ADDR);

	std::error_code ec = tca.set_pin_direction(TCA6424::PIN::P03, TCA6424::PIN_DIRECTION::INPUT);
	EXPECT_EQ(ec, bus_fault());

	i2c.done();
	EXPECT_EQ(i2c.get_issued().size(), 1U);
}

TEST(TCA6424, rmw_write_failure_is_reported)
{
	const std::error_code nak = std::make_error_code(std::errc::no_such_device_or_address);

	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x04}, {0x00}),
		Trx::write(ADDR, {0x04, 0x04}, nak)
	});
	TCA6424 tca(i2c, ADDR);

	std::error_code ec = tca.set_pin_output(TCA6424::PIN::P02, TCA6424::PIN_STATE::HIGH);
	EXPECT_EQ(ec, nak);
	EXPECT_TRUE(ec == TCA6424_errc::TRANSPORT);

	i2c.done();
}

TEST(TCA6424, read_failure_leaves_output_untouched)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x80}, {0x00, 0x00, 0x00}, bus_fault()),
		Trx::write_read(ADDR, {0x0C}, {0x00}, bus_fault())
	});
	TCA6424 tca(i2c, ADDR);

	std::array<uint8_t, 3> regs = {0xAB, 0xAB, 0xAB};
	EXPECT_EQ(tca.get_ports_input_state_ai(TCA6424::PORT::PORT0, regs), bus_fault());
	EXPECT_EQ(regs, (std::array<uint8_t, 3>{0xAB, 0xAB, 0xAB}));

	TCA6424::PIN_DIRECTION dir = TCA6424::PIN_DIRECTION::INPUT;
	EXPECT_EQ(tca.get_pin_direction(TCA6424::PIN::P00, &dir), bus_fault());
	EXPECT_EQ(dir, TCA6424::PIN_DIRECTION::INPUT);

	i2c.done();
}

TEST(TCA6424, forged_pin_and_port_are_rejected)
{
	I2C_transport_mock i2c;
	TCA6424 tca(i2c, ADDR);

	std::error_code ec = tca.set_pin_direction(TCA6424::PIN(24), TCA6424::PIN_DIRECTION::OUTPUT);
	EXPECT_EQ(ec, make_error_code(TCA6424_errc::INVALID_REGISTER_OR_PIN));
	EXPECT_TRUE(ec == TCA6424_errc::INVALID_REGISTER_OR_PIN);
	EXPECT_FALSE(ec == TCA6424_errc::TRANSPORT);

	bool mask = false;
	EXPECT_TRUE(tca.get_pin_interrupt_mask(TCA6424::PIN(0xFF), &mask) == TCA6424_errc::INVALID_REGISTER_OR_PIN);
	EXPECT_TRUE(tca.set_port_output(TCA6424::PORT(3), 0x00) == TCA6424_errc::INVALID_REGISTER_OR_PIN);

	std::array<uint8_t, 3> regs {};
	EXPECT_TRUE(tca.get_ports_input_state_ai(TCA6424::PORT(7), regs) == TCA6424_errc::INVALID_REGISTER_OR_PIN);

	EXPECT_TRUE(tca.write_register(TCA6424::CMD_CODE(0x03), 0x00) == TCA6424_errc::INVALID_REGISTER_OR_PIN);
	EXPECT_TRUE(tca.read_registers_ai(TCA6424::CMD_CODE(0x7F), regs) == TCA6424_errc::INVALID_REGISTER_OR_PIN);

	EXPECT_TRUE(i2c.get_issued().empty());
}

TEST(TCA6424, rmw_holds_bus_lock_over_both_transfers)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x08}, {0x00}),
		Trx::write(ADDR, {0x08, 0x01})
	});
	TCA6424 tca(i2c, ADDR);

	EXPECT_FALSE(tca.set_pin_polarity_inversion(TCA6424::PIN::P00, true));

	i2c.done();
	ASSERT_EQ(i2c.get_issued().size(), 2U);

	// outer lock from the rmw plus the per transfer lock
	EXPECT_EQ(i2c.get_issued()[0].lock_depth, 2);
	EXPECT_EQ(i2c.get_issued()[1].lock_depth, 2);
	EXPECT_EQ(i2c.get_lock_depth(), 0);
}

TEST(TCA6424, gpio_base_lines)
{
	I2C_transport_mock i2c({
		Trx::write_read(ADDR, {0x04}, {0x00}),
		Trx::write(ADDR, {0x04, 0x20}),

		Trx::write_read(ADDR, {0x02}, {0x80}),

		Trx::write(ADDR, {0x84, 0x56, 0x34, 0x12}),

		Trx::write_read(ADDR, {0x80}, {0xEF, 0xCD, 0xAB})
	});
	TCA6424 tca(i2c, ADDR);

	gpio_base& gpio = tca;

	EXPECT_FALSE(gpio.set_line(5, 1));

	int val = 0;
	EXPECT_FALSE(gpio.get_line(23, &val));
	EXPECT_EQ(val, 1);

	EXPECT_FALSE(gpio.set_all_lines(0x123456U));

	uint64_t lines = 0;
	EXPECT_FALSE(gpio.get_all_lines(&lines));
	EXPECT_EQ(lines, 0xABCDEFU);

	EXPECT_TRUE(gpio.set_line(24, 1) == TCA6424_errc::INVALID_REGISTER_OR_PIN);
	EXPECT_TRUE(gpio.get_line(100, &val) == TCA6424_errc::INVALID_REGISTER_OR_PIN);

	i2c.done();
}
