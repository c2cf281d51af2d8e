/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "tca6424_walkthrough.hpp"

#include <spdlog/spdlog.h>
#include <fmt/ranges.h>

#include <array>

bool run_walkthrough(TCA6424& tca)
{
	// keep going on error so every step is reported
	bool failed = false;
	std::error_code ec;

	// P00-P03 output, P04-P07 input
	const uint8_t port0_dir = 0xF0U;
	ec = tca.set_port_direction(TCA6424::PORT::PORT0, port0_dir);
	if(ec)
	{
		SPDLOG_ERROR("Failed to set Port0 direction: {:s}", ec.message());
		failed = true;
	}
	else
	{
		SPDLOG_INFO("Port0 direction set to {:08b}", port0_dir);
	}

	const uint8_t port1_out = 0x55U;
	ec = tca.set_port_output(TCA6424::PORT::PORT1, port1_out);
	if(ec)
	{
		SPDLOG_ERROR("Failed to set Port1 output: {:s}", ec.message());
		failed = true;
	}
	else
	{
		SPDLOG_INFO("Port1 output set to {:08b}", port1_out);
	}

	uint8_t port2_in = 0;
	ec = tca.get_port_input_state(TCA6424::PORT::PORT2, &port2_in);
	if(ec)
	{
		SPDLOG_ERROR("Failed to read Port2 input: {:s}", ec.message());
		failed = true;
	}
	else
	{
		SPDLOG_INFO("Port2 input {:08b}", port2_in);
	}

	const uint8_t port0_pol = 0xAAU;
	ec = tca.set_port_polarity_inversion(TCA6424::PORT::PORT0, port0_pol);
	if(ec)
	{
		SPDLOG_ERROR("Failed to set Port0 polarity inversion: {:s}", ec.message());
		failed = true;
	}
	else
	{
		SPDLOG_INFO("Port0 polarity inversion set to {:08b}", port0_pol);
	}

	const std::array<uint8_t, 3> all_dir = {0xF0U, 0x0FU, 0xAAU};
	ec = tca.set_ports_direction_ai(TCA6424::PORT::PORT0, all_dir);
	if(ec)
	{
		SPDLOG_ERROR("Failed to set Port0-Port2 direction (AI): {:s}", ec.message());
		failed = true;
	}
	else
	{
		SPDLOG_INFO("Port0-Port2 direction set (AI)");
	}

	std::array<uint8_t, 3> all_in {};
	ec = tca.get_ports_input_state_ai(TCA6424::PORT::PORT0, all_in);
	if(ec)
	{
		SPDLOG_ERROR("Failed to read Port0-Port2 input (AI): {:s}", ec.message());
		failed = true;
	}
	else
	{
		SPDLOG_INFO("Port0-Port2 input (AI): {:08b}", fmt::join(all_in, " "));
	}

	ec = tca.set_pin_direction(TCA6424::PIN::P00, TCA6424::PIN_DIRECTION::OUTPUT);
	if(ec)
	{
		SPDLOG_ERROR("Failed to set P00 direction: {:s}", ec.message());
		failed = true;
	}

	ec = tca.set_pin_output(TCA6424::PIN::P00, TCA6424::PIN_STATE::HIGH);
	if(ec)
	{
		SPDLOG_ERROR("Failed to set P00 high: {:s}", ec.message());
		failed = true;
	}

	TCA6424::PIN_STATE p04 = TCA6424::PIN_STATE::LOW;
	ec = tca.get_pin_input_state(TCA6424::PIN::P04, &p04);
	if(ec)
	{
		SPDLOG_ERROR("Failed to read P04: {:s}", ec.message());
		failed = true;
	}
	else
	{
		SPDLOG_INFO("P04 is {:s}", (p04 == TCA6424::PIN_STATE::HIGH) ? "high" : "low");
	}

	return ! failed;
}
