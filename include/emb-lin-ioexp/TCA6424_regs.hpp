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

#include <array>

#include <cstddef>
#include <cstdint>

// TCA6424 register map
// Each register kind has one register per port at consecutive addresses, so an
// auto increment transfer started at port n of a kind walks ports n..2 of that kind
class TCA6424_regs
{
public:

	static constexpr size_t NUM_PORTS = 3U;
	static constexpr size_t NUM_PINS  = 24U;
	static constexpr size_t NUM_KINDS = 5U;

	// command byte, bit 7 is auto increment, bits 0-6 are the register address
	static constexpr uint8_t CMD_AI        = 0x80U;
	static constexpr uint8_t CMD_ADDR_MASK = 0x7FU;

	enum class CMD_CODE : uint8_t
	{
		IN0           = 0x00U,
		IN1           = 0x01U,
		IN2           = 0x02U,
		OUT0          = 0x04U,
		OUT1          = 0x05U,
		OUT2          = 0x06U,
		POL_INV0      = 0x08U,
		POL_INV1      = 0x09U,
		POL_INV2      = 0x0AU,
		CONF0         = 0x0CU,
		CONF1         = 0x0DU,
		CONF2         = 0x0EU,
		INT_MASK0     = 0x10U,
		INT_MASK1     = 0x11U,
		INT_MASK2     = 0x12U
	};

	enum class REG_KIND : uint8_t
	{
		INPUT        = 0,
		OUTPUT       = 1,
		POLARITY_INV = 2,
		CONFIG       = 3,
		INT_MASK     = 4
	};

	enum class PORT : uint8_t
	{
		PORT0 = 0,
		PORT1 = 1,
		PORT2 = 2
	};

	// Pxy is port x, bit y
	enum class PIN : uint8_t
	{
		P00 = 0,  P01 = 1,  P02 = 2,  P03 = 3,  P04 = 4,  P05 = 5,  P06 = 6,  P07 = 7,
		P10 = 8,  P11 = 9,  P12 = 10, P13 = 11, P14 = 12, P15 = 13, P16 = 14, P17 = 15,
		P20 = 16, P21 = 17, P22 = 18, P23 = 19, P24 = 20, P25 = 21, P26 = 22, P27 = 23
	};

	// CONFIG bit, 1 is input
	enum class PIN_DIRECTION : uint8_t
	{
		OUTPUT = 0,
		INPUT  = 1
	};

	// OUTPUT and INPUT bit, 1 is high
	enum class PIN_STATE : uint8_t
	{
		LOW  = 0,
		HIGH = 1
	};

	// [kind][port] -> register
	static constexpr std::array<std::array<CMD_CODE, NUM_PORTS>, NUM_KINDS> REG_MAP
	{{
		{CMD_CODE::IN0,       CMD_CODE::IN1,       CMD_CODE::IN2},
		{CMD_CODE::OUT0,      CMD_CODE::OUT1,      CMD_CODE::OUT2},
		{CMD_CODE::POL_INV0,  CMD_CODE::POL_INV1,  CMD_CODE::POL_INV2},
		{CMD_CODE::CONF0,     CMD_CODE::CONF1,     CMD_CODE::CONF2},
		{CMD_CODE::INT_MASK0, CMD_CODE::INT_MASK1, CMD_CODE::INT_MASK2}
	}};

	static constexpr bool is_valid(const REG_KIND kind)
	{
		return size_t(kind) < NUM_KINDS;
	}
	static constexpr bool is_valid(const PORT port)
	{
		return size_t(port) < NUM_PORTS;
	}
	static constexpr bool is_valid(const PIN pin)
	{
		return size_t(pin) < NUM_PINS;
	}
	static constexpr bool is_valid(const CMD_CODE reg)
	{
		for(const auto& kind_regs : REG_MAP)
		{
			for(const CMD_CODE r : kind_regs)
			{
				if(r == reg)
				{
					return true;
				}
			}
		}
		return false;
	}

	// kind and port must be valid
	static constexpr CMD_CODE get_reg(const REG_KIND kind, const PORT port)
	{
		return REG_MAP[size_t(kind)][size_t(port)];
	}

	static constexpr uint8_t get_port_index(const PIN pin)
	{
		return uint8_t(pin) / 8U;
	}
	static constexpr uint8_t get_bit_index(const PIN pin)
	{
		return uint8_t(pin) % 8U;
	}
	static constexpr uint8_t get_bit_mask(const PIN pin)
	{
		return uint8_t(1U << get_bit_index(pin));
	}
	static constexpr PORT get_port(const PIN pin)
	{
		return PORT(get_port_index(pin));
	}
	static constexpr PIN make_pin(const PORT port, const uint8_t bit)
	{
		return PIN(uint8_t(port) * 8U + (bit & 0x07U));
	}

	static constexpr uint8_t get_cmd(const CMD_CODE reg, const bool auto_inc)
	{
		return (uint8_t(reg) & CMD_ADDR_MASK) | (auto_inc ? CMD_AI : 0x00U);
	}
};
