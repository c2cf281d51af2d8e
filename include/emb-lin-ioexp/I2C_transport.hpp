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

#include <span>
#include <system_error>

#include <cstdint>

// Byte oriented I2C master
// Errors are reported in the implementation's own category and are not interpreted by drivers
class I2C_transport
{
public:
	I2C_transport()
	{

	}
	virtual ~I2C_transport()
	{

	}

	// single write transfer, START addr+W data... STOP
	virtual std::error_code write(const uint8_t addr, const std::span<const uint8_t>& data) = 0;

	// combined transfer, START addr+W wr_data... RESTART addr+R rd_data... STOP
	virtual std::error_code write_read(const uint8_t addr, const std::span<const uint8_t>& wr_data, const std::span<uint8_t>& rd_data) = 0;

	// BasicLockable, held by a driver across a multi transfer sequence
	// must be recursive
	virtual void lock()   = 0;
	virtual void unlock() = 0;
};
