/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-ioexp/I2C_dev_base.hpp"

#include <spdlog/spdlog.h>

I2C_dev_base::I2C_dev_base(I2C_transport& bus, const uint8_t id) : m_bus(bus)
{
	m_dev_addr = id & 0x7FU;

	if(m_dev_addr != id)
	{
		SPDLOG_WARN("I2C address 0x{:02X} is not 7 bit, using 0x{:02X}", id, m_dev_addr);
	}
}
I2C_dev_base::~I2C_dev_base()
{
	
}
