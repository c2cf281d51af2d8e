/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#pragma once

#include "emb-lin-ioexp/I2C_transport.hpp"

#include <boost/core/noncopyable.hpp>

#include <cstdint>

// A device at a fixed address on a borrowed bus
// The bus must outlive the device
class I2C_dev_base : private boost::noncopyable
{
public:
	I2C_dev_base(I2C_transport& bus, const uint8_t id);
	virtual ~I2C_dev_base();

	I2C_transport& get_bus()
	{
		return m_bus;
	}

	uint8_t get_dev_addr() const
	{
		return m_dev_addr;
	}

protected:

	I2C_transport& m_bus;
	uint8_t m_dev_addr;
};
