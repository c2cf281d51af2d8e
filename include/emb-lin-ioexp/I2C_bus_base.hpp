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

#include "emb-lin-ioexp/I2C_transport.hpp"

#include <boost/core/noncopyable.hpp>

#include <mutex>
#include <string>
#include <system_error>

// i2c-dev adapter, /dev/i2c-N
class I2C_bus_base : public I2C_transport, private boost::noncopyable
{
public:
	I2C_bus_base(const std::string& bus_path);
	~I2C_bus_base() override;

	std::error_code open();
	std::error_code close();

	std::error_code set_device_id(long id);
	std::error_code get_funcs(unsigned long* const out_funcs);

	int get_fd() const
	{
		return m_fd;
	}

	std::recursive_mutex& get_mutex()
	{
		return m_mutex;
	}

	std::string get_path() const
	{
		return m_bus_path;
	}

	// true if the adapter can only do SMBus transfers, valid once opened
	bool is_smbus_only() const
	{
		return m_smbus_only;
	}

	// I2C_transport
	std::error_code write(const uint8_t addr, const std::span<const uint8_t>& data) override;
	std::error_code write_read(const uint8_t addr, const std::span<const uint8_t>& wr_data, const std::span<uint8_t>& rd_data) override;

	void lock() override
	{
		m_mutex.lock();
	}
	void unlock() override
	{
		m_mutex.unlock();
	}

protected:

	std::error_code rdwr_write(const uint8_t addr, const std::span<const uint8_t>& data);
	std::error_code rdwr_write_read(const uint8_t addr, const std::span<const uint8_t>& wr_data, const std::span<uint8_t>& rd_data);

	// fallback for adapters without I2C_FUNC_I2C
	// frames are limited to what a command byte plus SMBus I2C block can express
	std::error_code smbus_write(const uint8_t addr, const std::span<const uint8_t>& data);
	std::error_code smbus_write_read(const uint8_t addr, const std::span<const uint8_t>& wr_data, const std::span<uint8_t>& rd_data);

	std::recursive_mutex m_mutex;

	int m_fd;
	bool m_smbus_only;
	std::string m_bus_path;
};

// Opens the bus for the lifetime of the object and holds the bus lock
class I2C_bus_open_close
{
public:
	I2C_bus_open_close(I2C_bus_base& bus);
	virtual ~I2C_bus_open_close();

	// result of the open, check before using the fd
	const std::error_code& get_error() const
	{
		return m_ec;
	}

protected:
	I2C_bus_base& m_bus;
	std::unique_lock<std::recursive_mutex> m_lock;
	std::error_code m_ec;
};
