/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-ioexp/I2C_bus_base.hpp"

#include <spdlog/spdlog.h>

#include <linux/i2c.h>
#include <linux/i2c-dev.h>
extern "C"
{
	#include <i2c/smbus.h>
}

#include <sys/ioctl.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#include <array>

#include <cerrno>

namespace
{
	std::error_code errno_to_ec(const int err)
	{
		return std::error_code(err, std::system_category());
	}
}

I2C_bus_base::I2C_bus_base(const std::string& bus_path)
{
	m_fd         = -1;
	m_smbus_only = false;
	m_bus_path   = bus_path;
}
I2C_bus_base::~I2C_bus_base()
{
	std::error_code ec = close();
	if(ec)
	{
		SPDLOG_WARN("Error on close bus {:s} in dtor: {:s}", m_bus_path, ec.message());
	}
}

std::error_code I2C_bus_base::open()
{
	if(m_fd >= 0)
	{
		return std::error_code();
	}
	
	int ret = ::open(m_bus_path.c_str(), O_RDWR);
	if(ret < 0)
	{
		const int err = errno;
		SPDLOG_ERROR("Could not open bus {:s}, errno: {:d}", m_bus_path, err);
		return errno_to_ec(err);
	}

	m_fd = ret;

	unsigned long funcs = 0;
	std::error_code ec = get_funcs(&funcs);
	if(ec)
	{
		::close(m_fd);
		m_fd = -1;
		return ec;
	}

	m_smbus_only = (funcs & I2C_FUNC_I2C) == 0;
	if(m_smbus_only)
	{
		SPDLOG_DEBUG("Bus {:s} has no I2C_FUNC_I2C, using SMBus transfers", m_bus_path);
	}

	return std::error_code();
}
std::error_code I2C_bus_base::close()
{
	if(m_fd < 0)
	{
		return std::error_code();
	}

	std::error_code ec;

	int ret = ::close(m_fd);
	if(ret != 0)
	{
		const int err = errno;
		SPDLOG_WARN("Error on close bus {:s}, errno: {:d}", m_bus_path, err);
		ec = errno_to_ec(err);
	}

	m_fd = -1;

	return ec;
}

std::error_code I2C_bus_base::set_device_id(long id)
{
	if(ioctl(m_fd, I2C_SLAVE, id) < 0)
	{
		const int err = errno;
		SPDLOG_ERROR("ioctl I2C_SLAVE failed, errno: {:d}", err);
		return errno_to_ec(err);
	}

	return std::error_code();
}

std::error_code I2C_bus_base::get_funcs(unsigned long* const out_funcs)
{
	if(ioctl(m_fd, I2C_FUNCS, out_funcs) < 0)
	{
		const int err = errno;
		SPDLOG_ERROR("ioctl I2C_FUNCS failed, errno: {:d}", err);
		return errno_to_ec(err);
	}

	return std::error_code();
}

std::error_code I2C_bus_base::write(const uint8_t addr, const std::span<const uint8_t>& data)
{
	I2C_bus_open_close bus_closer(*this);
	if(bus_closer.get_error())
	{
		return bus_closer.get_error();
	}

	if(m_smbus_only)
	{
		return smbus_write(addr, data);
	}

	return rdwr_write(addr, data);
}

std::error_code I2C_bus_base::write_read(const uint8_t addr, const std::span<const uint8_t>& wr_data, const std::span<uint8_t>& rd_data)
{
	I2C_bus_open_close bus_closer(*this);
	if(bus_closer.get_error())
	{
		return bus_closer.get_error();
	}

	if(m_smbus_only)
	{
		return smbus_write_read(addr, wr_data, rd_data);
	}

	return rdwr_write_read(addr, wr_data, rd_data);
}

std::error_code I2C_bus_base::rdwr_write(const uint8_t addr, const std::span<const uint8_t>& data)
{
	// write messages are not modified by the kernel
	std::array<i2c_msg, 1> trx {};
	trx[0].addr  = addr;
	trx[0].flags = 0;
	trx[0].len   = data.size();
	trx[0].buf   = const_cast<uint8_t*>(data.data());

	i2c_rdwr_ioctl_data idat {};
	idat.msgs  = trx.data();
	idat.nmsgs = trx.size();
	if(ioctl(m_fd, I2C_RDWR, &idat) < 0)
	{
		const int err = errno;
		SPDLOG_ERROR("ioctl I2C_RDWR failed, errno: {:d}", err);
		return errno_to_ec(err);
	}

	return std::error_code();
}

std::error_code I2C_bus_base::rdwr_write_read(const uint8_t addr, const std::span<const uint8_t>& wr_data, const std::span<uint8_t>& rd_data)
{
	std::array<i2c_msg, 2> trx {};
	trx[0].addr  = addr;
	trx[0].flags = 0;
	trx[0].len   = wr_data.size();
	trx[0].buf   = const_cast<uint8_t*>(wr_data.data());

	trx[1].addr  = addr;
	trx[1].flags = I2C_M_RD;
	trx[1].len   = rd_data.size();
	trx[1].buf   = rd_data.data();

	i2c_rdwr_ioctl_data idat {};
	idat.msgs  = trx.data();
	idat.nmsgs = trx.size();
	if(ioctl(m_fd, I2C_RDWR, &idat) < 0)
	{
		const int err = errno;
		SPDLOG_ERROR("ioctl I2C_RDWR failed, errno: {:d}", err);
		return errno_to_ec(err);
	}

	return std::error_code();
}

std::error_code I2C_bus_base::smbus_write(const uint8_t addr, const std::span<const uint8_t>& data)
{
	if(data.empty() || (data.size() > (I2C_SMBUS_BLOCK_MAX + 1U)))
	{
		return std::make_error_code(std::errc::invalid_argument);
	}

	std::error_code ec = set_device_id(addr);
	if(ec)
	{
		return ec;
	}

	int32_t ret = 0;
	switch(data.size())
	{
		case 1:
		{
			ret = i2c_smbus_write_byte(m_fd, data[0]);
			break;
		}
		case 2:
		{
			ret = i2c_smbus_write_byte_data(m_fd, data[0], data[1]);
			break;
		}
		default:
		{
			ret = i2c_smbus_write_i2c_block_data(m_fd, data[0], data.size() - 1U, data.data() + 1);
			break;
		}
	}

	if(ret < 0)
	{
		SPDLOG_ERROR("SMBus write failed: {:d}", -ret);
		return errno_to_ec(-ret);
	}

	return std::error_code();
}

std::error_code I2C_bus_base::smbus_write_read(const uint8_t addr, const std::span<const uint8_t>& wr_data, const std::span<uint8_t>& rd_data)
{
	// SMBus can only express a single command byte before the restart
	if((wr_data.size() != 1U) || rd_data.empty() || (rd_data.size() > I2C_SMBUS_BLOCK_MAX))
	{
		return std::make_error_code(std::errc::invalid_argument);
	}

	std::error_code ec = set_device_id(addr);
	if(ec)
	{
		return ec;
	}

	if(rd_data.size() == 1U)
	{
		int32_t ret = i2c_smbus_read_byte_data(m_fd, wr_data[0]);
		if(ret < 0)
		{
			SPDLOG_ERROR("SMBus read failed: {:d}", -ret);
			return errno_to_ec(-ret);
		}

		rd_data[0] = ret & 0xFFU;
		return std::error_code();
	}

	int32_t ret = i2c_smbus_read_i2c_block_data(m_fd, wr_data[0], rd_data.size(), rd_data.data());
	if(ret < 0)
	{
		SPDLOG_ERROR("SMBus block read failed: {:d}", -ret);
		return errno_to_ec(-ret);
	}

	if(size_t(ret) != rd_data.size())
	{
		SPDLOG_ERROR("SMBus block read short, {:d} of {:d}", ret, rd_data.size());
		return std::make_error_code(std::errc::io_error);
	}

	return std::error_code();
}

I2C_bus_open_close::I2C_bus_open_close(I2C_bus_base& bus) : m_bus(bus)
{
	m_lock = std::unique_lock<std::recursive_mutex>(m_bus.get_mutex());

	m_ec = m_bus.open();
}
I2C_bus_open_close::~I2C_bus_open_close()
{
	if(m_ec)
	{
		return;
	}

	std::error_code ec = m_bus.close();
	if(ec)
	{
		SPDLOG_ERROR("Error when closing bus: {:s}", ec.message());
	}
}
