/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-ioexp/TCA6424_async.hpp"

#include <spdlog/spdlog.h>

#include <exception>

TCA6424_async::TCA6424_async(TCA6424& dev) : m_dev(dev)
{
	m_keep_running = true;
	m_thread = std::thread(&TCA6424_async::work, this);
}
TCA6424_async::~TCA6424_async()
{
	const size_t num_dropped = cancel_pending();
	if(num_dropped != 0)
	{
		SPDLOG_DEBUG("TCA6424_async dropped {:d} pending operations", num_dropped);
	}

	{
		std::unique_lock<std::mutex> lock(m_mutex);
		m_keep_running = false;
	}
	m_cv.notify_all();

	if(m_thread.joinable())
	{
		m_thread.join();
	}
}

std::future<std::error_code> TCA6424_async::post(Operation op)
{
	Job job;
	job.op = std::move(op);
	std::future<std::error_code> fut = job.result.get_future();

	{
		std::unique_lock<std::mutex> lock(m_mutex);
		if( ! m_keep_running )
		{
			job.result.set_value(std::make_error_code(std::errc::operation_canceled));
			return fut;
		}
		m_jobs.push_back(std::move(job));
	}
	m_cv.notify_one();

	return fut;
}

size_t TCA6424_async::cancel_pending()
{
	std::deque<Job> dropped;
	{
		std::unique_lock<std::mutex> lock(m_mutex);
		dropped.swap(m_jobs);
	}

	for(Job& job : dropped)
	{
		job.result.set_value(std::make_error_code(std::errc::operation_canceled));
	}

	return dropped.size();
}

size_t TCA6424_async::get_num_pending()
{
	std::unique_lock<std::mutex> lock(m_mutex);
	return m_jobs.size();
}

std::future<std::error_code> TCA6424_async::set_pin_direction(const PIN pin, const PIN_DIRECTION dir)
{
	return post([pin, dir](TCA6424& dev){ return dev.set_pin_direction(pin, dir); });
}
std::future<std::error_code> TCA6424_async::set_pin_output(const PIN pin, const PIN_STATE state)
{
	return post([pin, state](TCA6424& dev){ return dev.set_pin_output(pin, state); });
}
std::future<std::error_code> TCA6424_async::set_port_direction(const PORT port, const uint8_t reg)
{
	return post([port, reg](TCA6424& dev){ return dev.set_port_direction(port, reg); });
}
std::future<std::error_code> TCA6424_async::set_port_output(const PORT port, const uint8_t reg)
{
	return post([port, reg](TCA6424& dev){ return dev.set_port_output(port, reg); });
}
std::future<std::error_code> TCA6424_async::set_ports_output_ai(const PORT start_port, const std::vector<uint8_t>& regs)
{
	return post([start_port, regs](TCA6424& dev){ return dev.set_ports_output_ai(start_port, regs); });
}
std::future<std::error_code> TCA6424_async::set_pin_polarity_inversion(const PIN pin, const bool invert)
{
	return post([pin, invert](TCA6424& dev){ return dev.set_pin_polarity_inversion(pin, invert); });
}
std::future<std::error_code> TCA6424_async::set_port_polarity_inversion(const PORT port, const uint8_t reg)
{
	return post([port, reg](TCA6424& dev){ return dev.set_port_polarity_inversion(port, reg); });
}
std::future<std::error_code> TCA6424_async::set_pin_interrupt_mask(const PIN pin, const bool mask)
{
	return post([pin, mask](TCA6424& dev){ return dev.set_pin_interrupt_mask(pin, mask); });
}
std::future<std::error_code> TCA6424_async::set_port_interrupt_mask(const PORT port, const uint8_t reg)
{
	return post([port, reg](TCA6424& dev){ return dev.set_port_interrupt_mask(port, reg); });
}
std::future<std::error_code> TCA6424_async::set_initial_output_state(const uint8_t port0, const uint8_t port1, const uint8_t port2)
{
	return post([port0, port1, port2](TCA6424& dev){ return dev.set_initial_output_state(port0, port1, port2); });
}

void TCA6424_async::work()
{
	for(;;)
	{
		Job job;
		{
			std::unique_lock<std::mutex> lock(m_mutex);
			m_cv.wait(lock, [this](){ return ( ! m_keep_running ) || ( ! m_jobs.empty() ); });

			if(m_jobs.empty())
			{
				// only reached once stopped
				break;
			}

			job = std::move(m_jobs.front());
			m_jobs.pop_front();
		}

		try
		{
			job.result.set_value(job.op(m_dev));
		}
		catch(const std::exception& e)
		{
			SPDLOG_ERROR("TCA6424_async operation threw: {:s}", e.what());
			job.result.set_exception(std::current_exception());
		}
		catch(...)
		{
			SPDLOG_ERROR("TCA6424_async operation threw a non std::exception");
			job.result.set_exception(std::current_exception());
		}
	}
}
