/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#pragma once

#include "emb-lin-ioexp/TCA6424.hpp"

#include <boost/core/noncopyable.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

// Runs TCA6424 operations on a worker thread, in the order they were posted
//
// Each operation runs to completion once started. cancel_pending() and the dtor only drop
// operations that have not started, their futures get std::errc::operation_canceled.
// Anything an operation writes through a captured pointer must outlive its future.
//
// The named wrappers cover the setters. Reads go through post() with the destination captured:
//
//   uint8_t in = 0;
//   std::future<std::error_code> f = async.post([&in](TCA6424& dev){ return dev.get_port_input_state(TCA6424::PORT::PORT0, &in); });
class TCA6424_async : private boost::noncopyable
{
public:
	typedef TCA6424::PIN PIN;
	typedef TCA6424::PORT PORT;
	typedef TCA6424::PIN_DIRECTION PIN_DIRECTION;
	typedef TCA6424::PIN_STATE PIN_STATE;

	typedef std::function<std::error_code(TCA6424&)> Operation;

	TCA6424_async(TCA6424& dev);
	~TCA6424_async();

	std::future<std::error_code> post(Operation op);

	// returns the number of dropped operations
	size_t cancel_pending();

	size_t get_num_pending();

	std::future<std::error_code> set_pin_direction(const PIN pin, const PIN_DIRECTION dir);
	std::future<std::error_code> set_pin_output(const PIN pin, const PIN_STATE state);
	std::future<std::error_code> set_port_direction(const PORT port, const uint8_t reg);
	std::future<std::error_code> set_port_output(const PORT port, const uint8_t reg);
	std::future<std::error_code> set_ports_output_ai(const PORT start_port, const std::vector<uint8_t>& regs);
	std::future<std::error_code> set_pin_polarity_inversion(const PIN pin, const bool invert);
	std::future<std::error_code> set_port_polarity_inversion(const PORT port, const uint8_t reg);
	std::future<std::error_code> set_pin_interrupt_mask(const PIN pin, const bool mask);
	std::future<std::error_code> set_port_interrupt_mask(const PORT port, const uint8_t reg);
	std::future<std::error_code> set_initial_output_state(const uint8_t port0, const uint8_t port1, const uint8_t port2);

protected:

	struct Job
	{
		Operation op;
		std::promise<std::error_code> result;
	};

	void work();

	TCA6424& m_dev;

	std::mutex m_mutex;
	std::condition_variable m_cv;
	std::deque<Job> m_jobs;
	bool m_keep_running;

	std::thread m_thread;
};
