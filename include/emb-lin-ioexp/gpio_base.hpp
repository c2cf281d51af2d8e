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

#include <system_error>

#include <cstddef>
#include <cstdint>

// Line oriented view of a gpio controller
// line n is bit n of the all_lines image
class gpio_base
{
public:
	gpio_base()
	{

	}
	virtual ~gpio_base()
	{

	}

	virtual std::error_code set_line(const unsigned int idx, const int value) = 0;
	virtual std::error_code get_line(const unsigned int idx, int* const out_value) = 0;

	virtual std::error_code set_all_lines(const uint64_t value) = 0;
	virtual std::error_code get_all_lines(uint64_t* const out_value) = 0;

	virtual size_t get_num_lines() const = 0;

protected:

};
