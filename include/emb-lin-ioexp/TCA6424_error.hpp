/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#pragma once

#include <system_error>

// Error kinds reported by the TCA6424 driver
//
// TRANSPORT is a condition only, it matches any code not issued by the driver itself.
// The transport's code is handed back untouched so the caller still sees its category and value:
//
//   std::error_code ec = dev.set_port_output(TCA6424::PORT::PORT1, 0x55);
//   if(ec == TCA6424_errc::TRANSPORT) { ... ec.category() is the bus's own ... }
//
// INVALID_REGISTER_OR_PIN is issued by the driver, as a code in tca6424_category()
enum class TCA6424_errc : int
{
	TRANSPORT               = 1,
	INVALID_REGISTER_OR_PIN = 2
};

const std::error_category& tca6424_category();

std::error_code make_error_code(const TCA6424_errc e);
std::error_condition make_error_condition(const TCA6424_errc e);

namespace std
{
	template <>
	struct is_error_condition_enum<TCA6424_errc> : true_type
	{

	};
}
