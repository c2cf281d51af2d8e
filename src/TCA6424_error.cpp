/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-ioexp/TCA6424_error.hpp"

#include <string>

namespace
{
	class TCA6424_category : public std::error_category
	{
	public:
		const char* name() const noexcept override
		{
			return "tca6424";
		}

		std::string message(int ev) const override
		{
			switch(TCA6424_errc(ev))
			{
				case TCA6424_errc::TRANSPORT:
				{
					return "bus transport error";
				}
				case TCA6424_errc::INVALID_REGISTER_OR_PIN:
				{
					return "invalid register or pin";
				}
				default:
				{
					return "unknown tca6424 error";
				}
			}
		}

		bool equivalent(const std::error_code& code, int condition) const noexcept override
		{
			switch(TCA6424_errc(condition))
			{
				case TCA6424_errc::TRANSPORT:
				{
					// anything the driver did not issue came from the bus
					return code && (code.category() != *this);
				}
				case TCA6424_errc::INVALID_REGISTER_OR_PIN:
				{
					return (code.category() == *this) && (code.value() == condition);
				}
				default:
				{
					return false;
				}
			}
		}
	};
}

const std::error_category& tca6424_category()
{
	static const TCA6424_category instance;
	return instance;
}

std::error_code make_error_code(const TCA6424_errc e)
{
	return std::error_code(static_cast<int>(e), tca6424_category());
}
std::error_condition make_error_condition(const TCA6424_errc e)
{
	return std::error_condition(static_cast<int>(e), tca6424_category());
}
