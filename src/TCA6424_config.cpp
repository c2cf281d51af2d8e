/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-ioexp/TCA6424_config.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace
{
	void opt_image_to_json(nlohmann::json& j, const char* key, const std::optional<TCA6424_config::Port_image>& img)
	{
		if(img.has_value())
		{
			j[key] = img.value();
		}
		else
		{
			j[key] = nullptr;
		}
	}

	void opt_image_from_json(const nlohmann::json& j, const char* key, std::optional<TCA6424_config::Port_image>& img)
	{
		if(( ! j.contains(key) ) || j.at(key).is_null())
		{
			img.reset();
		}
		else
		{
			const nlohmann::json& arr = j.at(key);
			if(( ! arr.is_array() ) || (arr.size() != TCA6424::NUM_PORTS))
			{
				throw std::invalid_argument(fmt::format("{:s} must hold {:d} register bytes", key, TCA6424::NUM_PORTS));
			}

			TCA6424_config::Port_image temp;
			for(size_t i = 0; i < temp.size(); i++)
			{
				const nlohmann::json& elem = arr.at(i);
				if( ! elem.is_number_integer() )
				{
					throw std::invalid_argument(fmt::format("{:s}[{:d}] is not an integer", key, i));
				}

				// nlohmann stores non-negative literals as unsigned and negative ones as signed
				const bool in_range = elem.is_number_unsigned() ? (elem.get<uint64_t>() <= 0xFFU) : ((elem.get<int64_t>() >= 0) && (elem.get<int64_t>() <= 0xFF));
				if( ! in_range )
				{
					throw std::out_of_range(fmt::format("{:s}[{:d}] = {:s} is not a register byte", key, i, elem.dump()));
				}
				temp[i] = elem.get<uint8_t>();
			}
			img = temp;
		}
	}
}

void to_json(nlohmann::json& j, const TCA6424_config& val)
{
	j = nlohmann::json{
		{"bus",     val.bus},
		{"address", val.address}
	};

	opt_image_to_json(j, "output",         val.output);
	opt_image_to_json(j, "polarity_inv",   val.polarity_inv);
	opt_image_to_json(j, "interrupt_mask", val.interrupt_mask);
	opt_image_to_json(j, "direction",      val.direction);
}
void from_json(const nlohmann::json& j, TCA6424_config& val)
{
	j.at("bus").get_to(val.bus);

	if(j.contains("address"))
	{
		const nlohmann::json& addr = j.at("address");
		if(( ! addr.is_number_unsigned() ) || (addr.get<uint64_t>() > 0x7FU))
		{
			throw std::out_of_range(fmt::format("address {:s} is not 7 bit", addr.dump()));
		}
		val.address = addr.get<uint8_t>();
	}
	else
	{
		val.address = TCA6424::DEFAULT_ADDRESS;
	}

	opt_image_from_json(j, "output",         val.output);
	opt_image_from_json(j, "polarity_inv",   val.polarity_inv);
	opt_image_from_json(j, "interrupt_mask", val.interrupt_mask);
	opt_image_from_json(j, "direction",      val.direction);
}

bool TCA6424_config::load(const std::string& path)
{
	std::ifstream infile(path);
	if( ! infile.is_open() )
	{
		SPDLOG_ERROR("TCA6424_config::load could not open {:s}", path);
		return false;
	}

	std::stringstream ss;
	ss << infile.rdbuf();

	return parse(ss.str());
}

bool TCA6424_config::parse(const std::string& str)
{
	TCA6424_config temp;
	try
	{
		nlohmann::json::parse(str).get_to(temp);
	}
	catch(const std::exception& e)
	{
		SPDLOG_ERROR("TCA6424_config::parse failed: {:s}", e.what());
		return false;
	}

	*this = temp;

	return true;
}

std::error_code TCA6424_config::apply(TCA6424& dev) const
{
	std::error_code ec;

	if(output.has_value())
	{
		ec = dev.set_ports_output_ai(TCA6424::PORT::PORT0, output.value());
		if(ec)
		{
			return ec;
		}
	}

	if(polarity_inv.has_value())
	{
		ec = dev.set_ports_polarity_inversion_ai(TCA6424::PORT::PORT0, polarity_inv.value());
		if(ec)
		{
			return ec;
		}
	}

	if(interrupt_mask.has_value())
	{
		ec = dev.set_ports_interrupt_mask_ai(TCA6424::PORT::PORT0, interrupt_mask.value());
		if(ec)
		{
			return ec;
		}
	}

	if(direction.has_value())
	{
		ec = dev.set_ports_direction_ai(TCA6424::PORT::PORT0, direction.value());
		if(ec)
		{
			return ec;
		}
	}

	return ec;
}
