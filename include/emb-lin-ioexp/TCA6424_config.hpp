/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#pragma once

#include "emb-lin-ioexp/TCA6424.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <system_error>

// Bus location and power-up register images for one expander
//
// {
//   "bus":            "/dev/i2c-1",
//   "address":        34,
//   "output":         [0, 0, 0],
//   "polarity_inv":   [0, 0, 0],
//   "interrupt_mask": [255, 255, 255],
//   "direction":      [255, 255, 255]
// }
//
// The register images are optional, missing ones are not written
class TCA6424_config
{
public:
	typedef std::array<uint8_t, TCA6424::NUM_PORTS> Port_image;

	TCA6424_config()
	{
		address = TCA6424::DEFAULT_ADDRESS;
	}

	std::string bus;
	uint8_t address;

	std::optional<Port_image> output;
	std::optional<Port_image> polarity_inv;
	std::optional<Port_image> interrupt_mask;
	std::optional<Port_image> direction;

	bool load(const std::string& path);
	bool parse(const std::string& str);

	// outputs are latched before any pin is switched to output
	std::error_code apply(TCA6424& dev) const;
};

void to_json(nlohmann::json& j, const TCA6424_config& val);
void from_json(const nlohmann::json& j, TCA6424_config& val);
