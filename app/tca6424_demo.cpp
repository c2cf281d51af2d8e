/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#include "emb-lin-ioexp/I2C_bus_base.hpp"
#include "emb-lin-ioexp/TCA6424.hpp"
#include "emb-lin-ioexp/TCA6424_config.hpp"

#include "tca6424_walkthrough.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>

int main(int argc, char* argv[])
{
	spdlog::set_level(spdlog::level::debug);

	if(argc != 2)
	{
		SPDLOG_ERROR("Usage: {:s} <config.json>", argv[0]);
		return EXIT_FAILURE;
	}

	TCA6424_config config;
	if( ! config.load(argv[1]) )
	{
		return EXIT_FAILURE;
	}

	I2C_bus_base bus(config.bus);
	TCA6424 tca(bus, config.address);

	SPDLOG_INFO("TCA6424 at 0x{:02X} on {:s}", tca.get_dev_addr(), bus.get_path());

	std::error_code ec = config.apply(tca);
	if(ec)
	{
		SPDLOG_ERROR("Failed to apply power-up config: {:s}", ec.message());
		return EXIT_FAILURE;
	}

	if( ! run_walkthrough(tca) )
	{
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
