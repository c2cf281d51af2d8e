/**
 * This file is part of emb-lin-ioexp, a userspace driver for the TCA6424 I/O expander on embedded linux.
 * 
 * @copyright Copyright (c) 2025. All rights reserved.
 * @license Licensed under the LGPL-3.0 license. See LICENSE.txt for details.
 * SPDX-License-Identifier: LGPL-3.0-only
*/

#pragma once

#include "emb-lin-ioexp/TCA6424.hpp"

// Exercises the register groups of a configured expander and logs each result
// Every step runs even if an earlier one failed, returns false if any step failed
bool run_walkthrough(TCA6424& tca);
