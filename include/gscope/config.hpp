// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <filesystem>

// application
#include "gscope/variable.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------
// Walks up from `start` looking for the first `.gscope-config` or `_gscope-config` file and applies
// it to `settings::instance()`. A missing file leaves the defaults in place (environment overrides
// still apply.) Returns the path of the file that was used, or an empty path.
std::filesystem::path process_configuration(const std::filesystem::path& start);

// Parses the TOML file at `path` and applies it to `settings::instance()`. Any key can be
// overridden by an environment variable named `GSCOPE_<KEY>` (e.g., `GSCOPE_LOG_LEVEL`.)
void process_configuration_file(const std::filesystem::path& path);

// The load limits for user-level variable loads, as configured.
load_config default_load_config();

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
