// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstddef>

// application
#include "gscope/features.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------

struct settings {
    enum class log_level {
        silent, // emit nothing
        warning, // emit issues that need attention
        info, // emit brief, informative status
        verbose, // emit as much as possible
    };

    static settings& instance();

    log_level _log_level{log_level::warning};

    // Decoding a listing in parallel issues concurrent reads through the memory reader handed to
    // `goroutines`. Only turn this on when that reader tolerates it (e.g., it is wrapped in
    // `serialized_memory`.) Thread readers are not affected; they are only used from the caller.
    bool _parallel_processing{false};

    // upper bound on the number of `runtime.allgs` entries a listing will decode.
    std::size_t _max_goroutines{1 << 16};

    // limits for user-level loads (see `default_load_config`.) Negative means unlimited.
    bool _follow_pointers{true};
    int _max_variable_recurse{1};
    int _max_string_len{64};
    int _max_array_values{64};
    int _max_struct_fields{-1};
};

//--------------------------------------------------------------------------------------------------
// returns true iff the current log level is at least as noisy as the passed-in value.
bool log_level_at_least(settings::log_level);

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
