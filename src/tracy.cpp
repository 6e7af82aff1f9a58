// Copyright 2023 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/tracy.hpp"

// stdc++
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <stdexcept>

//==================================================================================================

namespace gscope::profiler {

//==================================================================================================

const char* unique_thread_name() {
#if GSCOPE_FEATURE(TRACY)
    static std::atomic_int counter_s{0};
    thread_local const char* result = [] {
        thread_local char result[2] = {0};
        result[0] = 'A' + counter_s++;
        if (counter_s > 126) {
            throw std::runtime_error("counter overflow");
        }
        return result;
    }();
    return result;
#else
    throw std::runtime_error("calling tracy support API with tracy disabled");
#endif // GSCOPE_FEATURE(TRACY)
}

//==================================================================================================

const char* format_unique(const char* format, ...) {
#if GSCOPE_FEATURE(TRACY)
    char* result = new char[32]; // lives for the rest of the application
    va_list args;
    va_start(args, format);
    vsnprintf(result, 32, format, args);
    va_end(args);
    return result;
#else
    throw std::runtime_error("calling tracy support API with tracy disabled");
#endif // GSCOPE_FEATURE(TRACY)
}

//==================================================================================================

} // namespace gscope::profiler

//==================================================================================================
