// Copyright 2023 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// Tracy lets the source location macros be overridden before tracy/Tracy.hpp is included. The
// defaults are __FUNCTION__, __FILE__ and __LINE__.
#if defined(__clang__) || defined(__GNUC__)
    #define TracyFunction __PRETTY_FUNCTION__
#elif defined(_MSC_VER)
    #define TracyFunction __FUNCSIG__
#endif

#include <tracy/Tracy.hpp>
#include <tracy/TracyC.h>

#include "gscope/features.hpp"

//==================================================================================================
// Named `profiler` rather than `tracy` so the Tracy macros keep resolving to the global ::tracy
// namespace when they are expanded in here.
namespace gscope::profiler {

//==================================================================================================
// returns a unique, brief `const char*` per thread for the lifetime of the application. Calling
// this routine with Tracy disabled throws.
const char* unique_thread_name();

// returns a NEW `const char*` every time it is called, intended for thread_local initialization.
// The memory is leaked on purpose. At most 32 characters. Calling this routine with Tracy disabled
// throws.
const char* format_unique(const char* format, ...);

//==================================================================================================

} // namespace gscope::profiler

//==================================================================================================
