// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <span>
#include <vector>

// application
#include "gscope/capabilities.hpp"
#include "gscope/goroutine.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------
// Decodes every goroutine in `runtime.allgs`, in order. Goroutines that fail to decode are kept
// (with `_unreadable` set); null entries are skipped. Goroutines currently running on one of
// `threads` get that thread's id. The threads are resolved on the calling thread before any
// parallel decode starts. Throws if `runtime.allgs` itself cannot be found or read.
std::vector<goroutine> goroutines(memory_reader& mem,
                                  const binary_info& bi,
                                  std::span<thread* const> threads = {});

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
