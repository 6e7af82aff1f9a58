// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <exception>
#include <optional>
#include <vector>

// application
#include "gscope/capabilities.hpp"
#include "gscope/variable.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------
// A goroutine that (transitively) spawned another one, as recorded by the runtime when ancestor
// tracking is enabled.
struct ancestor {
    std::int64_t _id{0};
    std::exception_ptr _unreadable;
    std::optional<variable> _pcs_var; // unloaded `pcs` slice

    bool unreadable() const { return static_cast<bool>(_unreadable); }

    // Resolves up to `n` of the saved return addresses. Throws if the ancestor (or its pcs slice)
    // is unreadable.
    std::vector<location> stack(int n) const;
};

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
