// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/ancestor.hpp"

// stdc++
#include <stdexcept>
#include <string>

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

std::vector<location> ancestor::stack(int n) const {
    if (_unreadable) std::rethrow_exception(_unreadable);
    if (!_pcs_var) throw std::runtime_error("ancestor has no saved pcs");

    variable pcs = *_pcs_var;
    pcs.load(load_config{false, 0, 0, n, 0});

    if (pcs.unreadable()) std::rethrow_exception(pcs.unreadable_error());

    const binary_info& bi = pcs.bin_info();
    std::vector<location> result;
    result.reserve(pcs.children().size());

    for (std::size_t i{0}; i < pcs.children().size(); ++i) {
        const variable& child = pcs.children()[i];

        if (child.unreadable()) std::rethrow_exception(child.unreadable_error());
        if (child.kind() != type_kind::uint) {
            throw std::runtime_error("wrong type for pcs item " + std::to_string(i) + ": " +
                                     to_string(child.kind()));
        }

        const std::uint64_t pc = *child.as_uint();
        const function* fn = bi.pc_to_func(pc);

        if (!fn) {
            result.push_back(location{pc});
            continue;
        }

        // saved pcs are return addresses; back up into the call instruction.
        std::uint64_t call_pc = pc;
        if (call_pc - 1 >= fn->_entry) --call_pc;

        source_line line = bi.pc_to_line(call_pc);
        result.push_back(location{pc, std::move(line._file), line._line, fn});
    }

    return result;
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
