// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/capabilities.hpp"

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

location pc_location(const binary_info& bi, std::uint64_t pc) {
    source_line line = bi.pc_to_line(pc);
    return location{pc, std::move(line._file), line._line, line._fn};
}

/**************************************************************************************************/

std::ostream& operator<<(std::ostream& s, const location& x) {
    s << "0x" << std::hex << x._pc << std::dec;

    if (x._fn) s << " in " << x._fn->_name;

    if (!x._file.empty()) s << " at " << x._file << ':' << x._line;

    return s;
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
