// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/loclist.hpp"

// adobe contract checks
#include "adobe/contract_checks.hpp"

// application
#include "gscope/tracy.hpp"

//
// SPECREF: DWARF4 page 44 (30) -- location lists
//
// Each entry of a (pre DWARF5) location list is one of:
//
//     - an end of list entry: two zero addresses.
//     - a base address selection entry: the largest representable address, then the new base.
//     - a location list entry: a beginning and ending address offset (relative to the base), a
//       two-byte length, and a location expression of that many bytes.
//
// Addresses are the size of a target address, so a 32-bit target's base address selection marker
// is 0xffffffff, not ~0ull. We widen it so callers can check a single value.
//

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

loclist_reader::loclist_reader(std::span<const std::byte> data, std::size_t ptr_size)
    : _s(data), _ptr_size(ptr_size) {
    ADOBE_PRECONDITION(_ptr_size == 4 || _ptr_size == 8, "bad address size");
}

/**************************************************************************************************/

void loclist_reader::seek(std::size_t offset) {
    _s.seekg(offset);
}

/**************************************************************************************************/

std::uint64_t loclist_reader::one_addr() {
    switch (_ptr_size) {
        case 4: {
            const auto addr = read_le<std::uint32_t>(_s);
            if (addr == ~std::uint32_t(0)) return ~std::uint64_t(0);
            return addr;
        }
        case 8:
            return read_le<std::uint64_t>(_s);
        default:
            ADOBE_INVARIANT(false, "bad address size");
            return 0;
    }
}

/**************************************************************************************************/

bool loclist_reader::next(loclist_entry& e) {
    e._low_pc = one_addr();
    e._high_pc = one_addr();

    if (e._low_pc == 0 && e._high_pc == 0) {
        return false;
    }

    if (e.base_address_selection()) {
        e._instr = {};
        return true;
    }

    const auto instr_len = read_le<std::uint16_t>(_s);
    e._instr = _s.read_view(instr_len);
    return true;
}

/**************************************************************************************************/

std::optional<std::span<const std::byte>> loclist_find(loclist_reader& r,
                                                       std::size_t offset,
                                                       std::uint64_t base,
                                                       std::uint64_t pc) {
    ZoneScoped;

    r.seek(offset);

    loclist_entry e;
    while (r.next(e)) {
        if (e.base_address_selection()) {
            base = e._high_pc;
            continue;
        }

        if (pc >= base + e._low_pc && pc < base + e._high_pc) {
            return e._instr;
        }
    }

    return std::nullopt;
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
