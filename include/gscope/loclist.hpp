// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <cstdint>
#include <optional>
#include <span>

// application
#include "gscope/buffer_reader.hpp"

//--------------------------------------------------------------------------------------------------

namespace gscope {

//--------------------------------------------------------------------------------------------------
// One entry of a DWARF 2-4 location list (the `.debug_loc` encoding.) `_low_pc` and `_high_pc` are
// relative to the current base address unless this is a base address selection entry, in which
// case `_high_pc` is the new base. `_instr` is a view into the buffer the reader was given.
struct loclist_entry {
    std::uint64_t _low_pc{0};
    std::uint64_t _high_pc{0};
    std::span<const std::byte> _instr;

    bool base_address_selection() const { return _low_pc == ~std::uint64_t(0); }
};

//--------------------------------------------------------------------------------------------------
// Decodes location list entries out of a borrowed `.debug_loc` buffer. Many variables' lists share
// one buffer, so the reader is meant to be re-seeked and reused rather than re-created.
class loclist_reader {
public:
    // `ptr_size` must be 4 or 8.
    loclist_reader(std::span<const std::byte> data, std::size_t ptr_size);

    // positions the reader at the start of the location list at `offset`.
    void seek(std::size_t offset);

    std::size_t tellg() const { return _s.tellg(); }

    // decodes the next entry into `e`. Returns false when the end of list entry is read.
    bool next(loclist_entry& e);

    std::size_t ptr_size() const { return _ptr_size; }

private:
    std::uint64_t one_addr();

    buffer_reader _s;
    std::size_t _ptr_size{0};
};

//--------------------------------------------------------------------------------------------------
// Walks the location list at `offset` looking for the entry whose range covers `pc`. `base` is the
// initial base address (usually the low pc of the compilation unit); base address selection
// entries replace it as the walk goes. Returns the location expression of the matching entry.
std::optional<std::span<const std::byte>> loclist_find(loclist_reader& r,
                                                       std::size_t offset,
                                                       std::uint64_t base,
                                                       std::uint64_t pc);

//--------------------------------------------------------------------------------------------------

} // namespace gscope

//--------------------------------------------------------------------------------------------------
