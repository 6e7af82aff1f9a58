// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/defer.hpp"

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/

std::optional<std::uint64_t> readable_uint(const variable* v) {
    if (!v || v->unreadable()) return std::nullopt;
    return v->as_uint();
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

defer_record::defer_record(variable v) : _variable(std::move(v)) {
    _variable.load(load_config{false, 1, 0, 0, -1});

    if (_variable.unreadable()) {
        _unreadable = _variable.unreadable_error();
        return;
    }

    // a record without a readable `pc` is garbage.
    if (const variable* pc = _variable.field("pc"); pc && pc->unreadable()) {
        _unreadable = pc->unreadable_error();
        return;
    }

    // `fn` points to a funcval whose first word is the code pointer.
    if (auto fn = _variable.struct_member("fn")) {
        variable funcval = fn->maybe_dereference();

        if (!funcval.unreadable() && funcval.addr() != 0) {
            if (auto code = funcval.struct_member("fn")) {
                code->load(load_config{false, 0, 0, 0, 0});
                _deferred_pc = readable_uint(&*code).value_or(0);
            }
        }
    }

    _defer_pc = readable_uint(_variable.field("pc")).value_or(0);
    _sp = readable_uint(_variable.field("sp")).value_or(0);

    if (const variable* siz = _variable.field("siz")) {
        if (!siz->unreadable()) _arg_size = siz->as_int();
    }

    if (auto link = _variable.struct_member("link")) {
        variable next = link->maybe_dereference();
        if (next.addr() != 0) _link = std::move(next);
    }
}

/**************************************************************************************************/

std::optional<defer_record> defer_record::next() const {
    if (!_link) return std::nullopt;
    return defer_record(*_link);
}

/**************************************************************************************************/

location defer_record::defer_location() const {
    return pc_location(_variable.bin_info(), _defer_pc);
}

/**************************************************************************************************/

const function* defer_record::deferred_function() const {
    return _variable.bin_info().pc_to_func(_deferred_pc);
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
