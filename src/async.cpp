// Copyright 2024 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/async.hpp"

// stdc++
#include <cassert>
#include <exception>

// stlab
#include <stlab/concurrency/default_executor.hpp>

// application
#include "gscope/settings.hpp"
#include "gscope/tracy.hpp"

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/
// Keeps a work group's count raised for as long as the task holding it is alive.
struct work_token {
    explicit work_token(std::function<void()> on_release) : _on_release{std::move(on_release)} {}
    work_token(const work_token&) = delete;
    work_token(work_token&& t) noexcept : _on_release{std::move(t._on_release)} {
        t._on_release = nullptr;
    }
    ~work_token() {
        if (_on_release) _on_release();
    }

private:
    std::function<void()> _on_release;
};

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

void work_group::state::increment() {
    {
        std::lock_guard<std::mutex> lock(_m);
        ++_n;
    }
    _c.notify_all();
}

void work_group::state::decrement() {
    {
        std::lock_guard<std::mutex> lock(_m);
        --_n;
    }
    _c.notify_all();
}

void work_group::state::wait() {
    std::unique_lock<std::mutex> lock(_m);
    if (_n == 0) return;
    _c.wait(lock, [&] { return _n == 0; });
}

/**************************************************************************************************/

work_group::work_group() : _state{std::make_shared<state>()} {}

/**************************************************************************************************/

void work_group::run(std::function<void()> f) {
    auto doit = [_f = std::move(f)]() {
        // An exception escaping a background task terminates, the same as one escaping main.
        try {
            _f();
        } catch (const std::exception& error) {
            const char* what = error.what();
            (void)what; // so you can see it in the debugger.
            assert(!"unhandled background task exception");
            std::terminate();
        } catch (...) {
            assert(!"unknown unhandled background task exception");
            std::terminate();
        }
    };

    if (!settings::instance()._parallel_processing) {
        doit();
        return;
    }

    _state->increment();
    work_token token([_s = _state] { _s->decrement(); });

    stlab::default_executor([_token = std::move(token), _doit = std::move(doit)]() noexcept {
#if GSCOPE_FEATURE(TRACY)
        thread_local bool tracy_set_thread_name_k = [] {
            TracyCSetThreadName(gscope::profiler::format_unique(
                "decoder %s", gscope::profiler::unique_thread_name()));
            return true;
        }();
        (void)tracy_set_thread_name_k;
#endif // GSCOPE_FEATURE(TRACY)
        _doit();
    });
}

/**************************************************************************************************/

void work_group::wait() {
    _state->wait();
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
