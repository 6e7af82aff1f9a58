// Copyright 2024 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

#pragma once

// stdc++
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>

//======================================================================================================================

namespace gscope {

//======================================================================================================================
// Tracks a batch of tasks so the caller can wait on exactly that batch. If the
// `parallel_processing` setting is true, tasks are run on the stlab default executor. Otherwise they
// run immediately in the calling thread.
class work_group {
public:
    work_group();

    // Tasks must not let exceptions escape; one that does terminates the application.
    void run(std::function<void()> f);

    // blocks the calling thread until every task handed to `run` has finished.
    void wait();

private:
    struct state {
        void increment();
        void decrement();
        void wait();

        std::mutex _m;
        std::condition_variable _c;
        std::size_t _n{0};
    };

    std::shared_ptr<state> _state;
};

//======================================================================================================================

} // namespace gscope

//======================================================================================================================
