// Copyright 2021 Adobe
// All Rights Reserved.
//
// NOTICE: Adobe permits you to use, modify, and distribute this file in accordance with the terms
// of the Adobe license agreement accompanying it.

// identity
#include "gscope/listing.hpp"

// stdc++
#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>

// tbb
#include <tbb/concurrent_unordered_map.h>

// application
#include "gscope/async.hpp"
#include "gscope/errors.hpp"
#include "gscope/log.hpp"
#include "gscope/settings.hpp"
#include "gscope/tracy.hpp"

/**************************************************************************************************/

namespace gscope {

/**************************************************************************************************/

namespace {

/**************************************************************************************************/
// goroutine id -> id of the thread running it
using thread_map = tbb::concurrent_unordered_map<std::int64_t, std::uint32_t>;

// Thread readers are only ever used from the calling thread, before any decode task starts.
thread_map associate_threads(std::span<thread* const> threads) {
    thread_map result;

    for (thread* t : threads) {
        try {
            const goroutine g = thread_goroutine(*t);
            result.emplace(g._id, t->thread_id());
        } catch (const no_goroutine& error) {
            if (log_level_at_least(settings::log_level::verbose)) {
                cout_safe([&](auto& s) {
                    s << "verbose: skipping thread " << error._thread_id << ": " << error.what()
                      << '\n';
                });
            }
        } catch (const std::exception& error) {
            if (log_level_at_least(settings::log_level::verbose)) {
                cout_safe([&](auto& s) {
                    s << "verbose: skipping thread " << t->thread_id() << ": " << error.what()
                      << '\n';
                });
            }
        }
    }

    return result;
}

/**************************************************************************************************/

std::optional<goroutine> decode(const variable& entry, const thread_map& running) {
    try {
        goroutine result = parse_g(entry);
        auto found = running.find(result._id);
        if (found != running.end()) result._thread_id = found->second;
        return result;
    } catch (const no_goroutine&) {
        return std::nullopt;
    } catch (const std::exception& error) {
        if (log_level_at_least(settings::log_level::verbose)) {
            cout_safe([&](auto& s) {
                s << "verbose: unreadable goroutine at 0x" << std::hex << entry.addr() << std::dec
                  << ": " << error.what() << '\n';
            });
        }

        goroutine result;
        result._unreadable = std::current_exception();
        result._variable = entry;
        return result;
    }
}

/**************************************************************************************************/

} // namespace

/**************************************************************************************************/

std::vector<goroutine> goroutines(memory_reader& mem,
                                  const binary_info& bi,
                                  std::span<thread* const> threads) {
    ZoneScoped;

    const auto allgs_global = bi.find_global("runtime.allgs");

    if (!allgs_global || !allgs_global->_type) {
        throw std::runtime_error("could not find runtime.allgs");
    }

    const auto max_goroutines = std::min<std::size_t>(settings::instance()._max_goroutines,
                                                      std::numeric_limits<int>::max());
    variable allgs("runtime.allgs", allgs_global->_addr, *allgs_global->_type, mem, bi);
    allgs.load(load_config{false, 0, 0, static_cast<int>(max_goroutines), 0});

    if (allgs.unreadable()) std::rethrow_exception(allgs.unreadable_error());

    if (allgs.len() > allgs.children().size() &&
        log_level_at_least(settings::log_level::warning)) {
        cout_safe([&](auto& s) {
            s << "warning: listing the first " << allgs.children().size() << " of " << allgs.len()
              << " goroutines\n";
        });
    }

    const auto& entries = allgs.children();
    std::vector<std::optional<goroutine>> decoded(entries.size());
    const thread_map running = associate_threads(threads);
    work_group work;

    for (std::size_t i{0}; i < entries.size(); ++i) {
        work.run([&, i] { decoded[i] = decode(entries[i], running); });
    }

    work.wait();

    std::vector<goroutine> result;
    result.reserve(decoded.size());

    for (auto& g : decoded) {
        if (g) result.push_back(std::move(*g));
    }

    if (log_level_at_least(settings::log_level::info)) {
        cout_safe([&](auto& s) { s << "info: decoded " << result.size() << " goroutine(s)\n"; });
    }

    return result;
}

/**************************************************************************************************/

} // namespace gscope

/**************************************************************************************************/
