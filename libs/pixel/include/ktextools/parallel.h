#pragma once

#include <algorithm>
#include <cstddef>
#include <exception>
#include <system_error>
#include <thread>
#include <vector>

namespace ktextools::parallel {

namespace detail {

// Set on threads started by for_each_index. Nested calls run inline there.
inline thread_local bool in_worker = false;

} // namespace detail

inline unsigned worker_count(size_t jobs) {
    if (detail::in_worker) return 1;
    const unsigned hc = std::thread::hardware_concurrency();
    const unsigned desired = std::clamp(hc, 1u, 16u);
    return static_cast<unsigned>(std::min<size_t>(desired, jobs));
}

// for_each_index calls fn(i) for every i in [0, count). Indices are split into
// contiguous stripes, one per worker thread. fn must only write state owned by
// index i. The first exception thrown by any stripe is rethrown on the caller
// after all workers have joined.
//
// Calls made from inside a worker run serially on that worker. If a thread
// cannot be started, the stripes left over run on the calling thread.
template <typename Fn>
void for_each_index(size_t count, Fn&& fn, size_t min_per_worker = 1) {
    if (count == 0) return;
    const size_t by_grain = std::max<size_t>(1, count / std::max<size_t>(1, min_per_worker));
    const unsigned workers = worker_count(by_grain);
    if (workers <= 1) {
        for (size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    std::vector<std::exception_ptr> errors(workers);
    const size_t stripe = (count + workers - 1) / workers;
    auto run_stripe = [&fn, &errors, count, stripe](unsigned w) {
        const size_t begin = static_cast<size_t>(w) * stripe;
        const size_t end = std::min(count, begin + stripe);
        try {
            for (size_t i = begin; i < end; ++i) fn(i);
        } catch (...) {
            errors[w] = std::current_exception();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    unsigned w = 0;
    for (; w < workers && static_cast<size_t>(w) * stripe < count; ++w) {
        try {
            threads.emplace_back([&run_stripe, w]() {
                detail::in_worker = true;
                run_stripe(w);
            });
        } catch (const std::system_error&) {
            break;
        }
    }
    for (; w < workers && static_cast<size_t>(w) * stripe < count; ++w) run_stripe(w);

    for (auto& t : threads) t.join();
    for (auto& e : errors)
        if (e) std::rethrow_exception(e);
}

} // namespace ktextools::parallel
