#pragma once
#include <algorithm>
#include <atomic>
#include <future>
#include <vector>

// Runs fn(i) for i in [0, count) on at most max_workers async tasks and
// returns the results in index order. The first exception thrown by fn is
// rethrown after every worker has stopped.
template <typename T, typename F>
std::vector<T> parallel_map(size_t count, size_t max_workers, F fn)
{
    std::vector<T> results(count);
    if (count == 0) return results;

    size_t workers = std::max<size_t>(1, std::min(max_workers, count));
    if (workers == 1) {
        for (size_t i = 0; i < count; ++i) results[i] = fn(i);
        return results;
    }

    std::atomic<size_t> next{0};
    std::vector<std::future<void>> futures;
    futures.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        futures.push_back(std::async(std::launch::async, [&] {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1))
                results[i] = fn(i);
        }));
    }

    for (auto &f : futures) f.wait();
    for (auto &f : futures) f.get();
    return results;
}
