#pragma once

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <cstddef>
#include <functional>

/**
 * @brief Fan-out helper over TBB
 *
 * Runs one task per index, either inline or on a task arena capped at
 * max_threads (0 keeps the TBB default). Tasks must touch disjoint state.
 */
class ThreadPoolManager
{
public:
    static void forEachIndex(size_t count, bool parallel, int max_threads,
                             const std::function<void(size_t)> &task);

    /**
     * @brief Thread count a parallel run would use
     */
    static int effectiveConcurrency(bool parallel, int max_threads);
};
