#include "core/thread_pool_manager.hpp"
#include "logging/logger.hpp"

int ThreadPoolManager::effectiveConcurrency(bool parallel, int max_threads)
{
    if (!parallel)
        return 1;
    if (max_threads > 0)
        return max_threads;
    return tbb::this_task_arena::max_concurrency();
}

void ThreadPoolManager::forEachIndex(size_t count, bool parallel, int max_threads,
                                     const std::function<void(size_t)> &task)
{
    if (count == 0)
        return;

    if (!parallel)
    {
        for (size_t i = 0; i < count; ++i)
        {
            task(i);
        }
        return;
    }

    tbb::task_arena arena(max_threads > 0 ? max_threads : tbb::task_arena::automatic);
    Logger::debug("Dispatching " + std::to_string(count) + " tasks across " +
                  std::to_string(arena.max_concurrency()) + " threads");

    arena.execute([&]
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, count),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              task(i);
                                          }
                                      }); });
}
