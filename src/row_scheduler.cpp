#include "row_scheduler.h"
#include "errors.h"
#include <algorithm>
#include <exception>
#include <format>
#include <thread>
#include <utility>

RowScheduler::RowScheduler(unsigned threads, int rows)
    : threadCount(threads), rowsPerTask(rows)
{
    if (rowsPerTask < 0)
    {
        throw ConfigurationError(std::format("rows per task must not be negative, got {}", rowsPerTask));
    }

    if (threadCount == 0)
    {
        threadCount = std::max(1u, std::thread::hardware_concurrency());
    }
}

std::vector<RowRange> RowScheduler::partition(int height) const
{
    std::vector<RowRange> ranges;
    if (height <= 0)
        return ranges;

    int blockRows = rowsPerTask;
    if (blockRows == 0)
    {
        int blocks = static_cast<int>(threadCount) * TASKS_PER_THREAD;
        blockRows = std::max(1, (height + blocks - 1) / blocks); // Ceiling division
    }

    ranges.reserve((height + blockRows - 1) / blockRows);
    for (int row = 0; row < height; row += blockRows)
    {
        ranges.push_back({row, std::min(blockRows, height - row)});
    }

    return ranges;
}

void RowScheduler::forEach(int taskCount, const std::function<void(int)> &task) const
{
    if (taskCount <= 0)
        return;

    const int numThreads = std::min(static_cast<int>(threadCount), taskCount);

    if (numThreads == 1)
    {
        for (int taskIdx = 0; taskIdx < taskCount; ++taskIdx)
        {
            task(taskIdx);
        }
        return;
    }

    // One slot per worker so failures never share state
    std::vector<std::exception_ptr> failures(numThreads);

    // Lambda to process a range of tasks
    auto processTasks = [&task, &failures](int worker, int startIdx, int endIdx)
    {
        try
        {
            for (int taskIdx = startIdx; taskIdx < endIdx; ++taskIdx)
            {
                task(taskIdx);
            }
        }
        catch (...)
        {
            failures[worker] = std::current_exception();
        }
    };

    // Create threads and distribute tasks among them.
    // std::jthread joins on destruction, so a failed launch never leaves
    // running workers behind.
    int tasksPerThread = (taskCount + numThreads - 1) / numThreads; // Ceiling division
    {
        std::vector<std::jthread> threads;
        threads.reserve(numThreads);

        for (int t = 0; t < numThreads; ++t)
        {
            int startIdx = t * tasksPerThread;
            int endIdx = std::min(startIdx + tasksPerThread, taskCount);

            if (startIdx < taskCount)
            {
                threads.push_back(launchWorker([&processTasks, t, startIdx, endIdx]()
                                               { processTasks(t, startIdx, endIdx); }));
            }
        }

        // Wait for all threads to complete
        for (auto &thread : threads)
        {
            thread.join();
        }
    }

    for (auto &failure : failures)
    {
        if (failure)
            std::rethrow_exception(failure);
    }
}

std::jthread RowScheduler::launchWorker(std::function<void()> work) const
{
    return std::jthread(std::move(work));
}
