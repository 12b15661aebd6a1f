#pragma once

#include "iteration_grid.h"
#include "viewport.h"
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

// Contiguous rows handed to one task
struct RowRange
{
    int firstRow;
    int rowCount;
};

// Fork-join distribution of disjoint row blocks over worker threads.
// Each task owns the counts of its rows exclusively; tasks share nothing
// mutable, so no locking is needed.
class RowScheduler
{
public:
    // threadCount 0 uses the hardware concurrency, rowsPerTask 0 picks a block
    // size giving about TASKS_PER_THREAD blocks per thread.
    explicit RowScheduler(unsigned threadCount = 0, int rowsPerTask = 0);
    virtual ~RowScheduler() = default;

    RowScheduler(const RowScheduler &) = default;
    RowScheduler &operator=(const RowScheduler &) = default;

    unsigned getThreadCount() const { return threadCount; }
    int getRowsPerTask() const { return rowsPerTask; }

    // Splits [0, height) into disjoint contiguous ranges in row order
    std::vector<RowRange> partition(int height) const;

    // Runs task(i) for every i in [0, taskCount) and joins all workers.
    // If tasks fail, the exception of the lowest-numbered failing worker is
    // rethrown after the join. If a worker cannot be started, the workers
    // already running are joined before the launch error propagates.
    void forEach(int taskCount, const std::function<void(int)> &task) const;

    // Computes all rows of the grid in parallel.
    // computeRows(firstRow, rowCount, out) appends rowCount * width counts to out.
    template <typename Count, typename RowFn>
    IterationGrid<Count> run(const Resolution &resolution, RowFn computeRows) const
    {
        std::vector<RowRange> ranges = partition(resolution.height);
        std::vector<typename IterationGrid<Count>::RowBlock> blocks(ranges.size());

        forEach(static_cast<int>(ranges.size()), [&](int taskIdx)
                {
                    const RowRange &range = ranges[taskIdx];
                    auto &block = blocks[taskIdx];

                    block.firstRow = range.firstRow;
                    block.rowCount = range.rowCount;
                    block.counts.reserve(static_cast<std::size_t>(range.rowCount) * resolution.width);

                    computeRows(range.firstRow, range.rowCount, block.counts); });

        return IterationGrid<Count>::fromRowBlocks(resolution, std::move(blocks));
    }

    static constexpr int TASKS_PER_THREAD = 4;

protected:
    // Starts one worker thread running work
    virtual std::jthread launchWorker(std::function<void()> work) const;

private:
    unsigned threadCount;
    int rowsPerTask;
};
