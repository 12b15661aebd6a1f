#pragma once

#include "viewport.h"
#include <cstddef>
#include <format>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

// Row-major escape-time counts, one per pixel.
// A grid only ever exists fully populated: it is assembled from row blocks
// that together cover every row exactly once, so no cell can be read before
// it was computed.
template <typename Count>
class IterationGrid
{
public:
    // A contiguous group of rows computed by one task
    struct RowBlock
    {
        int firstRow = 0;
        int rowCount = 0;
        std::vector<Count> counts; // rowCount * width values
    };

    // Concatenates blocks in row order.
    // Throws std::logic_error unless the blocks start at row 0, follow each
    // other without gaps or overlap, each carry rowCount * width counts and
    // end at the last row.
    static IterationGrid fromRowBlocks(const Resolution &resolution, std::vector<RowBlock> blocks)
    {
        std::vector<Count> data;
        data.reserve(resolution.cellCount());

        int nextRow = 0;
        for (auto &block : blocks)
        {
            std::size_t expected = static_cast<std::size_t>(block.rowCount) * resolution.width;

            if (block.firstRow != nextRow || block.rowCount <= 0 || block.counts.size() != expected)
            {
                throw std::logic_error(std::format("row block at {} ({} rows, {} counts) does not continue the grid at row {}",
                                                   block.firstRow, block.rowCount, block.counts.size(), nextRow));
            }

            data.insert(data.end(), block.counts.begin(), block.counts.end());
            nextRow += block.rowCount;
        }

        if (nextRow != resolution.height)
        {
            throw std::logic_error(std::format("row blocks cover {} of {} rows", nextRow, resolution.height));
        }

        return IterationGrid(resolution, std::move(data));
    }

    int getWidth() const { return width; }
    int getHeight() const { return height; }
    std::size_t size() const { return data.size(); }

    const std::vector<Count> &getData() const { return data; }

    Count at(int row, int col) const { return data[static_cast<std::size_t>(row) * width + col]; }

    std::span<const Count> row(int r) const
    {
        return std::span<const Count>(data).subspan(static_cast<std::size_t>(r) * width, width);
    }

    bool operator==(const IterationGrid &other) const = default;

private:
    IterationGrid(const Resolution &resolution, std::vector<Count> counts)
        : width(resolution.width), height(resolution.height), data(std::move(counts))
    {
    }

    int width;
    int height;
    std::vector<Count> data;
};
