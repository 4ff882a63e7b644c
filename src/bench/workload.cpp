#include "workload.hpp"
#include <algorithm>

namespace blockring
{
    std::vector<BlockRef> WorkloadGenerator::generate(std::size_t block_count)
    {
        std::vector<BlockRef> blocks;
        blocks.reserve(block_count);

        std::uniform_int_distribution<std::size_t> file_size(1, MAX_BLOCKS_PER_FILE);
        std::normal_distribution<double> edge(0.0, 1.0);
        while (blocks.size() < block_count)
        {
            const auto size = file_size(_rng);
            const auto draw = edge(_rng);
            auto file = draw < _rewrite_edge ? rewrittenFile(size) : linearFile(size);
            blocks.insert(blocks.end(), file.begin(), file.end());
        }
        return blocks;
    }

    std::vector<BlockRef> WorkloadGenerator::linearFile(std::size_t size)
    {
        std::vector<BlockRef> file;
        file.reserve(size);
        for (std::size_t i = 1; i <= size; ++i)
        {
            file.emplace_back(_volume, _next_inode, static_cast<IndexId>(i));
        }
        ++_next_inode;
        return file;
    }

    std::vector<BlockRef> WorkloadGenerator::rewrittenFile(std::size_t size)
    {
        auto file = linearFile(size);
        if (file.empty())
        {
            return file;
        }

        std::uniform_int_distribution<int> iterations(0, MAX_REWRITE_ITERATIONS - 1);
        const auto rewrites = iterations(_rng);
        for (int i = 0; i < rewrites; ++i)
        {
            std::uniform_int_distribution<std::size_t> offset_dist(0, file.size() - 1);
            const auto offset = offset_dist(_rng);
            std::uniform_int_distribution<std::size_t> length_dist(0, file.size() - offset - 1);
            const auto piece = linearFile(length_dist(_rng));
            std::copy(piece.begin(), piece.end(), file.begin() + static_cast<std::ptrdiff_t>(offset));
        }
        return file;
    }
} // namespace blockring
