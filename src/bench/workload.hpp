#ifndef __WORKLOAD_HPP__
#define __WORKLOAD_HPP__

#include "../cluster/block_ref.hpp"
#include <cstddef>
#include <random>
#include <vector>

namespace blockring
{
    // Synthetic block identities for a volume written as whole files, some of
    // which are then partly rewritten in place. Rewritten ranges get blocks of
    // fresh inodes, so every generated BlockRef is unique.
    class WorkloadGenerator
    {
    public:
        static constexpr std::size_t MAX_BLOCKS_PER_FILE = 1000;
        static constexpr int MAX_REWRITE_ITERATIONS = 30;

        // rewrite_edge is the threshold a standard normal draw must fall below
        // for a file to be rewritten (the percentage knob divided by 100).
        WorkloadGenerator(std::mt19937_64 &rng, double rewrite_edge, VolumeId volume = 1)
            : _rng(rng), _rewrite_edge(rewrite_edge), _volume(volume) {}

        // Whole files until at least block_count blocks exist.
        [[nodiscard]] std::vector<BlockRef> generate(std::size_t block_count);

        // Blocks 1..size of the next inode.
        [[nodiscard]] std::vector<BlockRef> linearFile(std::size_t size);

        // A linear file with up to MAX_REWRITE_ITERATIONS ranges overwritten.
        [[nodiscard]] std::vector<BlockRef> rewrittenFile(std::size_t size);

        [[nodiscard]] INodeId nextINode() const noexcept { return _next_inode; }

    private:
        std::mt19937_64 &_rng;
        double _rewrite_edge;
        VolumeId _volume;
        INodeId _next_inode = 1;
    };
} // namespace blockring

#endif // __WORKLOAD_HPP__
