#ifndef __CONFIG_HPP__
#define __CONFIG_HPP__

#include "types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace blockring
{
    // Knobs of the ringtool benchmark. Passed explicitly to whatever needs it;
    // there is no process-wide instance.
    class Config
    {
    public:
        Config() = default;

        std::string getRingType() const { return _ring_type; }
        void setRingType(const std::string &type) { _ring_type = type; }

        std::size_t getReplication() const { return _replication; }
        void setReplication(std::size_t factor) { _replication = factor; }

        // 0 means "same as the starting replication".
        std::size_t getReplicationEnd() const { return _replication_end; }
        void setReplicationEnd(std::size_t factor) { _replication_end = factor; }
        std::size_t effectiveReplicationEnd() const { return _replication_end == 0 ? _replication : _replication_end; }

        int getNodes() const { return _nodes; }
        void setNodes(int nodes) { _nodes = nodes; }

        int getDelta() const { return _delta; }
        void setDelta(int delta) { _delta = delta; }

        std::string getBlockSize() const { return _block_size; }
        void setBlockSize(const std::string &size) { _block_size = size; }

        std::string getTotalData() const { return _total_data; }
        void setTotalData(const std::string &size) { _total_data = size; }

        int getRewriteEdge() const { return _rewrite_edge; }
        void setRewriteEdge(int percent) { _rewrite_edge = percent; }

        std::uint64_t getSeed() const { return _seed; }
        void setSeed(std::uint64_t seed) { _seed = seed; }

        std::uint64_t getPeerCapacity() const { return _peer_capacity; }
        void setPeerCapacity(std::uint64_t blocks) { _peer_capacity = blocks; }

        std::string getLogLevel() const { return _log_level; }
        void setLogLevel(const std::string &level) { _log_level = level; }

        [[nodiscard]] Result<std::uint64_t> blockSizeBytes() const;
        [[nodiscard]] Result<std::uint64_t> totalDataBytes() const;

        // Applies one "key=value" setting.
        [[nodiscard]] Status set(const std::string &key, const std::string &value);

        // Accepts "--key=value" arguments; "--config=<file>" loads a file in place.
        [[nodiscard]] Status parseArgs(const std::vector<std::string> &args);

        bool loadFromFile(const std::string &filename);
        bool saveToFile(const std::string &filename) const;

    private:
        std::string _ring_type = "mod";
        std::size_t _replication = 2;
        std::size_t _replication_end = 0;
        int _nodes = 5;
        int _delta = 2;
        std::string _block_size = "256KiB";
        std::string _total_data = "1TiB";
        int _rewrite_edge = 40;
        std::uint64_t _seed = 1;
        std::uint64_t _peer_capacity = 100ULL * 1024 * 1024 * 1024;
        std::string _log_level = "info";
    };
} // namespace blockring

#endif // __CONFIG_HPP__
