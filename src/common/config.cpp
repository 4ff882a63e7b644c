#include "config.hpp"
#include "logger.hpp"
#include "units.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace blockring
{
    namespace
    {
        std::string trim(const std::string &s)
        {
            const auto first = s.find_first_not_of(" \t\r");
            if (first == std::string::npos)
                return {};
            const auto last = s.find_last_not_of(" \t\r");
            return s.substr(first, last - first + 1);
        }

        // std::stoi accepts trailing garbage; configuration values must not.
        template <typename Parse>
        auto parseWhole(const std::string &value, Parse parse)
        {
            std::size_t consumed = 0;
            auto parsed = parse(value, &consumed);
            if (consumed != value.size())
            {
                throw std::invalid_argument("trailing characters");
            }
            return parsed;
        }

        int parseInt(const std::string &value)
        {
            return parseWhole(value, [](const std::string &v, std::size_t *n)
                              { return std::stoi(v, n); });
        }

        std::uint64_t parseUnsigned(const std::string &value)
        {
            if (!value.empty() && value[0] == '-')
            {
                throw std::invalid_argument("negative value");
            }
            return parseWhole(value, [](const std::string &v, std::size_t *n)
                              { return std::stoull(v, n); });
        }
    } // namespace

    Result<std::uint64_t> Config::blockSizeBytes() const
    {
        auto size = parseBytes(_block_size);
        if (size.ok() && size.value() == 0)
        {
            return {Status::INVALID_ARGUMENT, "block size must be positive"};
        }
        return size;
    }

    Result<std::uint64_t> Config::totalDataBytes() const
    {
        return parseBytes(_total_data);
    }

    Status Config::set(const std::string &raw_key, const std::string &raw_value)
    {
        const auto key = trim(raw_key);
        const auto value = trim(raw_value);

        try
        {
            if (key == "ring")
            {
                _ring_type = value;
            }
            else if (key == "rep")
            {
                _replication = parseUnsigned(value);
            }
            else if (key == "rep_end")
            {
                _replication_end = parseUnsigned(value);
            }
            else if (key == "nodes")
            {
                const auto nodes = parseInt(value);
                if (nodes < 0)
                {
                    LOG_ERROR("nodes must not be negative: {}", value);
                    return Status::INVALID_ARGUMENT;
                }
                _nodes = nodes;
            }
            else if (key == "delta")
            {
                _delta = parseInt(value);
            }
            else if (key == "block_size")
            {
                _block_size = value;
            }
            else if (key == "total_data")
            {
                _total_data = value;
            }
            else if (key == "rewrite_edge")
            {
                _rewrite_edge = parseInt(value);
            }
            else if (key == "seed")
            {
                _seed = parseUnsigned(value);
            }
            else if (key == "peer_capacity")
            {
                _peer_capacity = parseUnsigned(value);
            }
            else if (key == "log_level")
            {
                LogLevel level;
                if (!logLevelFromString(value, level))
                {
                    LOG_ERROR("Unknown log level: {}", value);
                    return Status::INVALID_ARGUMENT;
                }
                _log_level = value;
            }
            else
            {
                return Status::NOT_FOUND;
            }
        }
        catch (const std::exception &e)
        {
            LOG_ERROR("Error parsing config value for key '{}': {}", key, e.what());
            return Status::INVALID_ARGUMENT;
        }
        return Status::OK;
    }

    Status Config::parseArgs(const std::vector<std::string> &args)
    {
        for (const auto &arg : args)
        {
            if (arg.rfind("--", 0) != 0)
            {
                LOG_ERROR("Unexpected argument: {}", arg);
                return Status::INVALID_ARGUMENT;
            }

            const auto pos = arg.find('=');
            if (pos == std::string::npos)
            {
                LOG_ERROR("Argument must have the form --key=value: {}", arg);
                return Status::INVALID_ARGUMENT;
            }

            auto key = arg.substr(2, pos - 2);
            std::replace(key.begin(), key.end(), '-', '_');
            const auto value = arg.substr(pos + 1);

            if (key == "config")
            {
                if (!loadFromFile(value))
                {
                    return Status::INVALID_ARGUMENT;
                }
                continue;
            }

            const auto status = set(key, value);
            if (status == Status::NOT_FOUND)
            {
                LOG_ERROR("Unknown option: --{}", key);
                return Status::INVALID_ARGUMENT;
            }
            if (status != Status::OK)
            {
                return status;
            }
        }
        return Status::OK;
    }

    bool Config::loadFromFile(const std::string &filename)
    {
        std::ifstream file(filename);
        if (!file.is_open())
        {
            LOG_ERROR("Failed to open config file: {}", filename);
            return false;
        }

        std::string line;
        while (std::getline(file, line))
        {
            line = trim(line);
            if (line.empty() || line[0] == '#')
            {
                continue;
            }

            const auto pos = line.find('=');
            if (pos == std::string::npos)
            {
                LOG_WARN("Invalid config line: {}", line);
                continue;
            }

            const auto key = line.substr(0, pos);
            const auto status = set(key, line.substr(pos + 1));
            if (status == Status::NOT_FOUND)
            {
                LOG_WARN("Unknown config key: {}", key);
                continue;
            }
            if (status != Status::OK)
            {
                return false;
            }
        }

        LOG_INFO("Configuration loaded from: {}", filename);
        return true;
    }

    bool Config::saveToFile(const std::string &filename) const
    {
        std::ofstream file(filename);
        if (!file.is_open())
        {
            LOG_ERROR("Failed to create config file: {}", filename);
            return false;
        }

        file << "# Ring Rebalance Benchmark Configuration\n";
        file << "# Generated automatically\n\n";

        file << "# Topology\n";
        file << "ring=" << _ring_type << "\n";
        file << "rep=" << _replication << "\n";
        file << "rep_end=" << _replication_end << "\n";
        file << "nodes=" << _nodes << "\n";
        file << "delta=" << _delta << "\n";
        file << "peer_capacity=" << _peer_capacity << "\n\n";

        file << "# Workload\n";
        file << "block_size=" << _block_size << "\n";
        file << "total_data=" << _total_data << "\n";
        file << "rewrite_edge=" << _rewrite_edge << "\n";
        file << "seed=" << _seed << "\n\n";

        file << "# Logging\n";
        file << "log_level=" << _log_level << "\n";

        if (!file.good())
        {
            LOG_ERROR("Error writing to config file: {}", filename);
            return false;
        }

        LOG_INFO("Configuration saved to: {}", filename);
        return true;
    }
} // namespace blockring
