#include <iostream>
#include <string>
#include <vector>

#include "bench/simulation.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include "common/types.hpp"

using namespace blockring;

void printUsage(const char *program)
{
    std::cout << "Usage: " << program << R"( [--key=value ...]

Simulates a ring topology change and reports how many block replicas move.

Options:
  --config=FILE        load key=value settings from FILE
  --ring=TYPE          ring type: empty, single, mod, ketama (default mod)
  --rep=N              starting replication (default 2)
  --rep-end=N          target replication, 0 = same as start (default 0)
  --nodes=N            number of peers to start with (default 5)
  --delta=N            peers to add (positive) or remove (negative) (default 2)
  --block-size=SIZE    block size (default 256KiB)
  --total-data=SIZE    total data simulated (default 1TiB)
  --rewrite-edge=PCT   percentage of files with small rewrites (default 40)
  --seed=N             random seed for peers and workload (default 1)
  --peer-capacity=N    blocks per simulated peer (default 100Gi)
  --log-level=LEVEL    debug, info, warn or error (default info)
)";
}

int main(int argc, char *argv[])
{
    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto &arg : args)
    {
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
    }

    Config config;
    if (config.parseArgs(args) != Status::OK)
    {
        std::cerr << "invalid arguments; see " << argv[0] << " --help" << std::endl;
        return 1;
    }

    LogLevel level = LogLevel::INFO;
    if (logLevelFromString(config.getLogLevel(), level))
    {
        Logger::getInstance().setLevel(level);
    }

    const auto status = runSimulation(config, std::cout);
    if (status != Status::OK)
    {
        std::cerr << "ringtool failed: " << statusToString(status) << std::endl;
        return 1;
    }
    return 0;
}
