#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include "common/config.hpp"

using namespace blockring;

class ConfigTest : public ::testing::Test
{
protected:
    Config _config;

    void TearDown() override
    {
        // Clean up test files
        std::filesystem::remove("test_ringtool.conf");
        std::filesystem::remove("invalid_ringtool.conf");
    }
};

TEST_F(ConfigTest, DefaultValues)
{
    EXPECT_EQ(_config.getRingType(), "mod");
    EXPECT_EQ(_config.getReplication(), 2u);
    EXPECT_EQ(_config.getReplicationEnd(), 0u);
    EXPECT_EQ(_config.effectiveReplicationEnd(), 2u);
    EXPECT_EQ(_config.getNodes(), 5);
    EXPECT_EQ(_config.getDelta(), 2);
    EXPECT_EQ(_config.getBlockSize(), "256KiB");
    EXPECT_EQ(_config.getTotalData(), "1TiB");
    EXPECT_EQ(_config.getRewriteEdge(), 40);
    EXPECT_EQ(_config.getSeed(), 1u);
    EXPECT_EQ(_config.getLogLevel(), "info");

    EXPECT_EQ(_config.blockSizeBytes().value(), 256u * 1024);
    EXPECT_EQ(_config.totalDataBytes().value(), 1ULL << 40);
}

TEST_F(ConfigTest, SetKnownKeys)
{
    EXPECT_EQ(_config.set("ring", "ketama"), Status::OK);
    EXPECT_EQ(_config.set("rep", "3"), Status::OK);
    EXPECT_EQ(_config.set("rep_end", "1"), Status::OK);
    EXPECT_EQ(_config.set("nodes", "10"), Status::OK);
    EXPECT_EQ(_config.set("delta", "-4"), Status::OK);
    EXPECT_EQ(_config.set(" block_size ", " 4MiB "), Status::OK);
    EXPECT_EQ(_config.set("seed", "99"), Status::OK);

    EXPECT_EQ(_config.getRingType(), "ketama");
    EXPECT_EQ(_config.getReplication(), 3u);
    EXPECT_EQ(_config.effectiveReplicationEnd(), 1u);
    EXPECT_EQ(_config.getNodes(), 10);
    EXPECT_EQ(_config.getDelta(), -4);
    EXPECT_EQ(_config.blockSizeBytes().value(), 4u << 20);
    EXPECT_EQ(_config.getSeed(), 99u);
}

TEST_F(ConfigTest, SetRejectsBadValues)
{
    EXPECT_EQ(_config.set("no_such_key", "1"), Status::NOT_FOUND);
    EXPECT_EQ(_config.set("nodes", "five"), Status::INVALID_ARGUMENT);
    EXPECT_EQ(_config.set("nodes", "5x"), Status::INVALID_ARGUMENT);
    EXPECT_EQ(_config.set("nodes", "-1"), Status::INVALID_ARGUMENT);
    EXPECT_EQ(_config.set("rep", "-2"), Status::INVALID_ARGUMENT);
    EXPECT_EQ(_config.set("log_level", "chatty"), Status::INVALID_ARGUMENT);

    // failed sets leave the previous value in place
    EXPECT_EQ(_config.getNodes(), 5);
    EXPECT_EQ(_config.getReplication(), 2u);
    EXPECT_EQ(_config.getLogLevel(), "info");
}

TEST_F(ConfigTest, ByteSizesAreValidatedOnUse)
{
    _config.setBlockSize("0");
    EXPECT_EQ(_config.blockSizeBytes().status(), Status::INVALID_ARGUMENT);

    _config.setTotalData("lots");
    EXPECT_EQ(_config.totalDataBytes().status(), Status::INVALID_ARGUMENT);
}

TEST_F(ConfigTest, ParseArgs)
{
    EXPECT_EQ(_config.parseArgs({"--ring=ketama", "--rep-end=3", "--total-data=10GiB", "--delta=-1"}), Status::OK);
    EXPECT_EQ(_config.getRingType(), "ketama");
    EXPECT_EQ(_config.getReplicationEnd(), 3u);
    EXPECT_EQ(_config.totalDataBytes().value(), 10ULL << 30);
    EXPECT_EQ(_config.getDelta(), -1);

    EXPECT_EQ(_config.parseArgs({}), Status::OK);
    EXPECT_EQ(_config.parseArgs({"ring=mod"}), Status::INVALID_ARGUMENT);
    EXPECT_EQ(_config.parseArgs({"--ring"}), Status::INVALID_ARGUMENT);
    EXPECT_EQ(_config.parseArgs({"--bogus=1"}), Status::INVALID_ARGUMENT);
    EXPECT_EQ(_config.parseArgs({"--nodes=many"}), Status::INVALID_ARGUMENT);
    EXPECT_EQ(_config.parseArgs({"--config=non_existent_file.conf"}), Status::INVALID_ARGUMENT);
}

TEST_F(ConfigTest, SaveToFile)
{
    _config.setRingType("ketama");
    _config.setNodes(12);
    _config.setDelta(-3);
    _config.setTotalData("2TiB");

    const std::string filename = "test_ringtool.conf";
    EXPECT_TRUE(_config.saveToFile(filename));

    std::ifstream file(filename);
    ASSERT_TRUE(file.is_open());

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    EXPECT_NE(content.find("ring=ketama"), std::string::npos);
    EXPECT_NE(content.find("nodes=12"), std::string::npos);
    EXPECT_NE(content.find("delta=-3"), std::string::npos);
    EXPECT_NE(content.find("total_data=2TiB"), std::string::npos);
    EXPECT_NE(content.find("log_level=info"), std::string::npos);
}

TEST_F(ConfigTest, LoadFromFile)
{
    const std::string filename = "test_ringtool.conf";

    std::ofstream file(filename);
    ASSERT_TRUE(file.is_open());

    file << "# Test configuration file\n";
    file << "ring=single\n";
    file << "rep=1\n";
    file << "nodes=1\n";
    file << "delta=0\n";
    file << "block_size=1MiB\n";
    file << "\n";
    file << "line_without_equals\n";
    file << "unknown_knob=3\n";
    file.close();

    EXPECT_TRUE(_config.loadFromFile(filename));

    EXPECT_EQ(_config.getRingType(), "single");
    EXPECT_EQ(_config.getReplication(), 1u);
    EXPECT_EQ(_config.getNodes(), 1);
    EXPECT_EQ(_config.getDelta(), 0);
    EXPECT_EQ(_config.blockSizeBytes().value(), 1u << 20);

    EXPECT_EQ(_config.parseArgs({"--config=" + filename, "--nodes=4"}), Status::OK);
    EXPECT_EQ(_config.getNodes(), 4);
}

TEST_F(ConfigTest, LoadFromNonExistentFile)
{
    EXPECT_FALSE(_config.loadFromFile("non_existent_file.conf"));
}

TEST_F(ConfigTest, LoadInvalidConfigFile)
{
    const std::string filename = "invalid_ringtool.conf";

    std::ofstream file(filename);
    ASSERT_TRUE(file.is_open());

    file << "nodes=invalid_number\n";
    file.close();

    EXPECT_FALSE(_config.loadFromFile(filename));
}

TEST_F(ConfigTest, SaveAndLoadRoundTrip)
{
    _config.setRingType("ketama");
    _config.setReplication(3);
    _config.setReplicationEnd(2);
    _config.setNodes(20);
    _config.setDelta(-5);
    _config.setBlockSize("64KiB");
    _config.setRewriteEdge(10);
    _config.setSeed(12345);
    _config.setPeerCapacity(1000);
    _config.setLogLevel("warn");

    const std::string filename = "test_ringtool.conf";
    EXPECT_TRUE(_config.saveToFile(filename));

    Config loaded;
    EXPECT_TRUE(loaded.loadFromFile(filename));

    EXPECT_EQ(loaded.getRingType(), "ketama");
    EXPECT_EQ(loaded.getReplication(), 3u);
    EXPECT_EQ(loaded.getReplicationEnd(), 2u);
    EXPECT_EQ(loaded.getNodes(), 20);
    EXPECT_EQ(loaded.getDelta(), -5);
    EXPECT_EQ(loaded.getBlockSize(), "64KiB");
    EXPECT_EQ(loaded.getTotalData(), "1TiB");
    EXPECT_EQ(loaded.getRewriteEdge(), 10);
    EXPECT_EQ(loaded.getSeed(), 12345u);
    EXPECT_EQ(loaded.getPeerCapacity(), 1000u);
    EXPECT_EQ(loaded.getLogLevel(), "warn");
}
