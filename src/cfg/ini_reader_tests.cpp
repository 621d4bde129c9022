#include "ini_reader.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace shortid::cfg;

class IniReaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        test_dir = std::filesystem::temp_directory_path() / "shortid_ini_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override { std::filesystem::remove_all(test_dir); }

    void writeTestFile(const std::string &filename, const std::string &content)
    {
        std::ofstream file(test_dir / filename);
        file << content;
    }

    std::filesystem::path getTestFilePath(const std::string &filename) { return test_dir / filename; }

    std::filesystem::path test_dir;
};

TEST_F(IniReaderTest, ParsesSectionsAndKeys)
{
    writeTestFile("basic.ini", R"([general]
log_type = console
log_priority = debug

[generator]
node_id = 01:02:03:04:05:06
worker_id = 3
)");

    ConfigNode root = parseIniFile(getTestFilePath("basic.ini"));

    EXPECT_TRUE(root.isRoot());
    ASSERT_EQ(root.children.size(), 2);

    const ConfigNode *general = root.findChild("general");
    ASSERT_NE(general, nullptr);
    EXPECT_TRUE(general->isSection());
    ASSERT_NE(general->findChild("log_priority"), nullptr);
    EXPECT_EQ(general->findChild("log_priority")->value, "debug");

    const ConfigNode *generator = root.findChild("generator");
    ASSERT_NE(generator, nullptr);
    ASSERT_NE(generator->findChild("node_id"), nullptr);
    EXPECT_EQ(generator->findChild("node_id")->value, "01:02:03:04:05:06");
    EXPECT_TRUE(generator->findChild("node_id")->isValue());
}

TEST_F(IniReaderTest, PreservesFileOrder)
{
    writeTestFile("order.ini", R"([zeta]
b = 1
a = 2

[alpha]
key = value
)");

    ConfigNode root = parseIniFile(getTestFilePath("order.ini"));

    ASSERT_EQ(root.children.size(), 2);
    EXPECT_EQ(root.children[0].key, "zeta");
    EXPECT_EQ(root.children[1].key, "alpha");
    ASSERT_EQ(root.children[0].children.size(), 2);
    EXPECT_EQ(root.children[0].children[0].key, "b");
    EXPECT_EQ(root.children[0].children[1].key, "a");
}

TEST_F(IniReaderTest, GlobalKeysBecomeRootValues)
{
    writeTestFile("global.ini", R"(stray = 1

[generator]
node_id = 01:02:03:04:05:06
)");

    ConfigNode root = parseIniFile(getTestFilePath("global.ini"));

    ASSERT_EQ(root.children.size(), 2);
    EXPECT_TRUE(root.children[0].isValue());
    EXPECT_EQ(root.children[0].key, "stray");
    EXPECT_TRUE(root.children[1].isSection());
}

TEST_F(IniReaderTest, EmptyValueIsKept)
{
    writeTestFile("empty.ini", R"([generator]
clock_sequence_seed =
)");

    ConfigNode root = parseIniFile(getTestFilePath("empty.ini"));
    const ConfigNode *seed = root.findChild("generator")->findChild("clock_sequence_seed");
    ASSERT_NE(seed, nullptr);
    EXPECT_EQ(seed->value, "");
}

TEST_F(IniReaderTest, MissingFileThrows)
{
    EXPECT_THROW(parseIniFile(getTestFilePath("does_not_exist.ini")), std::runtime_error);
}
