#include <gtest/gtest.h>
#include "conf/document.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace rmqconf;
namespace fs = std::filesystem;

class ConfDocumentIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() / ("rmqconf_test_" + std::to_string(stamp));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write_file(const fs::path& path, const std::string& content) {
        std::ofstream file(path, std::ios::binary);
        file << content;
    }

    std::string read_file(const fs::path& path) {
        std::ifstream file(path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    fs::path dir_;
};

TEST_F(ConfDocumentIoTest, LoadParsesFile) {
    auto path = dir_ / "rabbitmq.conf";
    write_file(path, "# broker\nheartbeat = 60\nlisteners.tcp.default = 5672\n");

    auto doc = ConfDocument::load(path);
    ASSERT_TRUE(doc.has_value()) << to_string(doc.error());
    EXPECT_EQ(doc->get("heartbeat"), "60");
    EXPECT_EQ(doc->get_int("listeners.tcp.default"), 5672);
}

TEST_F(ConfDocumentIoTest, LoadMissingFileIsIoError) {
    auto doc = ConfDocument::load(dir_ / "missing.conf");
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().code, ConfErrorCode::IO_ERROR);
    EXPECT_EQ(doc.error().io, std::errc::no_such_file_or_directory);
    EXPECT_NE(to_string(doc.error()).find("missing.conf"), std::string::npos);
}

TEST_F(ConfDocumentIoTest, LoadDirectoryIsIoError) {
    auto doc = ConfDocument::load(dir_);
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().code, ConfErrorCode::IO_ERROR);
    EXPECT_EQ(doc.error().io, std::errc::is_a_directory);
}

TEST_F(ConfDocumentIoTest, LoadReportsParseErrors) {
    auto path = dir_ / "bad.conf";
    write_file(path, "heartbeat = 60\nbroken line\n");

    auto doc = ConfDocument::load(path);
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().code, ConfErrorCode::PARSE_ERROR);
    EXPECT_EQ(doc.error().line, 2u);
}

TEST_F(ConfDocumentIoTest, SaveWritesRenderedText) {
    auto path = dir_ / "rabbitmq.conf";
    ConfDocument doc;
    doc.set("cluster_name", "my cluster");
    doc.set("heartbeat", "30");

    auto saved = doc.save(path);
    ASSERT_TRUE(saved.has_value()) << to_string(saved.error());
    EXPECT_EQ(read_file(path), "cluster_name = 'my cluster'\nheartbeat = 30\n");
}

TEST_F(ConfDocumentIoTest, SaveLoadRoundTrip) {
    auto path = dir_ / "rabbitmq.conf";
    const std::string original =
        "# Cluster settings\n"
        "cluster_name = 'prod #1'\n"
        "\n"
        "   # keep indentation\n"
        "log.console.level = info  # inline comment is dropped\n";
    write_file(path, original);

    auto doc = ConfDocument::load(path);
    ASSERT_TRUE(doc.has_value());
    doc->set("log.console.level", "debug");
    ASSERT_TRUE(doc->save(path).has_value());

    EXPECT_EQ(read_file(path),
              "# Cluster settings\n"
              "cluster_name = 'prod #1'\n"
              "\n"
              "   # keep indentation\n"
              "log.console.level = debug\n");

    auto reloaded = ConfDocument::load(path);
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->get("cluster_name"), "prod #1");
    EXPECT_EQ(reloaded->get("log.console.level"), "debug");
}

TEST_F(ConfDocumentIoTest, SaveReplacesExistingFileWithoutLeftovers) {
    auto path = dir_ / "rabbitmq.conf";
    write_file(path, "heartbeat = 60\nsome.very.long.old.content = that should disappear entirely\n");

    auto doc = ConfDocument::parse("heartbeat = 10\n");
    ASSERT_TRUE(doc.has_value());
    ASSERT_TRUE(doc->save(path).has_value());
    EXPECT_EQ(read_file(path), "heartbeat = 10\n");

    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(dir_)) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
}

TEST_F(ConfDocumentIoTest, SaveIntoMissingDirectoryFails) {
    ConfDocument doc;
    doc.set("heartbeat", "60");

    auto saved = doc.save(dir_ / "no" / "such" / "dir" / "rabbitmq.conf");
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, ConfErrorCode::IO_ERROR);
    EXPECT_TRUE(saved.error().io);
}

TEST_F(ConfDocumentIoTest, SaveKeepsFilePermissions) {
    auto path = dir_ / "rabbitmq.conf";
    write_file(path, "default_pass = secret\n");
    const auto owner_only = fs::perms::owner_read | fs::perms::owner_write;
    fs::permissions(path, owner_only, fs::perm_options::replace);

    auto doc = ConfDocument::load(path);
    ASSERT_TRUE(doc.has_value());
    doc->set("default_pass", "changed");
    ASSERT_TRUE(doc->save(path).has_value());

    auto mode = fs::status(path).permissions() & fs::perms::mask;
    EXPECT_EQ(mode, owner_only);
    EXPECT_EQ(read_file(path), "default_pass = changed\n");
}

TEST_F(ConfDocumentIoTest, SaveThroughSymlinkUpdatesTarget) {
    auto real = dir_ / "real.conf";
    auto link = dir_ / "link.conf";
    write_file(real, "heartbeat = 60\n");
    fs::create_symlink(real, link);

    auto doc = ConfDocument::load(link);
    ASSERT_TRUE(doc.has_value());
    doc->set("heartbeat", "10");
    ASSERT_TRUE(doc->save(link).has_value());

    EXPECT_TRUE(fs::is_symlink(fs::symlink_status(link)));
    auto reloaded = ConfDocument::load(real);
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded->get("heartbeat"), "10");
    EXPECT_EQ(read_file(link), "heartbeat = 10\n");
}
