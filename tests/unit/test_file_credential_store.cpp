/**
 * @file test_file_credential_store.cpp
 * @brief Unit tests for the JSON file backed credential store
 */

#include <gtest/gtest.h>
#include <soodlink/config/file_credential_store.hpp>
#include <soodlink/utils/uuid.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

using namespace soodlink::config;
using soodlink::core::SavedServer;
using soodlink::core::ServerDescriptor;
namespace fs = std::filesystem;

class FileCredentialStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("soodlink-test-" + soodlink::utils::UUIDGenerator::generate());
        path_ = (root_ / "nested" / "config.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    void writeFile(const std::string& contents) {
        fs::create_directories(fs::path(path_).parent_path());
        std::ofstream out(path_);
        out << contents;
    }

    std::string readFile() const {
        std::ifstream in(path_);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path root_;
    std::string path_;
    ServerDescriptor server_{"a1b2c3", "Living Room", "192.168.1.20", 9330, "2.0"};
};

TEST_F(FileCredentialStoreTest, MissingFileMeansNothingSaved) {
    FileCredentialStore store(path_);
    EXPECT_EQ(store.path(), path_);
    EXPECT_FALSE(store.loadSavedServer().has_value());
}

TEST_F(FileCredentialStoreTest, SaveCreatesDirectoryAndLoadsBack) {
    FileCredentialStore store(path_);
    ASSERT_TRUE(store.saveServer(server_, "tok123"));
    EXPECT_TRUE(fs::exists(path_));

    // A fresh instance reads what the first one wrote
    FileCredentialStore reopened(path_);
    std::optional<SavedServer> saved = reopened.loadSavedServer();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->server, server_);
    EXPECT_EQ(saved->token, "tok123");
}

TEST_F(FileCredentialStoreTest, FileUsesSnakeCaseKeys) {
    FileCredentialStore store(path_);
    ASSERT_TRUE(store.saveServer(server_, "tok123"));

    std::string json = readFile();
    EXPECT_NE(json.find("\"core_id\""), std::string::npos) << json;
    EXPECT_NE(json.find("\"core_name\""), std::string::npos) << json;
    EXPECT_NE(json.find("\"display_version\""), std::string::npos) << json;
    EXPECT_NE(json.find("\"host\""), std::string::npos) << json;
    EXPECT_NE(json.find("9330"), std::string::npos) << json;
    EXPECT_NE(json.find("\"token\""), std::string::npos) << json;
    EXPECT_FALSE(fs::exists(path_ + ".tmp"));
}

TEST_F(FileCredentialStoreTest, ReadsHandWrittenFileIgnoringUnknownKeys) {
    writeFile(R"({
        "core_id": "x9",
        "core_name": "Studio",
        "host": "10.0.0.8",
        "port": 9100,
        "token": "abc",
        "paired_at": "2024-03-01"
    })");

    FileCredentialStore store(path_);
    std::optional<SavedServer> saved = store.loadSavedServer();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->server.unique_id, "x9");
    EXPECT_EQ(saved->server.display_name, "Studio");
    EXPECT_EQ(saved->server.host, "10.0.0.8");
    EXPECT_EQ(saved->server.port, 9100);
    EXPECT_TRUE(saved->server.version.empty());
    EXPECT_EQ(saved->token, "abc");
}

TEST_F(FileCredentialStoreTest, CorruptFileIsTreatedAsEmpty) {
    writeFile("{ this is not json");

    FileCredentialStore store(path_);
    EXPECT_FALSE(store.loadSavedServer().has_value());

    // Saving replaces the corrupt file
    ASSERT_TRUE(store.saveServer(server_, "tok"));
    EXPECT_TRUE(store.loadSavedServer().has_value());
}

TEST_F(FileCredentialStoreTest, RecordWithoutIdIsIgnored) {
    writeFile(R"({"core_name": "Nameless", "host": "10.0.0.8", "port": 9100})");

    FileCredentialStore store(path_);
    EXPECT_FALSE(store.loadSavedServer().has_value());
}

TEST_F(FileCredentialStoreTest, OutOfRangePortIsIgnored) {
    writeFile(R"({"core_id": "x9", "host": "10.0.0.8", "port": 70000})");

    FileCredentialStore store(path_);
    EXPECT_FALSE(store.loadSavedServer().has_value());
}

TEST_F(FileCredentialStoreTest, SaveReplacesPreviousRecord) {
    FileCredentialStore store(path_);
    ASSERT_TRUE(store.saveServer(server_, "old"));

    ServerDescriptor other("d4e5f6", "Kitchen", "192.168.1.21", 9331);
    ASSERT_TRUE(store.saveServer(other, "new"));

    std::optional<SavedServer> saved = store.loadSavedServer();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->server, other);
    EXPECT_EQ(saved->token, "new");
}

TEST_F(FileCredentialStoreTest, ClearTokenKeepsServer) {
    FileCredentialStore store(path_);
    ASSERT_TRUE(store.saveServer(server_, "tok123"));

    ASSERT_TRUE(store.clearToken("a1b2c3"));

    std::optional<SavedServer> saved = store.loadSavedServer();
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(saved->server, server_);
    EXPECT_TRUE(saved->token.empty());
}

TEST_F(FileCredentialStoreTest, ClearTokenForOtherServerIsNoOp) {
    FileCredentialStore store(path_);
    ASSERT_TRUE(store.saveServer(server_, "tok123"));

    EXPECT_TRUE(store.clearToken("someone-else"));
    EXPECT_EQ(store.loadSavedServer()->token, "tok123");
}

TEST_F(FileCredentialStoreTest, ClearTokenWithoutFileSucceeds) {
    FileCredentialStore store(path_);
    EXPECT_TRUE(store.clearToken("a1b2c3"));
    EXPECT_FALSE(fs::exists(path_));
}

TEST_F(FileCredentialStoreTest, ClearRemovesFile) {
    FileCredentialStore store(path_);
    ASSERT_TRUE(store.saveServer(server_, "tok123"));

    EXPECT_TRUE(store.clear());
    EXPECT_FALSE(fs::exists(path_));
    EXPECT_FALSE(store.loadSavedServer().has_value());

    // Already gone
    EXPECT_TRUE(store.clear());
}

TEST_F(FileCredentialStoreTest, SaveFailsWhenDirectoryIsAFile) {
    fs::create_directories(root_);
    std::ofstream(root_ / "blocker") << "x";

    FileCredentialStore store((root_ / "blocker" / "config.json").string());
    EXPECT_FALSE(store.saveServer(server_, "tok"));
}

// =============================================================================
// Default location
// =============================================================================

class DefaultPathTest : public ::testing::Test {
protected:
    void SetUp() override {
        save("XDG_CONFIG_HOME", xdg_);
        save("HOME", home_);
    }

    void TearDown() override {
        restore("XDG_CONFIG_HOME", xdg_);
        restore("HOME", home_);
    }

    static void save(const char* name, std::optional<std::string>& slot) {
        const char* value = std::getenv(name);
        if (value) slot = value;
    }

    static void restore(const char* name, const std::optional<std::string>& slot) {
        if (slot) {
            ::setenv(name, slot->c_str(), 1);
        } else {
            ::unsetenv(name);
        }
    }

    std::optional<std::string> xdg_;
    std::optional<std::string> home_;
};

TEST_F(DefaultPathTest, PrefersXdgConfigHome) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    ::setenv("HOME", "/home/listener", 1);
    EXPECT_EQ(FileCredentialStore::defaultPath(), "/tmp/xdg/soodlink/config.json");
}

TEST_F(DefaultPathTest, FallsBackToHome) {
    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", "/home/listener", 1);
    EXPECT_EQ(FileCredentialStore::defaultPath(), "/home/listener/.config/soodlink/config.json");

    // An empty XDG_CONFIG_HOME counts as unset
    ::setenv("XDG_CONFIG_HOME", "", 1);
    EXPECT_EQ(FileCredentialStore::defaultPath(), "/home/listener/.config/soodlink/config.json");
}

TEST_F(DefaultPathTest, EmptyPathSelectsDefault) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    FileCredentialStore store;
    EXPECT_EQ(store.path(), "/tmp/xdg/soodlink/config.json");
}
