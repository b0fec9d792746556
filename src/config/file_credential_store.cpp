/**
 * @file file_credential_store.cpp
 * @brief FileCredentialStore implementation.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#include "soodlink/config/file_credential_store.hpp"
#include "soodlink/proto/saved_server.pb.h"
#include "soodlink/utils/logger.hpp"

#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace soodlink {
namespace config {

namespace fs = std::filesystem;

namespace {

const char* kConfigDirName = "soodlink";
const char* kConfigFileName = "config.json";

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

}  // namespace

FileCredentialStore::FileCredentialStore(std::string path)
    : path_(path.empty() ? defaultPath() : std::move(path))
{}

std::string FileCredentialStore::defaultPath() {
    fs::path base;
    std::string xdg = envOrEmpty("XDG_CONFIG_HOME");
    if (!xdg.empty()) {
        base = fs::path(xdg);
    } else {
        std::string home = envOrEmpty("HOME");
        if (!home.empty()) {
            base = fs::path(home) / ".config";
        } else {
            base = fs::current_path();
        }
    }
    return (base / kConfigDirName / kConfigFileName).string();
}

std::optional<core::SavedServer> FileCredentialStore::loadSavedServer() {
    std::lock_guard<std::mutex> lock(mutex_);

    proto::SavedServerRecord record;
    if (!readRecordLocked(record)) {
        return std::nullopt;
    }
    if (record.core_id().empty()) {
        return std::nullopt;
    }

    core::SavedServer saved;
    saved.server.unique_id = record.core_id();
    saved.server.display_name = record.core_name();
    saved.server.version = record.display_version();
    saved.server.host = record.host();
    saved.server.port = static_cast<uint16_t>(record.port());
    saved.token = record.token();
    return saved;
}

bool FileCredentialStore::saveServer(const core::ServerDescriptor& server,
                                     const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);

    proto::SavedServerRecord record;
    record.set_core_id(server.unique_id);
    record.set_core_name(server.display_name);
    record.set_display_version(server.version);
    record.set_host(server.host);
    record.set_port(server.port);
    record.set_token(token);

    if (!writeRecordLocked(record)) {
        return false;
    }
    LOG_DEBUG("Config", "Saved server {} to {}", server.unique_id, path_);
    return true;
}

bool FileCredentialStore::clearToken(const std::string& uniqueId) {
    std::lock_guard<std::mutex> lock(mutex_);

    proto::SavedServerRecord record;
    if (!readRecordLocked(record) || record.core_id() != uniqueId) {
        // Nothing stored for this server
        return true;
    }
    if (record.token().empty()) {
        return true;
    }

    record.clear_token();
    if (!writeRecordLocked(record)) {
        return false;
    }
    LOG_INFO("Config", "Cleared saved token for {}", uniqueId);
    return true;
}

bool FileCredentialStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        LOG_ERROR("Config", "Cannot remove {}: {}", path_, ec.message());
        return false;
    }
    return true;
}

bool FileCredentialStore::readRecordLocked(proto::SavedServerRecord& record) {
    std::ifstream in(path_, std::ios::in | std::ios::binary);
    if (!in) {
        return false;
    }

    std::stringstream contents;
    contents << in.rdbuf();

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;

    auto status = google::protobuf::util::JsonStringToMessage(contents.str(), &record, options);
    if (!status.ok()) {
        LOG_WARN("Config", "Ignoring unreadable {}: {}", path_, status.ToString());
        record.Clear();
        return false;
    }
    if (record.port() > std::numeric_limits<uint16_t>::max()) {
        LOG_WARN("Config", "Ignoring {}: port {} out of range", path_, record.port());
        record.Clear();
        return false;
    }
    return true;
}

bool FileCredentialStore::writeRecordLocked(const proto::SavedServerRecord& record) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(record, &json, options);
    if (!status.ok()) {
        LOG_ERROR("Config", "Cannot encode saved server: {}", status.ToString());
        return false;
    }

    const fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Config", "Cannot create {}: {}",
                      target.parent_path().string(), ec.message());
            return false;
        }
    }

    const fs::path temp = target.string() + ".tmp";
    {
        std::ofstream out(temp, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!out) {
            LOG_ERROR("Config", "Cannot open {} for writing", temp.string());
            return false;
        }
        out << json;
        out.flush();
        if (!out) {
            LOG_ERROR("Config", "Write to {} failed", temp.string());
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        LOG_ERROR("Config", "Cannot replace {}: {}", path_, ec.message());
        fs::remove(temp, ec);
        return false;
    }
    return true;
}

}  // namespace config
}  // namespace soodlink
