/**
 * @file file_credential_store.hpp
 * @brief CredentialStore persisted as a small JSON file.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/config/export.hpp"
#include "soodlink/core/credential_store.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace soodlink {

namespace proto {
class SavedServerRecord;
}  // namespace proto

namespace config {

/**
 * @class FileCredentialStore
 * @brief Keeps the last authenticated server and its token on disk.
 *
 * The file holds one SavedServerRecord in JSON form:
 * @code
 * {
 *  "core_id": "...",
 *  "core_name": "Living Room",
 *  "display_version": "2.0",
 *  "host": "192.168.1.20",
 *  "port": 9330,
 *  "token": "..."
 * }
 * @endcode
 *
 * Writes go to a temporary file that is renamed over the target, so a
 * crash never leaves a half written record. A file that cannot be
 * parsed is reported once per read and treated as absent.
 */
class SOODLINK_CONFIG_API FileCredentialStore : public core::CredentialStore {
public:
    /**
     * @param path File to use; empty selects defaultPath().
     */
    explicit FileCredentialStore(std::string path = std::string());

    /**
     * @brief $XDG_CONFIG_HOME/soodlink/config.json, falling back to
     * $HOME/.config/soodlink/config.json.
     */
    static std::string defaultPath();

    std::optional<core::SavedServer> loadSavedServer() override;
    bool saveServer(const core::ServerDescriptor& server, const std::string& token) override;
    bool clearToken(const std::string& uniqueId) override;

    /**
     * @brief Delete the file. True if it is gone afterwards.
     */
    bool clear();

    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::mutex mutex_;

    bool readRecordLocked(proto::SavedServerRecord& record);
    bool writeRecordLocked(const proto::SavedServerRecord& record);
};

}  // namespace config
}  // namespace soodlink
