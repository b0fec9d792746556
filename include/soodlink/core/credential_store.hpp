/**
 * @file credential_store.hpp
 * @brief Persistence seam for the last server and its token.
 *
 * @copyright Copyright (c) 2024 SoodLink Contributors
 * @license MIT License
 */

#pragma once

#include "soodlink/core/export.hpp"
#include "soodlink/core/server_descriptor.hpp"

#include <optional>
#include <string>

namespace soodlink {
namespace core {

/**
 * @struct SavedServer
 * @brief The server last authenticated against, with its token.
 *
 * token is empty when it was cleared after a rejection.
 */
struct SOODLINK_CORE_API SavedServer {
    ServerDescriptor server;
    std::string token;
};

/**
 * @class CredentialStore
 * @brief Storage for one saved server record.
 *
 * Implementations report I/O failure by returning false; they log the
 * cause themselves. Calls come from the ConnectionManager's threads
 * while it holds its state lock, so implementations must not call back
 * into the manager.
 */
class SOODLINK_CORE_API CredentialStore {
public:
    virtual ~CredentialStore() = default;

    /**
     * @brief Load the saved server, if any.
     */
    virtual std::optional<SavedServer> loadSavedServer() = 0;

    /**
     * @brief Replace the saved record with this server and token.
     */
    virtual bool saveServer(const ServerDescriptor& server, const std::string& token) = 0;

    /**
     * @brief Forget the token saved for uniqueId. No-op for other ids.
     */
    virtual bool clearToken(const std::string& uniqueId) = 0;
};

}  // namespace core
}  // namespace soodlink
