/**
 * @file connection_fakes.hpp
 * @brief Test doubles for the ConnectionManager collaborators.
 */

#pragma once

#include <gmock/gmock.h>

#include <soodlink/core/connection_manager.hpp>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace soodlink {
namespace test_support {

using namespace std::chrono_literals;

class MockCredentialStore : public core::CredentialStore {
public:
    MOCK_METHOD(std::optional<core::SavedServer>, loadSavedServer, (), (override));
    MOCK_METHOD(bool, saveServer, (const core::ServerDescriptor&, const std::string&), (override));
    MOCK_METHOD(bool, clearToken, (const std::string&), (override));
};

/**
 * @brief What the test sees of one transport, alive past its destruction.
 */
struct TransportPeer {
    std::string host;
    uint16_t port = 0;
    core::TransportEventSink sink;

    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::atomic<bool> destroyed{false};

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::optional<std::string>> authRequests;

    /// Raise an event as the network side would
    void emit(core::TransportEvent event) {
        sink(std::move(event));
    }

    bool waitForAuthRequests(size_t count, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this, count]() { return authRequests.size() >= count; });
    }

    std::vector<std::optional<std::string>> requests() {
        std::lock_guard<std::mutex> lock(mutex);
        return authRequests;
    }
};

class FakeTransport : public core::SessionTransport {
public:
    FakeTransport(std::shared_ptr<TransportPeer> peer, bool throwOnOpen)
        : peer_(std::move(peer))
        , throwOnOpen_(throwOnOpen)
    {}

    ~FakeTransport() override {
        peer_->destroyed.store(true);
    }

    void open() override {
        peer_->opens++;
        if (throwOnOpen_) {
            throw std::runtime_error("connection refused");
        }
    }

    void sendAuthRequest(const std::optional<std::string>& savedToken) override {
        {
            std::lock_guard<std::mutex> lock(peer_->mutex);
            peer_->authRequests.push_back(savedToken);
        }
        peer_->cv.notify_all();
    }

    void close() override {
        peer_->closes++;
    }

private:
    std::shared_ptr<TransportPeer> peer_;
    bool throwOnOpen_;
};

/**
 * @brief Builds FakeTransports and keeps a peer for each one.
 */
class FakeTransportFactory {
public:
    bool throwOnOpen = false;
    bool returnNull = false;

    core::TransportFactory factory() {
        return [this](const std::string& host, uint16_t port, core::TransportEventSink sink)
                   -> std::unique_ptr<core::SessionTransport> {
            auto peer = std::make_shared<TransportPeer>();
            peer->host = host;
            peer->port = port;
            peer->sink = std::move(sink);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                peers_.push_back(peer);
            }
            if (returnNull) {
                return nullptr;
            }
            return std::make_unique<FakeTransport>(peer, throwOnOpen);
        };
    }

    size_t created() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_.size();
    }

    std::shared_ptr<TransportPeer> last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return peers_.empty() ? nullptr : peers_.back();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<TransportPeer>> peers_;
};

/**
 * @brief Canned discovery results; can hold a round open until released.
 */
class FakeDiscovery : public core::ServerDiscovery {
public:
    std::vector<core::ServerDescriptor> result;
    bool fail = false;

    std::vector<core::ServerDescriptor> discover(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        lastTimeout_ = timeout;
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this]() { return !held_; });

        if (fail) {
            throw core::DiscoveryError("Cannot bind discovery socket", EADDRNOTAVAIL);
        }
        return result;
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
        entered_ = false;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    bool waitEntered(std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return entered_; });
    }

    std::chrono::milliseconds lastTimeout() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastTimeout_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    bool entered_ = false;
    std::chrono::milliseconds lastTimeout_{0};
};

/**
 * @brief Observer that records every notification.
 */
class StatusRecorder {
public:
    core::StatusObserver observer() {
        return [this](const core::ConnectionStatus& status) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                statuses_.push_back(status);
            }
            cv_.notify_all();
        };
    }

    bool waitForCount(size_t count, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, count]() { return statuses_.size() >= count; });
    }

    bool waitForState(core::ConnectionState state, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this, state]() {
            return !statuses_.empty() && statuses_.back().state == state;
        });
    }

    std::vector<core::ConnectionState> states() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<core::ConnectionState> result;
        for (const auto& status : statuses_) {
            result.push_back(status.state);
        }
        return result;
    }

    std::vector<core::ConnectionStatus> statuses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_;
    }

    core::ConnectionStatus last() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return statuses_.empty() ? core::ConnectionStatus() : statuses_.back();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<core::ConnectionStatus> statuses_;
};

}  // namespace test_support
}  // namespace soodlink
