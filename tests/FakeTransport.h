#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "infra/net/Transport.h"

namespace testing_support {

// Scripted backend shared by every transport a factory hands out.
struct FakeBackend {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> frames;
    std::vector<std::string> written;
    // the first `failConnects` connection attempts throw ConnectFailed
    int failConnects{0};
    // the first `brokenConnects` attempts throw std::runtime_error instead of a transport error
    int brokenConnects{0};
    // once `frames` is empty, read() reports the peer closing instead of timing out
    bool closeWhenDrained{false};
    std::atomic<int> connectAttempts{0};
    std::atomic<int> closes{0};

    void deliver(std::string frame) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            frames.push_back(std::move(frame));
        }
        cv.notify_all();
    }

    std::vector<std::string> writtenFrames() {
        std::lock_guard<std::mutex> lock(mutex);
        return written;
    }
};

class FakeTransport : public infra::net::Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeBackend> backend)
        : backend_(std::move(backend)) {}

    void connect(const infra::net::Endpoint&, std::chrono::milliseconds) override {
        const int attempt = backend_->connectAttempts.fetch_add(1) + 1;
        std::lock_guard<std::mutex> lock(backend_->mutex);
        if (attempt <= backend_->brokenConnects) {
            throw std::runtime_error("certificate store unavailable");
        }
        if (attempt <= backend_->failConnects) {
            throw infra::net::TransportError(infra::net::TransportError::Kind::ConnectFailed, "connection refused");
        }
    }

    infra::net::ReadResult read(std::chrono::milliseconds timeout) override {
        infra::net::ReadResult result;
        std::unique_lock<std::mutex> lock(backend_->mutex);
        if (backend_->frames.empty() && backend_->closeWhenDrained) {
            result.kind = infra::net::ReadResult::Kind::Closed;
            return result;
        }
        if (!backend_->cv.wait_for(lock, timeout, [this]() { return !backend_->frames.empty(); })) {
            result.kind = infra::net::ReadResult::Kind::Timeout;
            return result;
        }
        result.kind = infra::net::ReadResult::Kind::Message;
        result.payload = std::move(backend_->frames.front());
        backend_->frames.pop_front();
        return result;
    }

    void write(const std::string& text) override {
        std::lock_guard<std::mutex> lock(backend_->mutex);
        backend_->written.push_back(text);
    }

    void close(std::chrono::milliseconds) noexcept override { backend_->closes.fetch_add(1); }

private:
    std::shared_ptr<FakeBackend> backend_;
};

inline infra::net::TransportFactory makeFactory(const std::shared_ptr<FakeBackend>& backend) {
    return [backend]() -> std::unique_ptr<infra::net::Transport> { return std::make_unique<FakeTransport>(backend); };
}

inline bool waitForCondition(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return predicate();
}

}  // namespace testing_support
