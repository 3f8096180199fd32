#pragma once

#include "AudioSink/CollectingSink.hpp"
#include "Transport/Transport.hpp"
#include "common/AudioUnit.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_utils {

namespace nl = noiselink;

class MockTransport;

// Shared switches and bookkeeping for every transport a test creates.
struct MockNetwork {
    std::atomic<bool> failOpen{false};
    std::atomic<bool> failSend{false};
    // Loops every sent payload back as a received chunk.
    std::atomic<bool> echo{true};
    std::atomic<size_t> openAttempts{0};

    std::mutex mutex;
    std::vector<std::string> urls;
    std::vector<nl::Bytes> sent;
    std::vector<std::shared_ptr<MockTransport>> created;

    nl::TransportFactory Factory();
    std::shared_ptr<MockTransport> Last();

    size_t CreatedCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return created.size();
    }

    size_t SendCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return sent.size();
    }

    size_t SentBytes() {
        std::lock_guard<std::mutex> lock(mutex);
        size_t total = 0;
        for (const auto& payload : sent) {
            total += payload.size();
        }
        return total;
    }
};

class MockTransport : public nl::Transport {
public:
    explicit MockTransport(MockNetwork& network) : _network(network) {}

    bool Open(const std::string& url) override {
        _network.openAttempts += 1;
        {
            std::lock_guard<std::mutex> lock(_network.mutex);
            _network.urls.push_back(url);
        }
        std::lock_guard<std::mutex> lock(_mutex);
        if (_network.failOpen) {
            _error = "connection refused";
            return false;
        }
        _open = true;
        return true;
    }

    bool Send(const nl::Bytes& payload) override {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_open) {
                _error = "not open";
                return false;
            }
            if (_network.failSend) {
                _error = "broken pipe";
                return false;
            }
        }
        {
            std::lock_guard<std::mutex> lock(_network.mutex);
            _network.sent.push_back(payload);
        }
        if (_network.echo) {
            Feed(payload);
        }
        return true;
    }

    std::optional<nl::Bytes> Receive() override {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this]() { return _closed || !_incoming.empty(); });
        if (_cancelled || _incoming.empty()) {
            return std::nullopt;
        }
        nl::Bytes chunk = std::move(_incoming.front());
        _incoming.pop_front();
        return chunk;
    }

    void Close() override {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _open = false;
            _closed = true;
            _cancelled = true;
            _incoming.clear();
        }
        _cv.notify_all();
    }

    bool IsOpen() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _open;
    }

    std::string GetLastError() const override {
        std::lock_guard<std::mutex> lock(_mutex);
        return _error;
    }

    // Delivers a chunk as if the endpoint had sent it.
    void Feed(nl::Bytes chunk) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_cancelled) {
                return;
            }
            _incoming.push_back(std::move(chunk));
        }
        _cv.notify_all();
    }

    // The endpoint hangs up; queued chunks are still delivered.
    void RemoteClose() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _open = false;
            _closed = true;
            _error = "closed by peer";
        }
        _cv.notify_all();
    }

private:
    MockNetwork& _network;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<nl::Bytes> _incoming;
    bool _open = false;
    bool _closed = false;
    bool _cancelled = false;
    std::string _error;
};

inline nl::TransportFactory MockNetwork::Factory() {
    return [this]() -> nl::TransportPtr {
        auto transport = std::make_shared<MockTransport>(*this);
        std::lock_guard<std::mutex> lock(mutex);
        created.push_back(transport);
        return transport;
    };
}

inline std::shared_ptr<MockTransport> MockNetwork::Last() {
    std::lock_guard<std::mutex> lock(mutex);
    return created.empty() ? nullptr : created.back();
}

inline nl::Bytes MakeBytes(size_t size, uint8_t seed = 0) {
    nl::Bytes bytes(size);
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::byte>((i + seed) & 0xFF);
    }
    return bytes;
}

inline nl::Bytes MakeTagged(char tag, size_t size = 4) {
    return nl::Bytes(size, static_cast<std::byte>(tag));
}

inline bool WaitFor(const std::function<bool()>& predicate,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto start = std::chrono::steady_clock::now();
    while (!predicate()) {
        if (std::chrono::steady_clock::now() - start > timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// Collects like CollectingSink, then runs a hook. Hooks let a test call back
// into the session from inside the sink.
class HookedSink : public nl::CollectingSink {
public:
    std::function<void()> onAudio;
    std::function<void()> onError;

    void PushAudio(nl::OutputUnit unit) override {
        nl::CollectingSink::PushAudio(std::move(unit));
        if (onAudio) {
            onAudio();
        }
    }

    void PushError(const std::string& message) override {
        nl::CollectingSink::PushError(message);
        if (onError) {
            onError();
        }
    }
};

// Runs the body on its own thread. A body that deadlocks cannot be joined,
// so a timeout ends the whole test executable.
inline bool FinishesWithin(const std::function<bool()>& body,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto done = std::make_shared<std::promise<bool>>();
    std::future<bool> result = done->get_future();
    std::thread([body, done]() {
        try {
            done->set_value(body());
        } catch (...) {
            done->set_exception(std::current_exception());
        }
    }).detach();

    if (result.wait_for(timeout) != std::future_status::ready) {
        std::cerr << "  did not finish within " << timeout.count() << " ms, deadlocked" << std::endl;
        std::_Exit(1);
    }
    return result.get();
}

// Runs named checks and reports like the rest of the suite: progress on
// stdout, failures on stderr, non-zero exit on any failure.
class TestRunner {
public:
    explicit TestRunner(std::string suite) : _suite(std::move(suite)) {
        std::cout << "=== " << _suite << " ===" << std::endl;
    }

    void Run(const std::string& name, const std::function<bool()>& test) {
        bool passed = false;
        try {
            passed = test();
        } catch (const std::exception& e) {
            std::cerr << "  unexpected exception: " << e.what() << std::endl;
        }
        if (passed) {
            std::cout << "[ OK ] " << name << std::endl;
        } else {
            std::cerr << "[FAIL] " << name << std::endl;
            ++_failures;
        }
    }

    int Finish() const {
        if (_failures > 0) {
            std::cerr << _suite << ": " << _failures << " test(s) failed" << std::endl;
            return 1;
        }
        std::cout << _suite << ": all tests passed" << std::endl;
        return 0;
    }

private:
    std::string _suite;
    int _failures = 0;
};

} // namespace test_utils

#define CHECK(cond)                                                              \
    do {                                                                         \
        if (!(cond)) {                                                           \
            std::cerr << "  " << __FILE__ << ":" << __LINE__ << ": check failed: " \
                      << #cond << std::endl;                                     \
            return false;                                                        \
        }                                                                        \
    } while (0)
