#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "../AudioSink/AudioSink.hpp"
#include "../ReceiveLoop/ReceiveLoop.hpp"
#include "../Transport/Transport.hpp"

namespace noiselink {

struct ConnectionConfig {
    std::string url;
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
};

// Owns the single live connection of a session and its receive loop.
// A transport exists only while connected; failed attempts are not retried
// until the next Connect().
class ConnectionManager {
public:
    enum class State {
        Disconnected,
        Connecting,
        Connected,
        Failed
    };

    using StateCallback = std::function<void(State)>;

    ConnectionManager(TransportFactory factory, AudioSink& sink);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void SetConnectionConfig(const ConnectionConfig& config);

    // No-op while connected. A stale connection is torn down first.
    bool Connect();
    // Tolerates being called in any state.
    void Disconnect();
    // Requires Connected. Failure marks the connection stale.
    bool Send(const Bytes& payload);

    // Disconnects and refuses every later Connect().
    void Shutdown();

    bool IsConnected() const;
    State GetCurrentState() const { return _state; }
    std::string GetLastError() const;
    bool IsShutdown() const { return _shutdown; }

    void SetStateCallback(StateCallback callback);

private:
    // Caller holds _mutex. Returns the failure message, empty on success.
    std::string OpenLocked();
    void ChangeState(State newState);
    // Caller holds _mutex. Returns the message for ReportError.
    std::string RecordFailure(const std::string& kind, const std::string& error);
    // Never called with _mutex held, so the sink may stop the session.
    void ReportError(const std::string& message);

    TransportFactory _factory;
    AudioSink& _sink;
    ConnectionConfig _config;

    mutable std::mutex _mutex;
    TransportPtr _transport;
    std::unique_ptr<ReceiveLoop> _receiveLoop;
    std::string _lastError;

    // Transport whose handshake is in progress, so Disconnect() can abort it.
    std::mutex _pendingMutex;
    TransportPtr _pending;

    StateCallback _stateCallback;
    std::atomic<State> _state;
    std::atomic<bool> _shutdown;
};

const char* ToString(ConnectionManager::State state);

} // namespace noiselink
