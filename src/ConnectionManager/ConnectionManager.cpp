#include "ConnectionManager.hpp"
#include "../common/debug_log.hpp"

namespace noiselink {

ConnectionManager::ConnectionManager(TransportFactory factory, AudioSink& sink)
    : _factory(std::move(factory))
    , _sink(sink)
    , _state(State::Disconnected)
    , _shutdown(false) {
}

ConnectionManager::~ConnectionManager() {
    Disconnect();
}

void ConnectionManager::SetConnectionConfig(const ConnectionConfig& config) {
    std::lock_guard<std::mutex> lock(_mutex);
    _config = config;
}

bool ConnectionManager::Connect() {
    if (IsConnected()) {
        return true;
    }
    if (_shutdown) {
        NOISELINK_LOG("ConnectionManager: connect refused after shutdown" << NOISELINK_LOG_ENDL);
        return false;
    }

    // Drop a connection whose transport closed underneath us.
    Disconnect();

    std::string failure;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        failure = OpenLocked();
    }
    if (failure.empty()) {
        return true;
    }
    ReportError(failure);
    return false;
}

std::string ConnectionManager::OpenLocked() {
    if (_config.url.empty()) {
        return RecordFailure("connection failure", "no endpoint configured");
    }

    ChangeState(State::Connecting);

    TransportPtr transport = _factory ? _factory() : nullptr;
    if (!transport) {
        return RecordFailure("connection failure", "no transport available");
    }

    {
        std::lock_guard<std::mutex> pendingLock(_pendingMutex);
        _pending = transport;
    }
    NOISELINK_LOG("ConnectionManager: connecting to " << _config.url << NOISELINK_LOG_ENDL);
    bool opened = transport->Open(_config.url);
    {
        std::lock_guard<std::mutex> pendingLock(_pendingMutex);
        _pending.reset();
    }

    if (!opened || _shutdown) {
        std::string error = _shutdown ? "shut down while connecting" : transport->GetLastError();
        transport->Close();
        return RecordFailure("connection failure", error.empty() ? "could not open transport" : error);
    }

    _transport = transport;
    _receiveLoop = std::make_unique<ReceiveLoop>(_transport, _sink, _config.sampleRate, _config.channels);
    _receiveLoop->Start();
    _lastError.clear();

    ChangeState(State::Connected);
    return std::string();
}

void ConnectionManager::Disconnect() {
    {
        std::lock_guard<std::mutex> pendingLock(_pendingMutex);
        if (_pending) {
            _pending->Close();
        }
    }

    std::unique_ptr<ReceiveLoop> loop;
    TransportPtr transport;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        loop = std::move(_receiveLoop);
        transport = std::move(_transport);
        ChangeState(State::Disconnected);
    }

    // Join outside the lock so a sink callback in flight can still finish.
    if (transport) {
        transport->Close();
    }
    if (loop) {
        loop->Stop();
        NOISELINK_LOG("ConnectionManager: disconnected" << NOISELINK_LOG_ENDL);
    }
}

bool ConnectionManager::Send(const Bytes& payload) {
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state != State::Connected || !_transport) {
            _lastError = "not connected";
            return false;
        }
        if (_transport->Send(payload)) {
            return true;
        }
        std::string error = _transport->GetLastError();
        failure = RecordFailure("send failure", error.empty() ? "write failed" : error);
    }
    ReportError(failure);
    return false;
}

void ConnectionManager::Shutdown() {
    _shutdown = true;
    Disconnect();
}

bool ConnectionManager::IsConnected() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _state == State::Connected && _transport && _transport->IsOpen();
}

std::string ConnectionManager::GetLastError() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _lastError;
}

void ConnectionManager::SetStateCallback(StateCallback callback) {
    std::lock_guard<std::mutex> lock(_mutex);
    _stateCallback = std::move(callback);
}

void ConnectionManager::ChangeState(State newState) {
    State oldState = _state.exchange(newState);
    if (oldState != newState && _stateCallback) {
        _stateCallback(newState);
    }
}

std::string ConnectionManager::RecordFailure(const std::string& kind, const std::string& error) {
    _lastError = error;
    ChangeState(State::Failed);
    NOISELINK_ERROR("ConnectionManager: " << kind << ": " << error);
    return kind + ": " + error;
}

void ConnectionManager::ReportError(const std::string& message) {
    try {
        _sink.PushError(message);
    } catch (const std::exception& e) {
        NOISELINK_ERROR("ConnectionManager: sink rejected error event: " << e.what());
    }
}

const char* ToString(ConnectionManager::State state) {
    switch (state) {
        case ConnectionManager::State::Disconnected: return "Disconnected";
        case ConnectionManager::State::Connecting: return "Connecting";
        case ConnectionManager::State::Connected: return "Connected";
        case ConnectionManager::State::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace noiselink
