#include "DenoiseOrchestrator.hpp"
#include "../Transport/WebSocketTransport.hpp"
#include "../common/debug_log.hpp"

#include <chrono>
#include <exception>

namespace noiselink {

DenoiseOrchestrator::DenoiseOrchestrator(SessionConfig config, AudioSink& sink)
    : DenoiseOrchestrator(config, sink,
                          MakeWebSocketTransportFactory(std::chrono::milliseconds(config.connectTimeoutMs))) {
}

DenoiseOrchestrator::DenoiseOrchestrator(SessionConfig config, AudioSink& sink, TransportFactory factory)
    : _config(std::move(config))
    , _sink(sink)
    , _tracker(_config.passthrough)
    , _connection(std::make_unique<ConnectionManager>(std::move(factory), sink))
    , _state(State::Uninitialized) {
}

DenoiseOrchestrator::~DenoiseOrchestrator() {
    Cancel();
}

bool DenoiseOrchestrator::Start(unsigned int sampleRate, unsigned int channels) {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state != State::Uninitialized) {
            NOISELINK_ERROR("DenoiseOrchestrator: cannot start from state " << ToString(_state));
            return false;
        }

        _tracker.Configure(sampleRate, channels);
        _accumulator = std::make_unique<AudioAccumulator>(sampleRate, _config.accumulationWindowSeconds);

        ConnectionConfig connectionConfig;
        connectionConfig.url = BuildEndpointUrl(_config, sampleRate);
        connectionConfig.sampleRate = sampleRate;
        connectionConfig.channels = channels;
        _connection->SetConnectionConfig(connectionConfig);

        State expected = State::Uninitialized;
        if (!_state.compare_exchange_strong(expected, State::Started)) {
            NOISELINK_LOG("DenoiseOrchestrator: cancelled during start" << NOISELINK_LOG_ENDL);
            return false;
        }
    }

    NOISELINK_LOG("DenoiseOrchestrator: started " << sampleRate << " Hz / " << channels << " ch"
                  << (_tracker.IsPassthrough() ? " (passthrough)" : "") << NOISELINK_LOG_ENDL);

    if (!_tracker.IsPassthrough()) {
        // Failure is logged and reported by the connection manager and retried lazily.
        _connection->Connect();
    }
    return true;
}

void DenoiseOrchestrator::ProcessInput(const InputUnit& unit) {
    Bytes batch;
    std::unique_lock<std::mutex> sendLock(_sendMutex, std::defer_lock);
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_state != State::Started) {
            NOISELINK_LOG("DenoiseOrchestrator: dropping " << unit.size << " bytes in state " << ToString(_state) << NOISELINK_LOG_ENDL);
            return;
        }

        _tracker.Validate(unit.sampleRate, unit.channels);

        if (_tracker.IsMuted()) {
            return;
        }

        if (_tracker.IsPassthrough()) {
            batch.assign(unit.data, unit.data + unit.size);
        } else {
            _accumulator->Accumulate(unit.data, unit.size);
            if (!_accumulator->ShouldFlush()) {
                return;
            }
            batch = _accumulator->Flush();
            if (batch.empty()) {
                return;
            }
            // Taken before _mutex is released so windows go out in flush order.
            sendLock.lock();
        }
    }

    // The sink is only ever called with no lock held, so it may stop or cancel the session.
    if (!sendLock.owns_lock()) {
        Emit(std::move(batch));
        return;
    }

    bool delivered = SendWindow(batch);
    sendLock.unlock();
    // Skipped when the sink stopped the session while the window was failing.
    if (!delivered && _config.fallbackPassthrough && _state == State::Started) {
        Emit(std::move(batch));
    }
}

void DenoiseOrchestrator::SetMuted(bool muted) {
    _tracker.SetMuted(muted);
    NOISELINK_LOG("DenoiseOrchestrator: " << (muted ? "muted" : "unmuted") << NOISELINK_LOG_ENDL);
}

bool DenoiseOrchestrator::Stop() {
    State expected = State::Started;
    if (!_state.compare_exchange_strong(expected, State::Stopped)) {
        NOISELINK_ERROR("DenoiseOrchestrator: cannot stop from state " << ToString(expected));
        return false;
    }

    _connection->Shutdown();

    std::lock_guard<std::mutex> lock(_mutex);
    if (_accumulator) {
        NOISELINK_LOG("DenoiseOrchestrator: stopped, discarding " << _accumulator->GetTotalBytes() << " bytes" << NOISELINK_LOG_ENDL);
        _accumulator->Discard();
    }
    return true;
}

void DenoiseOrchestrator::Cancel() {
    if (_state.exchange(State::Cancelled) == State::Cancelled) {
        return;
    }

    // Aborts a handshake or read in progress on another thread.
    _connection->Shutdown();

    std::lock_guard<std::mutex> lock(_mutex);
    if (_accumulator) {
        _accumulator->Discard();
    }
    NOISELINK_LOG("DenoiseOrchestrator: cancelled" << NOISELINK_LOG_ENDL);
}

void DenoiseOrchestrator::Handle(const Message& message) {
    if (std::holds_alternative<AudioChunk>(message)) {
        const auto& chunk = std::get<AudioChunk>(message);
        ProcessInput(MakeInputUnit(chunk.data, chunk.sampleRate, chunk.channels));
    } else if (std::holds_alternative<MuteControl>(message)) {
        SetMuted(std::get<MuteControl>(message).muted);
    } else {
        const auto& lifecycle = std::get<Lifecycle>(message);
        switch (lifecycle.kind) {
            case Lifecycle::Kind::Start:
                Start(lifecycle.sampleRate, lifecycle.channels);
                break;
            case Lifecycle::Kind::Stop:
                Stop();
                break;
            case Lifecycle::Kind::Cancel:
                Cancel();
                break;
        }
    }
}

size_t DenoiseOrchestrator::GetBufferedBytes() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _accumulator ? _accumulator->GetTotalBytes() : 0;
}

bool DenoiseOrchestrator::SendWindow(const Bytes& batch) {
    if (!_connection->IsConnected() && !_connection->Connect()) {
        return false;
    }

    if (!_connection->Send(batch)) {
        return false;
    }

    NOISELINK_LOG("DenoiseOrchestrator: sent " << batch.size() << " bytes" << NOISELINK_LOG_ENDL);
    return true;
}

void DenoiseOrchestrator::Emit(Bytes data) {
    OutputUnit unit;
    unit.data = std::move(data);
    unit.sampleRate = _tracker.GetSampleRate();
    unit.channels = _tracker.GetChannels();
    try {
        _sink.PushAudio(std::move(unit));
    } catch (const std::exception& e) {
        NOISELINK_ERROR("DenoiseOrchestrator: sink rejected audio: " << e.what());
    }
}

const char* ToString(DenoiseOrchestrator::State state) {
    switch (state) {
        case DenoiseOrchestrator::State::Uninitialized: return "Uninitialized";
        case DenoiseOrchestrator::State::Started: return "Started";
        case DenoiseOrchestrator::State::Stopped: return "Stopped";
        case DenoiseOrchestrator::State::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

} // namespace noiselink
