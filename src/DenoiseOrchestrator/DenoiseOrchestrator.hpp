#pragma once

#include <atomic>
#include <memory>
#include <mutex>

#include "../AudioAccumulator/AudioAccumulator.hpp"
#include "../AudioSink/AudioSink.hpp"
#include "../ConnectionManager/ConnectionManager.hpp"
#include "../SessionConfig/SessionConfig.hpp"
#include "../StateTracker/StateTracker.hpp"
#include "../Transport/Transport.hpp"
#include "Message.hpp"

namespace noiselink {

// Entry point of a denoising session. Input is gated, batched into windows
// and sent to the endpoint; denoised audio reaches the sink asynchronously
// from the receive loop and is not paired with any particular window.
class DenoiseOrchestrator {
public:
    enum class State {
        Uninitialized,
        Started,
        Stopped,
        Cancelled
    };

    // Uses a WebSocket transport to the configured endpoint.
    DenoiseOrchestrator(SessionConfig config, AudioSink& sink);
    DenoiseOrchestrator(SessionConfig config, AudioSink& sink, TransportFactory factory);
    ~DenoiseOrchestrator();

    DenoiseOrchestrator(const DenoiseOrchestrator&) = delete;
    DenoiseOrchestrator& operator=(const DenoiseOrchestrator&) = delete;

    // Fixes the session format and opens the connection unless passthrough is
    // enabled. A failed connection is retried on the first send.
    bool Start(unsigned int sampleRate, unsigned int channels);

    // Throws ConfigurationViolation when the unit does not match the session format.
    void ProcessInput(const InputUnit& unit);

    void SetMuted(bool muted);

    // Unflushed audio is discarded.
    bool Stop();

    // Valid from any state, from any thread, any number of times.
    void Cancel();

    void Handle(const Message& message);

    State GetCurrentState() const { return _state; }
    bool IsMuted() const { return _tracker.IsMuted(); }
    bool IsPassthrough() const { return _tracker.IsPassthrough(); }
    ConnectionManager::State GetConnectionState() const { return _connection->GetCurrentState(); }
    size_t GetBufferedBytes() const;

private:
    // Caller holds _sendMutex. Returns false when the window was not delivered.
    bool SendWindow(const Bytes& batch);
    void Emit(Bytes data);

    SessionConfig _config;
    AudioSink& _sink;
    StateTracker _tracker;

    mutable std::mutex _mutex;
    // Serializes connect and send. Stop and Cancel never take it.
    std::mutex _sendMutex;
    std::unique_ptr<AudioAccumulator> _accumulator;
    std::unique_ptr<ConnectionManager> _connection;
    std::atomic<State> _state;
};

const char* ToString(DenoiseOrchestrator::State state);

} // namespace noiselink
