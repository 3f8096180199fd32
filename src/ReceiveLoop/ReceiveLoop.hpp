#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "../AudioSink/AudioSink.hpp"
#include "../Transport/Transport.hpp"

namespace noiselink {

// Background reader for one connected period. Every chunk read from the
// transport is forwarded to the sink as it arrives, in arrival order.
class ReceiveLoop {
public:
    // The sink must outlive the loop.
    ReceiveLoop(TransportPtr transport, AudioSink& sink,
                unsigned int sampleRate, unsigned int channels);
    ~ReceiveLoop();

    ReceiveLoop(const ReceiveLoop&) = delete;
    ReceiveLoop& operator=(const ReceiveLoop&) = delete;

    void Start();

    // Closes the transport to interrupt a pending read and waits for the
    // thread to finish. Safe to call repeatedly and from the loop's own thread.
    void Stop();

    bool IsRunning() const { return _shared->running.load(); }
    size_t GetReceivedCount() const { return _shared->received.load(); }

private:
    struct Shared {
        std::atomic<bool> running{false};
        std::atomic<bool> stopRequested{false};
        std::atomic<size_t> received{0};
    };

    static void Run(TransportPtr transport, AudioSink* sink,
                    unsigned int sampleRate, unsigned int channels,
                    std::shared_ptr<Shared> shared);

    TransportPtr _transport;
    AudioSink& _sink;
    unsigned int _sampleRate;
    unsigned int _channels;
    std::shared_ptr<Shared> _shared;
    std::unique_ptr<std::thread> _thread;
};

} // namespace noiselink
