#include "ReceiveLoop.hpp"
#include "../common/debug_log.hpp"

namespace noiselink {

ReceiveLoop::ReceiveLoop(TransportPtr transport, AudioSink& sink,
                         unsigned int sampleRate, unsigned int channels)
    : _transport(std::move(transport))
    , _sink(sink)
    , _sampleRate(sampleRate)
    , _channels(channels)
    , _shared(std::make_shared<Shared>()) {
}

ReceiveLoop::~ReceiveLoop() {
    Stop();
}

void ReceiveLoop::Start() {
    if (_thread || !_transport) {
        return;
    }

    _shared->running = true;
    _thread.reset(new std::thread(&ReceiveLoop::Run, _transport, &_sink, _sampleRate, _channels, _shared));
}

void ReceiveLoop::Stop() {
    if (_shared->stopRequested.exchange(true)) {
        return;
    }

    if (_transport) {
        _transport->Close();
    }

    if (_thread && _thread->joinable()) {
        if (_thread->get_id() == std::this_thread::get_id()) {
            // Stopped from inside a sink callback; the thread exits on its own
            // once the callback returns.
            _thread->detach();
        } else {
            _thread->join();
        }
    }
}

void ReceiveLoop::Run(TransportPtr transport, AudioSink* sink,
                      unsigned int sampleRate, unsigned int channels,
                      std::shared_ptr<Shared> shared) {
    NOISELINK_LOG("ReceiveLoop: started" << NOISELINK_LOG_ENDL);

    while (!shared->stopRequested) {
        std::optional<Bytes> chunk = transport->Receive();
        if (!chunk) {
            break;
        }
        if (shared->stopRequested) {
            break;
        }
        if (chunk->empty()) {
            continue;
        }

        OutputUnit unit;
        unit.data = std::move(*chunk);
        unit.sampleRate = sampleRate;
        unit.channels = channels;

        shared->received += 1;
        try {
            sink->PushAudio(std::move(unit));
        } catch (const std::exception& e) {
            NOISELINK_ERROR("ReceiveLoop: sink rejected audio: " << e.what());
        }
    }

    if (!shared->stopRequested) {
        std::string error = transport->GetLastError();
        NOISELINK_ERROR("ReceiveLoop: connection closed" << (error.empty() ? "" : ": ") << error);
        try {
            sink->PushError("receive failure: connection closed" + (error.empty() ? std::string() : ": " + error));
        } catch (const std::exception& e) {
            NOISELINK_ERROR("ReceiveLoop: sink rejected error event: " << e.what());
        }
    }

    NOISELINK_LOG("ReceiveLoop: finished after " << shared->received.load() << " chunks" << NOISELINK_LOG_ENDL);
    shared->running = false;
}

} // namespace noiselink
