#pragma once

#include <string>

#include "../common/AudioUnit.hpp"

namespace noiselink {

// Downstream consumer of denoised audio. PushAudio may be called from the
// receive thread as well as from the thread feeding input.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual void PushAudio(OutputUnit unit) = 0;

    // Informational; connection and send failures never stop the session.
    virtual void PushError(const std::string& message) { (void)message; }
};

} // namespace noiselink
