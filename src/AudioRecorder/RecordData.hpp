#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace noiselink {

// State shared with the RtAudio callback thread.
struct RecordData {
    std::atomic<bool> isRecording{false};
    unsigned int sampleRate = 0;
    unsigned int channels = 1;
    std::atomic<size_t> capturedFrames{0};

    // (samples, numFrames, sampleRate, channels)
    std::function<void(const int16_t*, size_t, unsigned int, unsigned int)> onBuffer;
};

} // namespace noiselink
