#pragma once

#include <cstddef>

#include "../common/AudioUnit.hpp"

namespace noiselink {

// Batches incoming PCM into windows whose duration, derived from the byte
// count at the session sample rate, exceeds the accumulation window.
class AudioAccumulator {
public:
    AudioAccumulator(unsigned int sampleRate, double windowSeconds);

    void Accumulate(const std::byte* data, size_t size);
    bool ShouldFlush() const;

    // Hands out the current window and leaves the buffer empty.
    Bytes Flush();

    // Drops buffered bytes without producing a batch.
    void Discard();

    size_t GetTotalBytes() const { return _totalBytes; }
    double GetBufferedSeconds() const;
    double GetWindowSeconds() const { return _windowSeconds; }

private:
    unsigned int _sampleRate;
    double _windowSeconds;
    Bytes _buffer;
    size_t _totalBytes;
};

} // namespace noiselink
