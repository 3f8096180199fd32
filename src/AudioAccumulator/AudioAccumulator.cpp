#include "AudioAccumulator.hpp"

namespace noiselink {

AudioAccumulator::AudioAccumulator(unsigned int sampleRate, double windowSeconds)
    : _sampleRate(sampleRate)
    , _windowSeconds(windowSeconds)
    , _totalBytes(0) {
    _buffer.reserve(static_cast<size_t>(windowSeconds * sampleRate * kBytesPerSample) + 1);
}

void AudioAccumulator::Accumulate(const std::byte* data, size_t size) {
    if (!data || size == 0) {
        return;
    }
    _buffer.insert(_buffer.end(), data, data + size);
    _totalBytes += size;
}

double AudioAccumulator::GetBufferedSeconds() const {
    if (_sampleRate == 0) {
        return 0.0;
    }
    return static_cast<double>(_totalBytes) / (static_cast<double>(_sampleRate) * kBytesPerSample);
}

bool AudioAccumulator::ShouldFlush() const {
    return GetBufferedSeconds() > _windowSeconds;
}

Bytes AudioAccumulator::Flush() {
    Bytes batch;
    batch.swap(_buffer);
    _totalBytes = 0;
    _buffer.reserve(batch.capacity());
    return batch;
}

void AudioAccumulator::Discard() {
    _buffer.clear();
    _totalBytes = 0;
}

} // namespace noiselink
