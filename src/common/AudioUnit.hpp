#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace noiselink {

// Raw 16-bit linear PCM, interleaved, in both directions.
using Bytes = std::vector<std::byte>;

constexpr unsigned int kBytesPerSample = 2;

struct InputUnit {
    const std::byte* data = nullptr;
    size_t size = 0;
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
};

struct OutputUnit {
    Bytes data;
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
};

inline InputUnit MakeInputUnit(const int16_t* samples, size_t numSamples,
                               unsigned int sampleRate, unsigned int channels) {
    InputUnit unit;
    unit.data = reinterpret_cast<const std::byte*>(samples);
    unit.size = numSamples * sizeof(int16_t);
    unit.sampleRate = sampleRate;
    unit.channels = channels;
    return unit;
}

inline InputUnit MakeInputUnit(const Bytes& bytes, unsigned int sampleRate, unsigned int channels) {
    InputUnit unit;
    unit.data = bytes.data();
    unit.size = bytes.size();
    unit.sampleRate = sampleRate;
    unit.channels = channels;
    return unit;
}

} // namespace noiselink
