#pragma once

#include <variant>

#include "../common/AudioUnit.hpp"

namespace noiselink {

struct AudioChunk {
    Bytes data;
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
};

struct MuteControl {
    bool muted = false;
};

struct Lifecycle {
    enum class Kind {
        Start,
        Stop,
        Cancel
    };

    Kind kind = Kind::Start;
    // Only meaningful for Start.
    unsigned int sampleRate = 0;
    unsigned int channels = 0;
};

using Message = std::variant<AudioChunk, MuteControl, Lifecycle>;

} // namespace noiselink
