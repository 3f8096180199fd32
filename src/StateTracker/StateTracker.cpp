#include "StateTracker.hpp"

namespace noiselink {

StateTracker::StateTracker(bool passthrough)
    : _configured(false)
    , _sampleRate(0)
    , _channels(0)
    , _muted(false)
    , _passthrough(passthrough) {
}

void StateTracker::Configure(unsigned int sampleRate, unsigned int channels) {
    if (sampleRate == 0 || channels == 0) {
        throw ConfigurationViolation("sample rate and channel count must be positive");
    }
    if (_configured && (sampleRate != _sampleRate || channels != _channels)) {
        throw ConfigurationViolation("session already configured for " + std::to_string(_sampleRate) +
                                     " Hz / " + std::to_string(_channels) + " ch");
    }
    _sampleRate = sampleRate;
    _channels = channels;
    _configured = true;
}

void StateTracker::Validate(unsigned int sampleRate, unsigned int channels) const {
    if (!_configured) {
        throw ConfigurationViolation("audio received before the session format was set");
    }
    if (sampleRate != _sampleRate || channels != _channels) {
        throw ConfigurationViolation("audio format " + std::to_string(sampleRate) + " Hz / " +
                                     std::to_string(channels) + " ch does not match session format " +
                                     std::to_string(_sampleRate) + " Hz / " + std::to_string(_channels) + " ch");
    }
}

} // namespace noiselink
