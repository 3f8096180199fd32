#pragma once

#include <RtAudio.h>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

#include "RecordData.hpp"

namespace noiselink {

class AudioRecorderException : public std::runtime_error {
public:
    explicit AudioRecorderException(const std::string& what) : std::runtime_error(what) {}
};

// Streams 16-bit PCM from the default input device.
class AudioRecorder {
public:
    using BufferCallback = std::function<void(const int16_t*, size_t, unsigned int, unsigned int)>;

    explicit AudioRecorder(unsigned int preferredSampleRate = 16000, unsigned int channels = 1);
    ~AudioRecorder();

    AudioRecorder(const AudioRecorder&) = delete;
    AudioRecorder& operator=(const AudioRecorder&) = delete;

    // Called from the audio callback thread for every captured buffer.
    void SetOnBufferCallback(BufferCallback cb) { _record_data.onBuffer = std::move(cb); }

    // Blocks for the given duration while buffers are delivered.
    bool Record(unsigned int milliseconds);

    unsigned int GetSampleRate() const { return _record_data.sampleRate; }
    unsigned int GetChannels() const { return _record_data.channels; }
    size_t GetCapturedFrames() const { return _record_data.capturedFrames.load(); }

private:
    RecordData _record_data;
    RtAudio _audio;
    RtAudio::StreamParameters _parameters;
    unsigned int _buffer_frames;
};

} // namespace noiselink
