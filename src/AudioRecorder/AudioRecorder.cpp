#include "AudioRecorder.hpp"
#include "../common/debug_log.hpp"

#include <chrono>
#include <thread>
#include <vector>

namespace noiselink {

namespace {

int record(void* /*outputBuffer*/, void* inputBuffer, unsigned int nBufferFrames,
           double /*streamTime*/, RtAudioStreamStatus status, void* userData) {
    RecordData* data = static_cast<RecordData*>(userData);

    if (status) {
        NOISELINK_LOG("Stream overflow detected!" << NOISELINK_LOG_ENDL);
    }

    if (data->isRecording && inputBuffer) {
        const int16_t* inputSamples = static_cast<const int16_t*>(inputBuffer);
        data->capturedFrames += nBufferFrames;

        if (data->onBuffer) {
            data->onBuffer(inputSamples, nBufferFrames, data->sampleRate, data->channels);
        }
    }

    return 0;
}

} // namespace

AudioRecorder::AudioRecorder(unsigned int preferredSampleRate, unsigned int channels)
    : _buffer_frames(320) {
    std::vector<unsigned int> deviceIds = _audio.getDeviceIds();
    if (deviceIds.empty()) {
        throw AudioRecorderException("No audio devices found");
    }

    unsigned int device = _audio.getDefaultInputDevice();
    RtAudio::DeviceInfo info = _audio.getDeviceInfo(device);

    if (info.inputChannels < channels) {
        NOISELINK_LOG("Default device has too few input channels, searching for alternative..." << NOISELINK_LOG_ENDL);
        for (unsigned int id : deviceIds) {
            RtAudio::DeviceInfo candidate = _audio.getDeviceInfo(id);
            if (candidate.inputChannels >= channels) {
                device = id;
                info = candidate;
                break;
            }
        }
    }

    if (info.inputChannels < channels) {
        throw AudioRecorderException("No input device with " + std::to_string(channels) + " channel(s) found");
    }
    NOISELINK_LOG("Using input device: " << info.name << NOISELINK_LOG_ENDL);

    unsigned int sampleRate = preferredSampleRate;
    bool sampleRateSupported = false;
    for (unsigned int sr : info.sampleRates) {
        if (sr == sampleRate) {
            sampleRateSupported = true;
            break;
        }
    }
    if (!sampleRateSupported) {
        sampleRate = info.preferredSampleRate;
        NOISELINK_LOG(preferredSampleRate << " Hz not supported, using preferred rate: " << sampleRate << NOISELINK_LOG_ENDL);
    }

    _record_data.sampleRate = sampleRate;
    _record_data.channels = channels;

    _parameters.deviceId = device;
    _parameters.nChannels = channels;
    _parameters.firstChannel = 0;

    if (_audio.openStream(nullptr, &_parameters, RTAUDIO_SINT16,
                          sampleRate, &_buffer_frames, &record, &_record_data)) {
        throw AudioRecorderException("Error opening stream: " + _audio.getErrorText());
    }
    NOISELINK_LOG("Stream opened: " << sampleRate << " Hz, " << _buffer_frames << " frames per buffer" << NOISELINK_LOG_ENDL);
}

AudioRecorder::~AudioRecorder() {
    if (_audio.isStreamRunning()) {
        _audio.stopStream();
    }
    if (_audio.isStreamOpen()) {
        _audio.closeStream();
    }
}

bool AudioRecorder::Record(unsigned int milliseconds) {
    _record_data.capturedFrames = 0;
    _record_data.isRecording = true;

    if (_audio.startStream()) {
        NOISELINK_ERROR("Error starting stream: " << _audio.getErrorText());
        _record_data.isRecording = false;
        return false;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));

    _record_data.isRecording = false;
    if (_audio.isStreamRunning()) {
        _audio.stopStream();
    }

    NOISELINK_LOG("Captured " << _record_data.capturedFrames.load() << " frames" << NOISELINK_LOG_ENDL);
    if (_record_data.capturedFrames == 0) {
        NOISELINK_ERROR("WARNING: No audio data was recorded!");
    }
    return true;
}

} // namespace noiselink
