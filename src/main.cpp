#include "AudioRecorder/AudioRecorder.hpp"
#include "AudioSink/WavSink.hpp"
#include "DenoiseOrchestrator/DenoiseOrchestrator.hpp"
#include "SessionConfig/SessionConfig.hpp"
#include "common/debug_log.hpp"

#include <rtc/rtc.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace nl = noiselink;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: noiselink_mic <config.json> [milliseconds] [output.wav]" << std::endl;
        return 2;
    }

    const std::string configPath = argv[1];
    const unsigned int milliseconds = argc > 2 ? static_cast<unsigned int>(std::stoul(argv[2])) : 5000;
    const std::string outputPath = argc > 3 ? argv[3] : "denoised.wav";

    rtc::InitLogger(rtc::LogLevel::Warning);

    try {
        nl::SessionConfig config = nl::SessionConfig::LoadFromFile(configPath);

        nl::AudioRecorder recorder;
        nl::WavSink sink(outputPath);
        nl::DenoiseOrchestrator session(config, sink);

        if (!session.Start(recorder.GetSampleRate(), recorder.GetChannels())) {
            std::cerr << "Failed to start session" << std::endl;
            return 1;
        }

        recorder.SetOnBufferCallback([&session](const int16_t* samples, size_t numFrames,
                                                unsigned int sampleRate, unsigned int channels) {
            session.ProcessInput(nl::MakeInputUnit(samples, numFrames * channels, sampleRate, channels));
        });

        std::cout << "Recording " << milliseconds << " ms at " << recorder.GetSampleRate() << " Hz..." << std::endl;
        if (!recorder.Record(milliseconds)) {
            session.Cancel();
            return 1;
        }

        // Give the endpoint time to return the last windows.
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        session.Stop();

        if (!sink.Save()) {
            std::cerr << "Nothing was written to " << outputPath << std::endl;
            return 1;
        }
        std::cout << "Done. Denoised audio written to " << outputPath << std::endl;
    } catch (const nl::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
