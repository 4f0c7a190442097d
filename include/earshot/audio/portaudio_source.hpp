#ifndef EARSHOT_PORTAUDIO_SOURCE_HPP
#define EARSHOT_PORTAUDIO_SOURCE_HPP

#include "earshot/audio/audio_source.hpp"

#include <mutex>
#include <string>

namespace earshot {

// Blocking microphone capture through PortAudio
class PortAudioSource : public AudioSource {
public:
    struct Config {
        int sampleRate = 16000;
        int channels = 1;
        int framesPerBuffer = 160;

        int deviceIndex = -1;   // -1 selects the default input device
    };

    explicit PortAudioSource(Config config);
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    void open() override;
    void close() override;
    bool isOpen() const override;

    AudioSegment read(double durationSec) override;

    const std::string& deviceName() const { return deviceName_; }

private:
    void openLocked();
    void closeLocked();

    Config config_;
    mutable std::mutex device_mutex_;   // one reader at a time on the stream
    void* stream_ = nullptr;
    bool initialized_ = false;
    std::string deviceName_;
};

}

#endif
