#include "earshot/audio/portaudio_source.hpp"
#include "earshot/core/errors.hpp"
#include "earshot/core/logging.hpp"

#include <portaudio.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace earshot {

static void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw AudioSourceUnavailable(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

// Constructor
PortAudioSource::PortAudioSource(Config config) : config_(std::move(config)) {
    if (config_.sampleRate <= 0 || config_.channels <= 0 || config_.framesPerBuffer <= 0) {
        throw std::invalid_argument("PortAudioSource: sample rate, channels and frames per buffer must be positive");
    }
}

// Destructor
PortAudioSource::~PortAudioSource() { close(); }

void PortAudioSource::open() {
    std::lock_guard<std::mutex> lock(device_mutex_);
    openLocked();
}

void PortAudioSource::close() {
    std::lock_guard<std::mutex> lock(device_mutex_);
    closeLocked();
}

bool PortAudioSource::isOpen() const {
    std::lock_guard<std::mutex> lock(device_mutex_);
    return stream_ != nullptr;
}

void PortAudioSource::openLocked() {
    if (stream_) return;

    if (!initialized_) {
        pa_check(Pa_Initialize(), "Pa_Initialize");
        initialized_ = true;
    }

    try {
        PaStreamParameters inParams{};
        inParams.device = config_.deviceIndex >= 0 ? (PaDeviceIndex)config_.deviceIndex : Pa_GetDefaultInputDevice();
        if (inParams.device == paNoDevice) {
            throw AudioSourceUnavailable("No default input device");
        }

        const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
        if (!info) {
            throw AudioSourceUnavailable("Unknown input device index " + std::to_string(config_.deviceIndex));
        }
        deviceName_ = info->name ? info->name : "(unknown)";
        logInfo("Audio", "Input device: " + deviceName_);

        inParams.channelCount = config_.channels;
        inParams.sampleFormat = paInt16;
        inParams.suggestedLatency = info->defaultLowInputLatency;
        inParams.hostApiSpecificStreamInfo = nullptr;

        PaStream* stream = nullptr;
        pa_check(
            Pa_OpenStream(&stream, &inParams, nullptr,
                          config_.sampleRate, config_.framesPerBuffer,
                          paNoFlag, nullptr, nullptr),
            "Pa_OpenStream"
        );

        const PaError e = Pa_StartStream(stream);
        if (e != paNoError) {
            Pa_CloseStream(stream);
            pa_check(e, "Pa_StartStream");
        }
        stream_ = stream;
    } catch (const AudioSourceUnavailable&) {
        Pa_Terminate();
        initialized_ = false;
        throw;
    }
}

void PortAudioSource::closeLocked() {
    if (stream_) {
        PaStream* stream = static_cast<PaStream*>(stream_);
        Pa_StopStream(stream);
        Pa_CloseStream(stream);
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

AudioSegment PortAudioSource::read(double durationSec) {
    std::lock_guard<std::mutex> lock(device_mutex_);
    if (!stream_) openLocked();

    const int frames = std::max(1, (int)std::lround(durationSec * config_.sampleRate));

    AudioSegment segment;
    segment.sampleRate = config_.sampleRate;
    segment.channels = config_.channels;
    segment.samples.reserve((size_t)frames * config_.channels);

    std::vector<int16_t> buff((size_t)config_.framesPerBuffer * config_.channels);
    PaStream* stream = static_cast<PaStream*>(stream_);

    int captured = 0;
    while (captured < frames) {
        const int want = std::min(config_.framesPerBuffer, frames - captured);
        PaError e = Pa_ReadStream(stream, buff.data(), want);
        if (e == paInputOverflowed) {
            logDebug("Audio", "Input overflowed, dropping buffer");
            continue;
        }
        pa_check(e, "Pa_ReadStream");

        segment.samples.insert(segment.samples.end(), buff.begin(), buff.begin() + (size_t)want * config_.channels);
        captured += want;
    }

    segment.durationSec = (double)captured / config_.sampleRate;
    return segment;
}

}
