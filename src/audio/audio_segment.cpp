#include "earshot/audio/audio_segment.hpp"

#include <algorithm>
#include <cmath>

namespace earshot {

double segmentRms(const AudioSegment& segment) {
    const size_t n = segment.samples.size();
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) acc += (double)segment.samples[i] * (double)segment.samples[i];
    acc /= std::max<size_t>(1, n);
    return std::sqrt(acc);
}

std::vector<int16_t> toMono(const AudioSegment& segment) {
    if (segment.channels <= 1) return segment.samples;

    const size_t frames = segment.samples.size() / segment.channels;
    std::vector<int16_t> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        int acc = 0;
        for (int c = 0; c < segment.channels; ++c) acc += segment.samples[f * segment.channels + c];
        mono[f] = (int16_t)(acc / segment.channels);
    }
    return mono;
}

}
