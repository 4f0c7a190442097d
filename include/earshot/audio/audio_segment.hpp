#ifndef EARSHOT_AUDIO_SEGMENT_HPP
#define EARSHOT_AUDIO_SEGMENT_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace earshot {

// One fixed-duration slice of captured audio (interleaved PCM16)
struct AudioSegment {
    std::vector<int16_t> samples;
    int sampleRate = 16000;
    int channels = 1;
    double durationSec = 0.0;

    bool empty() const { return samples.empty(); }
};

struct TranscriptFragment {
    std::string text;
    size_t segmentIndex = 0;   // index into the owning buffer's segments
    double offsetSec = 0.0;    // start of the segment within the utterance window
};

// Root mean square on the int16 scale
double segmentRms(const AudioSegment& segment);

// Averages interleaved channels down to mono
std::vector<int16_t> toMono(const AudioSegment& segment);

}

#endif
