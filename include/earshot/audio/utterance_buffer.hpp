#ifndef EARSHOT_UTTERANCE_BUFFER_HPP
#define EARSHOT_UTTERANCE_BUFFER_HPP

#include "earshot/audio/audio_segment.hpp"

#include <vector>

namespace earshot {

// Human-speech segments retained during one listen() call, in capture order.
// Once frozen the buffer rejects further appends.
class UtteranceBuffer {
public:
    UtteranceBuffer() = default;

    void append(AudioSegment segment, const std::string& text, double offsetSec);

    void freeze() { frozen_ = true; }
    bool isFrozen() const { return frozen_; }

    bool empty() const { return segments_.empty(); }
    size_t size() const { return segments_.size(); }

    const std::vector<AudioSegment>& segments() const { return segments_; }
    const std::vector<TranscriptFragment>& fragments() const { return fragments_; }

    // Text of the most recently retained fragment, empty when nothing was retained
    const std::string& lastText() const;

    // All retained samples joined in chronological order, mono
    std::vector<int16_t> combinedPcm() const;

    int sampleRate() const;
    double totalDurationSec() const { return totalSec_; }

private:
    std::vector<AudioSegment> segments_;
    std::vector<TranscriptFragment> fragments_;
    double totalSec_ = 0.0;
    bool frozen_ = false;
};

}

#endif
