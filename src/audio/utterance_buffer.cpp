#include "earshot/audio/utterance_buffer.hpp"

#include <stdexcept>
#include <utility>

namespace earshot {

void UtteranceBuffer::append(AudioSegment segment, const std::string& text, double offsetSec) {
    if (frozen_) throw std::logic_error("UtteranceBuffer: append after freeze");

    TranscriptFragment fragment;
    fragment.text = text;
    fragment.segmentIndex = segments_.size();
    fragment.offsetSec = offsetSec;

    totalSec_ += segment.durationSec;
    segments_.push_back(std::move(segment));
    fragments_.push_back(std::move(fragment));
}

const std::string& UtteranceBuffer::lastText() const {
    static const std::string kEmpty;
    return fragments_.empty() ? kEmpty : fragments_.back().text;
}

std::vector<int16_t> UtteranceBuffer::combinedPcm() const {
    size_t total = 0;
    for (const auto& s : segments_) total += s.samples.size();

    std::vector<int16_t> out;
    out.reserve(total);
    for (const auto& s : segments_) {
        const std::vector<int16_t> mono = toMono(s);
        out.insert(out.end(), mono.begin(), mono.end());
    }
    return out;
}

int UtteranceBuffer::sampleRate() const {
    return segments_.empty() ? 16000 : segments_.front().sampleRate;
}

}
