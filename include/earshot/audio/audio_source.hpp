#ifndef EARSHOT_AUDIO_SOURCE_HPP
#define EARSHOT_AUDIO_SOURCE_HPP

#include "earshot/audio/audio_segment.hpp"

namespace earshot {

// Inbound stream of fixed-duration segments
class AudioSource {
public:
    virtual ~AudioSource() = default;

    // Throws AudioSourceUnavailable when the device cannot be opened. Calling it on an open source is a no-op.
    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Blocks until durationSec of audio has been captured
    virtual AudioSegment read(double durationSec) = 0;
};

}

#endif
