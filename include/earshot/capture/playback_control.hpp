#ifndef EARSHOT_PLAYBACK_CONTROL_HPP
#define EARSHOT_PLAYBACK_CONTROL_HPP

namespace earshot {

// The text-to-speech player, as seen from the interrupt path
class PlaybackControl {
public:
    virtual ~PlaybackControl() = default;

    virtual void stopImmediately() = 0;
};

}

#endif
