#ifndef EARSHOT_ERRORS_HPP
#define EARSHOT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace earshot {

// The capture device could not be opened or read. The only error listen() lets through.
class AudioSourceUnavailable : public std::runtime_error {
public:
    explicit AudioSourceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// The speech-to-text backend failed. Callers treat it the same as no speech.
class TranscriptionError : public std::runtime_error {
public:
    explicit TranscriptionError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}

#endif
