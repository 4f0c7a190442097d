#ifndef EARSHOT_ENVIRONMENT_PROFILE_HPP
#define EARSHOT_ENVIRONMENT_PROFILE_HPP

#include <string>

namespace earshot {

enum class ListenMode {
    Normal,
    WordGame,
    IntlGame,
    InterruptCheck
};

const char* toString(ListenMode mode);

enum class HostCategory {
    RaspberryPi5,
    RaspberryPi,
    MacOS,
    Linux,
    Other
};

const char* toString(HostCategory category);

// Energy multiplier per listen mode
struct ModeMultipliers {
    double normal = 1.0;
    double wordGame = 1.0;
    double intlGame = 1.0;
    double interruptCheck = 1.0;

    double forMode(ListenMode mode) const;
};

struct EnvironmentProfile {
    HostCategory category = HostCategory::Other;
    int baseEnergyThreshold = 250;
    double calibrationDuration = 0.8;
    double chunkDurationMultiplier = 1.0;
    double silenceToleranceMultiplier = 1.0;
    ModeMultipliers modeMultipliers;

    // round(baseEnergyThreshold * modeMultiplier)
    int effectiveThreshold(ListenMode mode) const;
};

bool operator==(const EnvironmentProfile& a, const EnvironmentProfile& b);
bool operator!=(const EnvironmentProfile& a, const EnvironmentProfile& b);

// What the probe reads from the host
struct HostInfo {
    std::string sysname;      // uname() sysname, e.g. "Linux" or "Darwin"
    std::string machine;      // uname() machine, e.g. "aarch64"
    std::string deviceModel;  // /proc/device-tree/model, empty when absent
};

HostCategory classifyHost(const HostInfo& host);

EnvironmentProfile profileFor(HostCategory category);

HostInfo readHostInfo();

// Resolves the profile of the running host. Computed once, the same object is returned afterwards.
const EnvironmentProfile& probe();

}

#endif
