#include "earshot/env/environment_profile.hpp"
#include "earshot/core/logging.hpp"
#include "earshot/core/text.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

#ifndef _WIN32
  #include <sys/utsname.h>
#endif

namespace earshot {

const char* toString(ListenMode mode) {
    switch (mode) {
        case ListenMode::Normal: return "normal";
        case ListenMode::WordGame: return "word_game";
        case ListenMode::IntlGame: return "intl_game";
        case ListenMode::InterruptCheck: return "interrupt_check";
    }
    return "normal";
}

const char* toString(HostCategory category) {
    switch (category) {
        case HostCategory::RaspberryPi5: return "Raspberry Pi 5";
        case HostCategory::RaspberryPi: return "Raspberry Pi";
        case HostCategory::MacOS: return "macOS";
        case HostCategory::Linux: return "Linux";
        case HostCategory::Other: return "Other";
    }
    return "Other";
}

double ModeMultipliers::forMode(ListenMode mode) const {
    switch (mode) {
        case ListenMode::Normal: return normal;
        case ListenMode::WordGame: return wordGame;
        case ListenMode::IntlGame: return intlGame;
        case ListenMode::InterruptCheck: return interruptCheck;
    }
    return normal;
}

int EnvironmentProfile::effectiveThreshold(ListenMode mode) const {
    return (int)std::lround(baseEnergyThreshold * modeMultipliers.forMode(mode));
}

bool operator==(const EnvironmentProfile& a, const EnvironmentProfile& b) {
    return a.category == b.category &&
           a.baseEnergyThreshold == b.baseEnergyThreshold &&
           a.calibrationDuration == b.calibrationDuration &&
           a.chunkDurationMultiplier == b.chunkDurationMultiplier &&
           a.silenceToleranceMultiplier == b.silenceToleranceMultiplier &&
           a.modeMultipliers.normal == b.modeMultipliers.normal &&
           a.modeMultipliers.wordGame == b.modeMultipliers.wordGame &&
           a.modeMultipliers.intlGame == b.modeMultipliers.intlGame &&
           a.modeMultipliers.interruptCheck == b.modeMultipliers.interruptCheck;
}

bool operator!=(const EnvironmentProfile& a, const EnvironmentProfile& b) { return !(a == b); }

HostCategory classifyHost(const HostInfo& host) {
    const std::string model = toLower(host.deviceModel);
    if (model.find("raspberry pi 5") != std::string::npos) return HostCategory::RaspberryPi5;
    if (model.find("raspberry pi") != std::string::npos) return HostCategory::RaspberryPi;
    if (host.sysname == "Darwin") return HostCategory::MacOS;
    if (host.sysname == "Linux") return HostCategory::Linux;
    return HostCategory::Other;
}

EnvironmentProfile profileFor(HostCategory category) {
    EnvironmentProfile p;
    p.category = category;

    switch (category) {
        case HostCategory::RaspberryPi5:
            p.baseEnergyThreshold = 150;
            p.calibrationDuration = 1.2;
            p.chunkDurationMultiplier = 1.2;
            p.silenceToleranceMultiplier = 1.3;
            p.modeMultipliers = {1.0, 0.8, 1.1, 0.6};
            break;
        case HostCategory::RaspberryPi:
            p.baseEnergyThreshold = 120;
            p.calibrationDuration = 1.0;
            p.chunkDurationMultiplier = 1.0;
            p.silenceToleranceMultiplier = 1.2;
            p.modeMultipliers = {1.0, 0.7, 1.2, 0.5};
            break;
        case HostCategory::MacOS:
            p.baseEnergyThreshold = 300;
            p.calibrationDuration = 0.8;
            p.chunkDurationMultiplier = 1.0;
            p.silenceToleranceMultiplier = 1.0;
            p.modeMultipliers = {1.0, 0.83, 1.0, 0.67};
            break;
        case HostCategory::Linux:
            p.baseEnergyThreshold = 200;
            p.calibrationDuration = 1.0;
            p.chunkDurationMultiplier = 1.1;
            p.silenceToleranceMultiplier = 1.1;
            p.modeMultipliers = {1.0, 0.75, 1.15, 0.6};
            break;
        case HostCategory::Other:
            p.baseEnergyThreshold = 250;
            p.calibrationDuration = 0.8;
            p.chunkDurationMultiplier = 1.0;
            p.silenceToleranceMultiplier = 1.0;
            p.modeMultipliers = {1.0, 0.8, 1.1, 0.65};
            break;
    }
    return p;
}

// Device tree strings are NUL terminated
static std::string readDeviceModel() {
    std::ifstream in("/proc/device-tree/model", std::ios::binary);
    if (!in) return {};

    std::ostringstream ss;
    ss << in.rdbuf();
    std::string model = ss.str();
    const size_t nul = model.find('\0');
    if (nul != std::string::npos) model.resize(nul);
    return model;
}

HostInfo readHostInfo() {
    HostInfo host;
#ifdef _WIN32
    host.sysname = "Windows";
#else
    struct utsname u{};
    if (::uname(&u) == 0) {
        host.sysname = u.sysname;
        host.machine = u.machine;
    }
#endif
    host.deviceModel = readDeviceModel();
    return host;
}

const EnvironmentProfile& probe() {
    static const EnvironmentProfile profile = [] {
        const HostInfo host = readHostInfo();
        EnvironmentProfile p = profileFor(classifyHost(host));
        logInfo("Environment", std::string("Host profile: ") + toString(p.category) +
                " (sysname=" + (host.sysname.empty() ? "?" : host.sysname) +
                ", machine=" + (host.machine.empty() ? "?" : host.machine) +
                ", base threshold=" + std::to_string(p.baseEnergyThreshold) + ")");
        return p;
    }();
    return profile;
}

}
