#pragma once

#include <cstdint>
#include <string>

namespace fonalink::config {

struct ModemConfig {
    std::string   port{"/dev/ttyAMA0"};
    std::uint32_t baud{115200};
    std::string   pin;
    bool          verbose{false};
};

struct TimingConfig {
    int           openRetryCount{3};
    std::uint32_t openRetrySleepMs{5000};
    std::uint32_t pinSettleMs{10000};
};

// Message sent by the demo application.
struct MessageConfig {
    std::string phone;
    std::string text{"Hello, World!"};
};

// Unified config for one fonalink instance.
struct FonaConfig {
    ModemConfig   modem;
    TimingConfig  timing;
    MessageConfig message;
};


// Abstract storage interface.
class FonaConfigStore {
public:
    virtual ~FonaConfigStore() = default;

    virtual FonaConfig load() = 0;
    virtual void       save(const FonaConfig& cfg) = 0;
};

} // namespace fonalink::config
