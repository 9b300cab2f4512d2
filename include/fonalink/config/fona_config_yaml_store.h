#pragma once

#include <string>
#include <string_view>

#include "fonalink/config/fona_config.h"
#include "fonalink/modem/modem_types.h"

namespace fonalink::config {

// File-backed YAML implementation of FonaConfigStore.
class YamlFonaConfigStore : public FonaConfigStore {
public:
    explicit YamlFonaConfigStore(std::string path);

    // Missing file: defaults are written out and returned.
    // Unreadable or malformed file: logged, defaults returned.
    FonaConfig load() override;

    // Throws std::runtime_error if the file cannot be written.
    void       save(const FonaConfig& cfg) override;

private:
    std::string _path;
};

// Parse YAML text. Throws YAML::Exception on malformed input.
FonaConfig parse_config_yaml(std::string_view text);

std::string emit_config_yaml(const FonaConfig& cfg);

// Session parameters derived from the config.
fonalink::modem::ModemSettings to_modem_settings(const FonaConfig& cfg);

} // namespace fonalink::config
