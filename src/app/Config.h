#pragma once

#include "core/DomImporter.h"
#include <string>
#include <nlohmann/json.hpp>

namespace xpathgen {

class Config {
public:
    static Config& instance();

    // Read from getConfigPath(). Missing file keeps defaults.
    bool load();
    // Read from an explicit path. Returns false if the file was missing or
    // malformed; a malformed file also resets to defaults.
    bool load(const std::string& path);

    bool save() const;
    bool save(const std::string& path) const;

    // Restore built-in defaults.
    void reset();

    // Importer settings, passed to DomImporter as is. "log.verbose" is
    // stored in importOptions.verbose.
    ImportOptions importOptions;

    // Get config file path
    static std::string getConfigPath();

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
};

} // namespace xpathgen
