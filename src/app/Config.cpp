#include "app/Config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace xpathgen {

// ============================================================================
// Singleton accessor
// ============================================================================
Config& Config::instance() {
    static Config inst;
    return inst;
}

// ============================================================================
// getConfigPath - explicit override, then the platform config location
// ============================================================================
std::string Config::getConfigPath() {
    const char* explicitPath = std::getenv("XPATHGEN_CONFIG");
    if (explicitPath && explicitPath[0] != '\0') {
        return explicitPath;
    }
#ifdef _WIN32
    // %APPDATA%/xpathgen/config.json
    const char* appdata = std::getenv("APPDATA");
    if (appdata) {
        return std::string(appdata) + "\\xpathgen\\config.json";
    }
    return "xpathgen_config.json";
#else
    // ~/.config/xpathgen/config.json
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        return std::string(xdgConfig) + "/xpathgen/config.json";
    }
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/xpathgen/config.json";
    }
    return "xpathgen_config.json";
#endif
}

// ============================================================================
// Helper: create the parent directory of a path; false if it cannot be made
// ============================================================================
static bool createParentDirs(const std::string& filePath) {
    std::filesystem::path dir = std::filesystem::path(filePath).parent_path();
    if (dir.empty()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "xpathgen: cannot create config directory " << dir.string() << ": "
                  << ec.message() << std::endl;
        return false;
    }
    return true;
}

// ============================================================================
// load - read JSON config from disk; use defaults if file is missing
// ============================================================================
bool Config::load() {
    return load(getConfigPath());
}

bool Config::load(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        // File does not exist -- use defaults.
        return false;
    }

    try {
        nlohmann::json j;
        ifs >> j;
        fromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "xpathgen: failed to parse config " << path << ": " << e.what() << std::endl;
        reset();
        return false;
    }
    return true;
}

// ============================================================================
// save - write JSON config to disk, creating directories if needed
// ============================================================================
bool Config::save() const {
    return save(getConfigPath());
}

bool Config::save(const std::string& path) const {
    if (!createParentDirs(path)) {
        return false;
    }

    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        std::cerr << "xpathgen: failed to write config to " << path << std::endl;
        return false;
    }

    ofs << toJson().dump(4) << std::endl;
    return true;
}

void Config::reset() {
    importOptions = ImportOptions{};
}

// ============================================================================
// toJson - serialize all settings to a JSON object
// ============================================================================
nlohmann::json Config::toJson() const {
    nlohmann::json j;

    // Importer settings
    nlohmann::json& ji = j["import"];
    ji["keepBlankText"] = importOptions.keepBlankText;
    ji["substituteEntities"] = importOptions.substituteEntities;
    ji["keepNamespaceDecls"] = importOptions.keepNamespaceDecls;
    ji["namespaceAware"] = importOptions.namespaceAware;
    ji["maxInputSize"] = importOptions.maxInputSize;

    // Logging
    j["log"]["verbose"] = importOptions.verbose;

    return j;
}

// ============================================================================
// fromJson - deserialize settings, keeping defaults for missing keys
// ============================================================================
void Config::fromJson(const nlohmann::json& j) {
    if (j.contains("import")) {
        const auto& ji = j["import"];
        importOptions.keepBlankText = ji.value("keepBlankText", importOptions.keepBlankText);
        importOptions.substituteEntities =
            ji.value("substituteEntities", importOptions.substituteEntities);
        importOptions.keepNamespaceDecls =
            ji.value("keepNamespaceDecls", importOptions.keepNamespaceDecls);
        importOptions.namespaceAware = ji.value("namespaceAware", importOptions.namespaceAware);
        importOptions.maxInputSize = ji.value("maxInputSize", importOptions.maxInputSize);
    }

    if (j.contains("log")) {
        importOptions.verbose = j["log"].value("verbose", importOptions.verbose);
    }
}

} // namespace xpathgen
