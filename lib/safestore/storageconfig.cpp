/**
 * @file storageconfig.cpp
 * @brief Loading and saving of SafeStore configuration files
 *
 * The format is one "key = value" pair per line. Lines starting with '#'
 * are comments, values may be wrapped in double quotes.
 */

#include "storageconfig.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

void trim(std::string &s, const char *chars) {
    s.erase(0, s.find_first_not_of(chars));
    auto last = s.find_last_not_of(chars);
    if (last == std::string::npos) {
        s.clear();
    } else {
        s.erase(last + 1);
    }
}

} // namespace

fs::path StorageConfig::defaultConfigPath() {
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return fs::path(xdg) / "safestore" / "safestore.conf";
    }
    const char *home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config" / "safestore" / "safestore.conf";
    }
    return {};
}

StorageConfig StorageConfig::loadDefault() {
    fs::path path = defaultConfigPath();
    std::error_code ec;
    if (!path.empty() && fs::exists(path, ec)) {
        try {
            return fromFile(path);
        } catch (const std::exception &e) {
            LOG_WARN("Failed to load " + path.string() + ", using defaults: " +
                     e.what());
        }
    }
    return StorageConfig{};
}

/**
 * @brief Parses a configuration file
 *
 * Recognised keys: app_id, group_id, data_home, cache_home, temp_base,
 * temp_prefix, verbose, log_file. Unknown keys are logged and skipped so
 * that newer config files still load.
 *
 * @param path The config file to read
 *
 * @return StorageConfig Defaults overlaid with the values from the file
 *
 * @throws std::runtime_error if the file cannot be opened
 */
StorageConfig StorageConfig::fromFile(const fs::path &path) {
    StorageConfig config;

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file " + path.string());
    }

    std::string line;
    while (std::getline(file, line)) {
        trim(line, " \t\r");
        if (line.empty() || line[0] == '#')
            continue;

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            LOG_WARN("Ignoring malformed config line: " + line);
            continue;
        }

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);
        trim(key, " \t");
        trim(value, " \t\"");

        if (key == "app_id")
            config.app_id = value;
        else if (key == "group_id")
            config.group_id = value;
        else if (key == "data_home")
            config.data_home = value;
        else if (key == "cache_home")
            config.cache_home = value;
        else if (key == "temp_base")
            config.temp_base = value;
        else if (key == "temp_prefix")
            config.temp_prefix = value;
        else if (key == "verbose")
            config.verbose = (value == "true");
        else if (key == "log_file")
            config.log_file = value;
        else
            LOG_WARN("Unknown config key: " + key);
    }

    return config;
}

bool StorageConfig::saveToFile(const fs::path &path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << "# SafeStore configuration\n";
    file << "app_id = \"" << app_id << "\"\n";
    if (!group_id.empty()) {
        file << "group_id = \"" << group_id << "\"\n";
    }
    if (!data_home.empty()) {
        file << "data_home = \"" << data_home.string() << "\"\n";
    }
    if (!cache_home.empty()) {
        file << "cache_home = \"" << cache_home.string() << "\"\n";
    }
    if (!temp_base.empty()) {
        file << "temp_base = \"" << temp_base.string() << "\"\n";
    }
    file << "temp_prefix = \"" << temp_prefix << "\"\n";
    file << "verbose = " << (verbose ? "true" : "false") << "\n";
    if (!log_file.empty()) {
        file << "log_file = \"" << log_file.string() << "\"\n";
    }

    return static_cast<bool>(file);
}

void StorageConfig::mergeWithCli(const std::string &app_id_override,
                                 const std::string &group_id_override,
                                 const fs::path &temp_base_override,
                                 bool verbose_override) {
    if (!app_id_override.empty()) {
        app_id = app_id_override;
    }
    if (!group_id_override.empty()) {
        group_id = group_id_override;
    }
    if (!temp_base_override.empty()) {
        temp_base = temp_base_override;
    }
    if (verbose_override) {
        verbose = true;
    }
}
