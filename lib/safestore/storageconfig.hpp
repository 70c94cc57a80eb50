#ifndef STORAGECONFIG_HPP
#define STORAGECONFIG_HPP

#include <filesystem>
#include <string>

/**
 * @brief Settings that decide where storage roots live
 *
 * Empty path fields mean "use the environment default" (XDG variables,
 * HOME, TMPDIR). The group id is required for shared-data resolution.
 */
struct StorageConfig {
    std::string app_id = "safestore";
    std::string group_id;
    std::filesystem::path data_home;
    std::filesystem::path cache_home;
    std::filesystem::path temp_base;
    std::string temp_prefix = "safestore_temp_";
    bool verbose = false;
    std::filesystem::path log_file;

    /**
     * @brief Load the per-user config file if one exists
     *
     * Reads $XDG_CONFIG_HOME/safestore/safestore.conf (or
     * ~/.config/safestore/safestore.conf). Falls back to defaults when the
     * file is missing or unreadable.
     */
    static StorageConfig loadDefault();

    /**
     * @brief Parse a "key = value" config file
     * @throws std::runtime_error if the file cannot be opened
     */
    static StorageConfig fromFile(const std::filesystem::path &path);

    bool saveToFile(const std::filesystem::path &path) const;

    /** @brief Location loadDefault() reads from */
    static std::filesystem::path defaultConfigPath();

    void mergeWithCli(const std::string &app_id_override,
                      const std::string &group_id_override,
                      const std::filesystem::path &temp_base_override,
                      bool verbose_override);
};

#endif // STORAGECONFIG_HPP
