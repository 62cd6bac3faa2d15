#ifndef METADUMP_CONFIGURATION_H_
#define METADUMP_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>

#include "catalog/catalog_object.h"

namespace Metadump {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct MetadumpConfig {
    // Section destinations. File names are relative to directory.
    struct Output {
        ConfigValue<std::string> directory{".", "METADUMP_OUTPUT_DIR"};
        ConfigValue<std::string> global_file{"metadata_global.sql", "METADUMP_GLOBAL_FILE"};
        ConfigValue<std::string> predata_file{"metadata_predata.sql", "METADUMP_PREDATA_FILE"};
        ConfigValue<std::string> postdata_file{"metadata_postdata.sql", "METADUMP_POSTDATA_FILE"};
        ConfigValue<std::string> toc_file{"toc.yaml", "METADUMP_TOC_FILE"};
    } output;

    struct Dump {
        // Emit global, predata and postdata on separate threads.
        ConfigValue<bool> parallel_sections{true, "METADUMP_PARALLEL_SECTIONS"};
        ConfigValue<bool> sync_on_commit{true, "METADUMP_SYNC_ON_COMMIT"};
    } dump;

    struct Logging {
        // Empty directory logs to stderr only.
        ConfigValue<std::string> directory{"", "METADUMP_LOG_DIR"};
        ConfigValue<int> verbosity{0, "METADUMP_LOG_LEVEL"};
    } logging;
};

/**
 * Configuration manager
 */
class Configuration {
public:
    static Configuration& getInstance();

    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const MetadumpConfig& config() const { return config_; }
    MetadumpConfig& config() { return config_; }

    // Destination of a section stream: output directory joined with its file name
    std::string getSectionPath(Section section) const;
    std::string getTocPath() const;
    bool getParallelSections() const { return config_.dump.parallel_sections.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    MetadumpConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Metadump

#endif // METADUMP_CONFIGURATION_H_
