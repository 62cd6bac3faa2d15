#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <set>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Metadump {

namespace {

std::string JoinPath(const std::string& directory, const std::string& file) {
    if (directory.empty() || file.empty() || file.front() == '/') {
        return file;
    }
    if (directory.back() == '/') {
        return directory + file;
    }
    return directory + "/" + file;
}

void applyYaml(const YAML::Node& yaml, MetadumpConfig& config) {
    if (!yaml["metadump"]) {
        return;
    }
    auto root = yaml["metadump"];

    // Output
    if (root["output"]) {
        auto output = root["output"];
        if (output["directory"]) config.output.directory.set(output["directory"].as<std::string>());
        if (output["global_file"]) config.output.global_file.set(output["global_file"].as<std::string>());
        if (output["predata_file"]) config.output.predata_file.set(output["predata_file"].as<std::string>());
        if (output["postdata_file"]) config.output.postdata_file.set(output["postdata_file"].as<std::string>());
        if (output["toc_file"]) config.output.toc_file.set(output["toc_file"].as<std::string>());
    }

    // Dump
    if (root["dump"]) {
        auto dump = root["dump"];
        if (dump["parallel_sections"]) config.dump.parallel_sections.set(dump["parallel_sections"].as<bool>());
        if (dump["sync_on_commit"]) config.dump.sync_on_commit.set(dump["sync_on_commit"].as<bool>());
    }

    // Logging
    if (root["logging"]) {
        auto logging = root["logging"];
        if (logging["directory"]) config.logging.directory.set(logging["directory"].as<std::string>());
        if (logging["verbosity"]) config.logging.verbosity.set(logging["verbosity"].as<int>());
    }
}

} // namespace

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        applyYaml(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        applyYaml(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

std::string Configuration::getSectionPath(Section section) const {
    const auto& output = config_.output;
    switch (section) {
        case Section::kGlobal:
            return JoinPath(output.directory.get(), output.global_file.get());
        case Section::kPredata:
            return JoinPath(output.directory.get(), output.predata_file.get());
        case Section::kPostdata:
            return JoinPath(output.directory.get(), output.postdata_file.get());
    }
    return std::string();
}

std::string Configuration::getTocPath() const {
    return JoinPath(config_.output.directory.get(), config_.output.toc_file.get());
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.output.directory.get().empty()) {
        validation_errors_.push_back("Output directory must not be empty");
    }

    // Every section and the TOC need their own file
    const std::vector<std::pair<const char*, std::string>> files = {
        {"global_file", config_.output.global_file.get()},
        {"predata_file", config_.output.predata_file.get()},
        {"postdata_file", config_.output.postdata_file.get()},
        {"toc_file", config_.output.toc_file.get()},
    };
    std::set<std::string> seen;
    for (const auto& file : files) {
        if (file.second.empty()) {
            validation_errors_.push_back(std::string("Output ") + file.first + " must not be empty");
        } else if (!seen.insert(file.second).second) {
            validation_errors_.push_back(std::string("Output ") + file.first + " " + file.second +
                                         " is already used by another output");
        }
    }

    if (config_.logging.verbosity.get() < 0) {
        validation_errors_.push_back("Log verbosity must not be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Metadump
