#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace ForkOracle {

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
        return applyYaml(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return applyYaml(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::applyYaml(const YAML::Node& yaml) {
    if (yaml["fork_oracle"]) {
        auto root = yaml["fork_oracle"];

        // Corpus
        if (root["corpus"]) {
            auto corpus = root["corpus"];
            if (corpus["path"]) config_.corpus.path.set(corpus["path"].as<std::string>());
            if (corpus["scenario"]) config_.corpus.scenario.set(corpus["scenario"].as<std::string>());
            if (corpus["include_stress"]) config_.corpus.include_stress.set(corpus["include_stress"].as<bool>());
        }

        // Output
        if (root["output"]) {
            auto output = root["output"];
            if (output["envelope_path"]) config_.output.envelope_path.set(output["envelope_path"].as<std::string>());
            if (output["summary_path"]) config_.output.summary_path.set(output["summary_path"].as<std::string>());
            if (output["language"]) config_.output.language.set(output["language"].as<std::string>());
            if (output["emit_wall_time"]) config_.output.emit_wall_time.set(output["emit_wall_time"].as<bool>());
        }

        // Runtime
        if (root["runtime"]) {
            auto runtime = root["runtime"];
            if (runtime["worker_threads"]) config_.runtime.worker_threads.set(runtime["worker_threads"].as<int>());
        }

        // Logging
        if (root["logging"]) {
            auto logging = root["logging"];
            if (logging["level"]) config_.logging.level.set(logging["level"].as<int>());
        }
    } else {
        LOG(WARNING) << "Configuration has no top-level 'fork_oracle' key, keeping defaults";
    }

    return validate();
}

void Configuration::overrideFromCommandLine(const cxxopts::ParseResult& args) {
    if (args.count("corpus")) {
        config_.corpus.path.setFromCommandLine(args["corpus"].as<std::string>());
    }
    if (args.count("scenario")) {
        config_.corpus.scenario.setFromCommandLine(args["scenario"].as<std::string>());
    }
    if (args.count("stress")) {
        config_.corpus.include_stress.setFromCommandLine(true);
    }
    if (args.count("envelope_out")) {
        config_.output.envelope_path.setFromCommandLine(args["envelope_out"].as<std::string>());
    }
    if (args.count("summary_out")) {
        config_.output.summary_path.setFromCommandLine(args["summary_out"].as<std::string>());
    }
    if (args.count("language")) {
        config_.output.language.setFromCommandLine(args["language"].as<std::string>());
    }
    if (args.count("wall_time")) {
        config_.output.emit_wall_time.setFromCommandLine(true);
    }
    if (args.count("workers")) {
        config_.runtime.worker_threads.setFromCommandLine(args["workers"].as<int>());
    }
    if (args.count("log_level")) {
        config_.logging.level.setFromCommandLine(args["log_level"].as<int>());
    }
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.corpus.path.get().empty()) {
        validation_errors_.push_back("Corpus path must not be empty");
    }

    if (config_.output.language.get().empty()) {
        validation_errors_.push_back("Output language label must not be empty");
    }

    if (config_.runtime.worker_threads.get() < 1) {
        validation_errors_.push_back("Worker threads must be at least 1");
    }

    if (config_.logging.level.get() < 0) {
        validation_errors_.push_back("Log level must not be negative");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace ForkOracle
