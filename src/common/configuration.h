#ifndef FORK_ORACLE_CONFIGURATION_H_
#define FORK_ORACLE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include <cxxopts.hpp>

#include "config.h"

namespace YAML {
class Node;
}

namespace ForkOracle {

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
        if (!overridden_ && !env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    // Value from a config file; environment still wins over it.
    void set(T value) { value_ = value; }
    // Value from the command line; wins over both file and environment.
    void setFromCommandLine(T value) {
        value_ = value;
        overridden_ = true;
    }

private:
    T value_;
    std::string env_var_;
    bool overridden_ = false;

    std::optional<T> getEnvValue() const;
};

template<> std::optional<int> ConfigValue<int>::getEnvValue() const;
template<> std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;
template<> std::optional<bool> ConfigValue<bool>::getEnvValue() const;

/**
 * Main configuration structure
 */
struct OracleConfig {
    struct Corpus {
        ConfigValue<std::string> path{kDefaultCorpusPath, "FORK_ORACLE_CORPUS"};
        // Empty means every scenario
        ConfigValue<std::string> scenario{"", "FORK_ORACLE_SCENARIO"};
        ConfigValue<bool> include_stress{false, "FORK_ORACLE_INCLUDE_STRESS"};
    } corpus;

    struct Output {
        // JSONL file each envelope is appended to. Empty disables it.
        ConfigValue<std::string> envelope_path{"", "FORK_ORACLE_ENVELOPE_OUT"};
        // Pretty-printed run summary. Empty disables it.
        ConfigValue<std::string> summary_path{"", "FORK_ORACLE_SUMMARY_OUT"};
        ConfigValue<std::string> language{kDefaultLanguage, "FORK_ORACLE_LANGUAGE"};
        // wall_time_ms is not reproducible, so it stays out of envelopes unless asked for.
        ConfigValue<bool> emit_wall_time{false, "FORK_ORACLE_EMIT_WALL_TIME"};
    } output;

    struct Runtime {
        ConfigValue<int> worker_threads{1, "FORK_ORACLE_WORKER_THREADS"};
    } runtime;

    struct Logging {
        ConfigValue<int> level{0, "FORK_ORACLE_LOG_LEVEL"};
    } logging;
};

/**
 * Configuration manager
 *
 * Precedence, lowest first: built-in defaults, YAML file, FORK_ORACLE_* environment,
 * command line.
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Override with parsed command line arguments
    void overrideFromCommandLine(const cxxopts::ParseResult& args);

    const OracleConfig& config() const { return config_; }
    OracleConfig& config() { return config_; }

    // Helper methods for common access patterns
    std::string getCorpusPath() const { return config_.corpus.path.get(); }
    std::string getScenarioFilter() const { return config_.corpus.scenario.get(); }
    std::string getLanguage() const { return config_.output.language.get(); }
    int getWorkerThreads() const { return config_.runtime.worker_threads.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    bool applyYaml(const YAML::Node& yaml);

    OracleConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

} // namespace ForkOracle

#endif // FORK_ORACLE_CONFIGURATION_H_
