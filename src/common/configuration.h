#ifndef SLOTRACE_CONFIGURATION_H_
#define SLOTRACE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"

namespace SlotRace {

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
 * Finality tier the upstream filters slot notifications by
 */
enum class Commitment {
    kProcessed = 0,
    kConfirmed = 1,
    kFinalized = 2,
};

// Case-insensitive; returns nullopt for anything but processed/confirmed/finalized.
std::optional<Commitment> ParseCommitment(const std::string& value);
const char* CommitmentName(Commitment commitment);

/**
 * One upstream feed to race
 */
struct StreamConfig {
    std::string name;
    std::string endpoint;
    std::optional<std::string> access_token;
};

/**
 * Main configuration structure
 */
struct SlotRaceConfig {
    struct Race {
        ConfigValue<size_t> max_slots{kDefaultMaxSlots, "SLOTRACE_MAX_SLOTS"};
        ConfigValue<bool> stop_at_max{false, "SLOTRACE_STOP_AT_MAX"};
        ConfigValue<std::string> commitment{"processed", "SLOTRACE_COMMITMENT"};
        // Read and reported only; statistics include every tracked slot.
        ConfigValue<size_t> warmup_slots{kDefaultWarmupSlots, "SLOTRACE_WARMUP_SLOTS"};
    } race;

    struct Report {
        ConfigValue<int> summary_interval_sec{static_cast<int>(kDefaultSummaryIntervalSec), "SLOTRACE_SUMMARY_INTERVAL_SEC"};
    } report;

    struct Network {
        ConfigValue<int> connect_timeout_sec{static_cast<int>(kDefaultConnectTimeoutSec), "SLOTRACE_CONNECT_TIMEOUT_SEC"};
    } network;

    std::vector<StreamConfig> streams;
};

/**
 * Configuration manager
 */
class Configuration {
public:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const SlotRaceConfig& config() const { return config_; }
    SlotRaceConfig& config() { return config_; }

    // Helper methods for common access patterns
    size_t getMaxSlots() const { return config_.race.max_slots.get(); }
    bool getStopAtMax() const { return config_.race.stop_at_max.get(); }
    size_t getWarmupSlots() const { return config_.race.warmup_slots.get(); }
    // Only meaningful after validate() succeeded.
    Commitment getCommitment() const;
    const std::vector<StreamConfig>& getStreams() const { return config_.streams; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    SlotRaceConfig config_;
    mutable std::vector<std::string> validation_errors_;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace SlotRace

#endif // SLOTRACE_CONFIGURATION_H_
