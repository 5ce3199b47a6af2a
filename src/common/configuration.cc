#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace SlotRace {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

bool HasSupportedScheme(const std::string& endpoint) {
    return endpoint.rfind("https://", 0) == 0 || endpoint.rfind("http://", 0) == 0;
}

// Parses the "slotrace" section (or the document root when that key is absent).
void ParseRoot(const YAML::Node& yaml, SlotRaceConfig& config) {
    YAML::Node root = yaml["slotrace"] ? yaml["slotrace"] : yaml;

    if (root["max_slots"]) config.race.max_slots.set(root["max_slots"].as<size_t>());
    if (root["stop_at_max"]) config.race.stop_at_max.set(root["stop_at_max"].as<bool>());
    if (root["commitment"]) config.race.commitment.set(root["commitment"].as<std::string>());
    if (root["warmup_slots"]) config.race.warmup_slots.set(root["warmup_slots"].as<size_t>());
    if (root["summary_interval_sec"]) config.report.summary_interval_sec.set(root["summary_interval_sec"].as<int>());
    if (root["connect_timeout_sec"]) config.network.connect_timeout_sec.set(root["connect_timeout_sec"].as<int>());

    if (root["streams"]) {
        config.streams.clear();
        for (const auto& node : root["streams"]) {
            StreamConfig stream;
            if (node["name"]) stream.name = node["name"].as<std::string>();
            if (node["endpoint"]) stream.endpoint = node["endpoint"].as<std::string>();
            if (node["access_token"] && !node["access_token"].IsNull()) {
                stream.access_token = node["access_token"].as<std::string>();
            }
            config.streams.push_back(std::move(stream));
        }
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
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        // stoull accepts a leading '-' and wraps it
        std::string val(env_val);
        size_t first = val.find_first_not_of(" \t");
        if (first != std::string::npos && val[first] == '-') {
            LOG(WARNING) << "Negative value for env var " << env_var_ << ": " << env_val;
            return std::nullopt;
        }
        try {
            return std::stoull(env_val);
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
        std::string val = ToLower(env_val);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

std::optional<Commitment> ParseCommitment(const std::string& value) {
    std::string lowered = ToLower(value);
    if (lowered == "processed") return Commitment::kProcessed;
    if (lowered == "confirmed") return Commitment::kConfirmed;
    if (lowered == "finalized") return Commitment::kFinalized;
    return std::nullopt;
}

const char* CommitmentName(Commitment commitment) {
    switch (commitment) {
        case Commitment::kProcessed: return "processed";
        case Commitment::kConfirmed: return "confirmed";
        case Commitment::kFinalized: return "finalized";
    }
    return "unknown";
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        ParseRoot(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        validation_errors_ = {std::string("Failed to parse ") + filename + ": " + e.what()};
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        ParseRoot(yaml, config_);
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        validation_errors_ = {std::string("Failed to parse configuration: ") + e.what()};
        return false;
    }
}

Commitment Configuration::getCommitment() const {
    return ParseCommitment(config_.race.commitment.get()).value_or(Commitment::kProcessed);
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.streams.empty()) {
        validation_errors_.push_back("No streams configured");
    }

    std::set<std::string> names;
    for (size_t i = 0; i < config_.streams.size(); ++i) {
        const StreamConfig& stream = config_.streams[i];
        const std::string where = "Stream #" + std::to_string(i + 1);
        if (stream.name.empty()) {
            validation_errors_.push_back(where + " has no name");
        } else if (!names.insert(stream.name).second) {
            validation_errors_.push_back(where + " reuses the name " + stream.name);
        }
        if (stream.endpoint.empty()) {
            validation_errors_.push_back(where + " has no endpoint");
        } else if (!HasSupportedScheme(stream.endpoint)) {
            validation_errors_.push_back(where + " endpoint must start with http:// or https://");
        }
    }

    if (!ParseCommitment(config_.race.commitment.get()).has_value()) {
        validation_errors_.push_back("Invalid commitment level '" + config_.race.commitment.get() +
                                     "' (expected processed, confirmed or finalized)");
    }

    if (config_.race.max_slots.get() < 1) {
        validation_errors_.push_back("max_slots must be at least 1");
    }

    if (config_.report.summary_interval_sec.get() < 1) {
        validation_errors_.push_back("summary_interval_sec must be at least 1");
    }

    if (config_.network.connect_timeout_sec.get() < 1) {
        validation_errors_.push_back("connect_timeout_sec must be at least 1");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace SlotRace
