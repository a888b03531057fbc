#include "transfer_config.h"
#include "logger.h"

#include <fstream>
#include <sstream>
#include <chrono>
#include <limits>

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace whisp {

namespace {

constexpr int kConfigVersion = 1;

void set_error(std::string* error_out, const std::string& message) {
    if (error_out) {
        *error_out = message;
    }
}

// Reads an optional integer key; the value must be non-negative and fit T
template <typename T>
bool read_unsigned(const nlohmann::json& json, const char* key, T& value, std::string* error_out) {
    auto it = json.find(key);
    if (it == json.end()) {
        return true;
    }
    // Integers built in code are stored signed; parsed ones are unsigned when non-negative
    bool non_negative = it->is_number_unsigned() ||
                        (it->is_number_integer() && it->get<int64_t>() >= 0);
    if (!non_negative) {
        set_error(error_out, std::string(key) + " must be a non-negative integer");
        return false;
    }
    uint64_t raw = it->get<uint64_t>();
    if (raw > std::numeric_limits<T>::max()) {
        set_error(error_out, std::string(key) + " is out of range");
        return false;
    }
    value = static_cast<T>(raw);
    return true;
}

} // namespace

const char* checksum_policy_to_string(ChecksumPolicy policy) {
    switch (policy) {
        case ChecksumPolicy::RECORD_ONLY:      return "record_only";
        case ChecksumPolicy::FAIL_ON_MISMATCH: return "fail_on_mismatch";
        default: return "unknown";
    }
}

bool checksum_policy_from_string(const std::string& name, ChecksumPolicy& policy) {
    if (name == "record_only") {
        policy = ChecksumPolicy::RECORD_ONLY;
        return true;
    }
    if (name == "fail_on_mismatch") {
        policy = ChecksumPolicy::FAIL_ON_MISMATCH;
        return true;
    }
    return false;
}

nlohmann::json transfer_config_to_json(const TransferConfig& config) {
    nlohmann::json json;
    json["version"] = kConfigVersion;
    json["max_file_size"] = config.max_file_size;
    json["download_directory"] = config.download_directory;
    json["auto_accept_max_size"] = config.auto_accept_max_size;
    json["io_buffer_size"] = config.io_buffer_size;
    json["event_queue_capacity"] = config.event_queue_capacity;
    json["event_workers"] = config.event_workers;
    json["checksum_policy"] = checksum_policy_to_string(config.checksum_policy);
    return json;
}

bool transfer_config_from_json(const nlohmann::json& json, TransferConfig& config, std::string* error_out) {
    if (!json.is_object()) {
        set_error(error_out, "configuration must be a JSON object");
        return false;
    }

    TransferConfig parsed = config;

    try {
        if (!read_unsigned(json, "max_file_size", parsed.max_file_size, error_out) ||
            !read_unsigned(json, "auto_accept_max_size", parsed.auto_accept_max_size, error_out) ||
            !read_unsigned(json, "io_buffer_size", parsed.io_buffer_size, error_out) ||
            !read_unsigned(json, "event_queue_capacity", parsed.event_queue_capacity, error_out) ||
            !read_unsigned(json, "event_workers", parsed.event_workers, error_out)) {
            return false;
        }
        parsed.download_directory = json.value("download_directory", parsed.download_directory);

        if (json.contains("checksum_policy")) {
            std::string policy = json.at("checksum_policy").get<std::string>();
            if (!checksum_policy_from_string(policy, parsed.checksum_policy)) {
                set_error(error_out, "unknown checksum_policy: " + policy);
                return false;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        set_error(error_out, std::string("invalid configuration value: ") + e.what());
        return false;
    }

    if (parsed.io_buffer_size == 0) {
        set_error(error_out, "io_buffer_size must be positive");
        return false;
    }
    if (parsed.event_queue_capacity == 0) {
        set_error(error_out, "event_queue_capacity must be positive");
        return false;
    }
    if (parsed.event_workers > kMaxEventWorkers) {
        set_error(error_out, "event_workers must not exceed " + std::to_string(kMaxEventWorkers));
        return false;
    }

    config = parsed;
    return true;
}

bool load_transfer_config(const std::string& path, TransferConfig& config, std::string* error_out) {
    std::ifstream file(path);
    if (!file) {
        set_error(error_out, "cannot open configuration file " + path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string data = buffer.str();
    if (data.empty()) {
        set_error(error_out, "configuration file is empty");
        return false;
    }

    try {
        nlohmann::json json = nlohmann::json::parse(data);
        if (!transfer_config_from_json(json, config, error_out)) {
            return false;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file: " << e.what());
        set_error(error_out, std::string("failed to parse configuration: ") + e.what());
        return false;
    }

    LOG_CONFIG_INFO("Loaded transfer configuration from " << path);
    return true;
}

bool save_transfer_config(const std::string& path, const TransferConfig& config, std::string* error_out) {
    nlohmann::json json = transfer_config_to_json(config);

    auto now = std::chrono::system_clock::now();
    json["last_updated"] = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();

    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        set_error(error_out, "cannot write configuration file " + path);
        return false;
    }

    file << json.dump(4) << "\n";
    file.flush();
    if (!file) {
        set_error(error_out, "failed writing configuration file " + path);
        return false;
    }

    LOG_CONFIG_DEBUG("Saved transfer configuration to " << path);
    return true;
}

} // namespace whisp
