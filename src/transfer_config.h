#pragma once

#include "transfer_types.h"

#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace whisp {

// Upper bound on TransferConfig::event_workers
constexpr uint32_t kMaxEventWorkers = 64;

/**
 * File transfer configuration
 */
struct TransferConfig {
    uint64_t max_file_size;         // Largest file sent or accepted (default: 2GB)
    std::string download_directory; // Save directory when AcceptIncoming gets none
    uint64_t auto_accept_max_size;  // Auto-accept incoming files up to this size (0: disabled)
    uint32_t io_buffer_size;        // Read buffer for digest computation (default: 64KB)
    uint32_t event_queue_capacity;  // Queued transport events per lane (default: 1024)
    uint32_t event_workers;         // Event lanes; 0 services events on the Transport thread
    ChecksumPolicy checksum_policy; // Digest mismatch handling on incoming completion

    TransferConfig()
        : max_file_size(2ULL * 1024 * 1024 * 1024),
          download_directory("./downloads"),
          auto_accept_max_size(0),
          io_buffer_size(65536),
          event_queue_capacity(1024),
          event_workers(2),
          checksum_policy(ChecksumPolicy::RECORD_ONLY) {}
};

nlohmann::json transfer_config_to_json(const TransferConfig& config);

/**
 * Parse a configuration document. Missing keys keep their defaults,
 * unknown keys are ignored.
 * @param json Source document
 * @param config Receives the parsed configuration only on success
 * @param error_out Optional error description on failure
 * @return false if a value has the wrong type or is out of range
 */
bool transfer_config_from_json(const nlohmann::json& json, TransferConfig& config,
                               std::string* error_out = nullptr);

/**
 * Load configuration from a JSON file
 * @return false if the file cannot be read or parsed; config is left untouched
 */
bool load_transfer_config(const std::string& path, TransferConfig& config,
                          std::string* error_out = nullptr);

/**
 * Save configuration as a pretty-printed JSON file
 */
bool save_transfer_config(const std::string& path, const TransferConfig& config,
                          std::string* error_out = nullptr);

const char* checksum_policy_to_string(ChecksumPolicy policy);
bool checksum_policy_from_string(const std::string& name, ChecksumPolicy& policy);

} // namespace whisp
