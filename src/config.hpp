#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace doppler_bridge {

// Environment variable naming the YAML config file when --config is absent.
constexpr const char *kConfigPathEnv = "DOPPLER_BRIDGE_CONFIG";

// Colon-separated allow-list; overrides bridge.allowed_dirs.
constexpr const char *kAllowedDirsEnv = "DOPPLER_ALLOWED_DIRS";

constexpr uint64_t kDefaultMaxReadBytes = 100ull * 1024ull * 1024ull;
constexpr uint32_t kDefaultMaxMessageBytes = 1024u * 1024u;

// Allow-listed roots that bound every READ
struct AccessConfig {
  std::vector<std::string> allowed_dirs;
};

struct LimitsConfig {
  uint64_t chunk_bytes;    // READ_RESPONSE transfer unit
  uint64_t max_read_bytes; // cap on one READ request
};

struct TransportConfig {
  uint32_t max_message_bytes; // inbound envelope cap
};

struct FlowControlConfig {
  // Chunk frames that may be written before an ack is required. 0 disables
  // flow control.
  uint32_t window;
};

// Complete bridge configuration
struct BridgeConfig {
  std::string config_file_path; // empty when running on defaults
  AccessConfig access;
  LimitsConfig limits;
  TransportConfig transport;
  FlowControlConfig flow_control;
};

// Built-in defaults: /Users, /home, /tmp, /var/tmp; 8 MiB chunks; 100 MiB per
// request; 1 MiB inbound messages; flow control off.
BridgeConfig default_config();

// Load configuration from YAML file on top of the defaults
// Throws std::runtime_error if file cannot be read, parsed, or validated
BridgeConfig load_config(const std::string &path);

// Apply a parsed YAML document on top of base
// Throws std::runtime_error on validation failure
BridgeConfig parse_config(const YAML::Node &yaml, BridgeConfig base);

// Split a colon-separated directory list, dropping empty entries
std::vector<std::string> split_dir_list(const std::string &list);

// Apply DOPPLER_ALLOWED_DIRS when set. Returns true if an override happened.
// Throws std::runtime_error if the resulting list is invalid
bool apply_env_overrides(BridgeConfig &config);

// Throws std::runtime_error describing the first invalid field
void validate_config(const BridgeConfig &config);

} // namespace doppler_bridge
