#include "config.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include "protocol/frame.hpp"

namespace doppler_bridge {

namespace fs = std::filesystem;

BridgeConfig default_config() {
  BridgeConfig config;
  config.access.allowed_dirs = {"/Users", "/home", "/tmp", "/var/tmp"};
  config.limits.chunk_bytes = bridge_protocol::kDefaultChunkBytes;
  config.limits.max_read_bytes = kDefaultMaxReadBytes;
  config.transport.max_message_bytes = kDefaultMaxMessageBytes;
  config.flow_control.window = 0;
  return config;
}

static std::vector<std::string> parse_dir_sequence(const YAML::Node &node,
                                                   const std::string &field) {
  if (!node.IsSequence()) {
    throw std::runtime_error("[CONFIG] '" + field + "' must be a sequence");
  }

  std::vector<std::string> dirs;
  for (std::size_t i = 0; i < node.size(); ++i) {
    try {
      dirs.push_back(node[i].as<std::string>());
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("[CONFIG] Invalid " + field + "[" +
                               std::to_string(i) + "]: " + e.what());
    }
  }
  return dirs;
}

template <typename T>
static T parse_unsigned(const YAML::Node &node, const std::string &field) {
  try {
    // yaml-cpp wraps negative literals into large unsigned values; go through
    // a signed read first to catch them.
    const long long signed_value = node.as<long long>();
    if (signed_value < 0) {
      throw std::runtime_error("[CONFIG] '" + field + "' must be >= 0");
    }
    return node.as<T>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Invalid '" + field + "': " + e.what());
  }
}

static void require_map(const YAML::Node &node, const std::string &section) {
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] '" + section +
                             "' section must be a map");
  }
}

BridgeConfig parse_config(const YAML::Node &yaml, BridgeConfig base) {
  BridgeConfig config = std::move(base);

  if (!yaml || yaml.IsNull()) {
    validate_config(config);
    return config;
  }
  require_map(yaml, "<root>");

  if (yaml["bridge"]) {
    require_map(yaml["bridge"], "bridge");
    if (yaml["bridge"]["allowed_dirs"]) {
      config.access.allowed_dirs =
          parse_dir_sequence(yaml["bridge"]["allowed_dirs"],
                             "bridge.allowed_dirs");
    }
  }

  if (yaml["limits"]) {
    require_map(yaml["limits"], "limits");
    if (yaml["limits"]["chunk_bytes"]) {
      config.limits.chunk_bytes = parse_unsigned<uint64_t>(
          yaml["limits"]["chunk_bytes"], "limits.chunk_bytes");
    }
    if (yaml["limits"]["max_read_bytes"]) {
      config.limits.max_read_bytes = parse_unsigned<uint64_t>(
          yaml["limits"]["max_read_bytes"], "limits.max_read_bytes");
    }
  }

  if (yaml["transport"]) {
    require_map(yaml["transport"], "transport");
    if (yaml["transport"]["max_message_bytes"]) {
      config.transport.max_message_bytes =
          parse_unsigned<uint32_t>(yaml["transport"]["max_message_bytes"],
                                   "transport.max_message_bytes");
    }
  }

  if (yaml["flow_control"]) {
    require_map(yaml["flow_control"], "flow_control");
    if (yaml["flow_control"]["window"]) {
      config.flow_control.window = parse_unsigned<uint32_t>(
          yaml["flow_control"]["window"], "flow_control.window");
    }
  }

  for (const auto &kv : yaml) {
    const std::string key = kv.first.as<std::string>();
    if (key != "bridge" && key != "limits" && key != "transport" &&
        key != "flow_control") {
      std::cerr << "[Config] ignoring unknown section '" << key << "'\n";
    }
  }

  validate_config(config);
  return config;
}

BridgeConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  BridgeConfig config = parse_config(yaml, default_config());
  config.config_file_path = fs::absolute(path).string();
  return config;
}

std::vector<std::string> split_dir_list(const std::string &list) {
  std::vector<std::string> dirs;
  std::string::size_type start = 0;
  while (start <= list.size()) {
    const auto end = list.find(':', start);
    const std::string item = list.substr(
        start, end == std::string::npos ? std::string::npos : end - start);
    if (!item.empty()) {
      dirs.push_back(item);
    }
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return dirs;
}

bool apply_env_overrides(BridgeConfig &config) {
  const char *env = std::getenv(kAllowedDirsEnv);
  if (env == nullptr) {
    return false;
  }

  config.access.allowed_dirs = split_dir_list(env);
  validate_config(config);
  return true;
}

void validate_config(const BridgeConfig &config) {
  if (config.access.allowed_dirs.empty()) {
    throw std::runtime_error("[CONFIG] allowed_dirs must not be empty");
  }
  for (const auto &dir : config.access.allowed_dirs) {
    if (dir.empty() || !fs::path(dir).is_absolute()) {
      throw std::runtime_error("[CONFIG] allowed_dirs entry '" + dir +
                               "' must be an absolute path");
    }
  }

  if (config.limits.chunk_bytes == 0 ||
      config.limits.chunk_bytes > bridge_protocol::kMaxChunkBytes) {
    throw std::runtime_error(
        "[CONFIG] limits.chunk_bytes must be in range [1, " +
        std::to_string(bridge_protocol::kMaxChunkBytes) + "]");
  }
  if (config.limits.max_read_bytes == 0) {
    throw std::runtime_error("[CONFIG] limits.max_read_bytes must be > 0");
  }
  if (config.transport.max_message_bytes < bridge_protocol::kHeaderSize) {
    throw std::runtime_error(
        "[CONFIG] transport.max_message_bytes must be >= " +
        std::to_string(bridge_protocol::kHeaderSize));
  }
}

} // namespace doppler_bridge
