#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "core/handlers.hpp"
#include "core/session.hpp"
#include "files/file_reader.hpp"
#include "files/path_validator.hpp"

static void log_err(const std::string &msg) {
  std::cerr << "doppler-bridge: " << msg << "\n";
}

int main(int argc, char **argv) {
  std::optional<std::string> config_path;

  // The browser launches native hosts with the caller origin as an argument;
  // anything unrecognized is ignored.
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cerr << "Usage: doppler-bridge [--config <path/to/config.yaml>]\n"
                << "  env " << doppler_bridge::kConfigPathEnv
                << ": config file when --config is absent\n"
                << "  env " << doppler_bridge::kAllowedDirsEnv
                << ": colon-separated allowed directories (overrides config)\n";
      return 0;
    }
  }

  if (!config_path) {
    if (const char *env = std::getenv(doppler_bridge::kConfigPathEnv)) {
      config_path = std::string(env);
    }
  }

  doppler_bridge::BridgeConfig config;
  try {
    if (config_path) {
      log_err("loading configuration from: " + *config_path);
      config = doppler_bridge::load_config(*config_path);
    } else {
      config = doppler_bridge::default_config();
    }

    if (doppler_bridge::apply_env_overrides(config)) {
      log_err(std::string("allowed_dirs overridden by ") +
              doppler_bridge::kAllowedDirsEnv);
    }
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to load configuration: " + std::string(e.what()));
    return 1;
  }

  const bridge_fs::PathValidator validator(config.access);
  for (const auto &root : validator.canonical_roots()) {
    log_err("allowed root: " + root);
  }

  const bridge_fs::FileReader reader(validator, config.limits);
  const handlers::CommandDispatcher dispatcher(reader);

  bridge_core::SessionOptions options;
  options.max_message_bytes = config.transport.max_message_bytes;
  options.window = config.flow_control.window;

  log_err("starting (transport=stdio+uint32_le+json, chunk_bytes=" +
          std::to_string(config.limits.chunk_bytes) +
          ", window=" + std::to_string(options.window) + ")");

  bridge_core::Session session(std::cin, std::cout, dispatcher, options);
  const int rc = session.run();

  if (rc == bridge_core::kExitOk) {
    log_err("EOF on stdin; exiting cleanly");
  } else {
    log_err("transport failure; exiting with code " + std::to_string(rc));
  }
  return rc;
}
