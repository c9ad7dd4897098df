#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "config.hpp"
#include "test_helpers.hpp"

using namespace doppler_bridge;

namespace {

class ScopedEnv {
public:
  ScopedEnv(const char *name, const char *value) : name_(name) {
    if (const char *old = std::getenv(name)) {
      old_ = old;
      had_old_ = true;
    }
    if (value) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }
  ~ScopedEnv() {
    if (had_old_) {
      ::setenv(name_, old_.c_str(), 1);
    } else {
      ::unsetenv(name_);
    }
  }

private:
  const char *name_;
  std::string old_;
  bool had_old_ = false;
};

} // namespace

TEST(Config, DefaultsMatchReferenceBridge) {
  const BridgeConfig config = default_config();
  const std::vector<std::string> expected = {"/Users", "/home", "/tmp",
                                             "/var/tmp"};
  EXPECT_EQ(config.access.allowed_dirs, expected);
  EXPECT_EQ(config.limits.chunk_bytes, 8ull * 1024 * 1024);
  EXPECT_EQ(config.limits.max_read_bytes, 100ull * 1024 * 1024);
  EXPECT_EQ(config.transport.max_message_bytes, 1024u * 1024u);
  EXPECT_EQ(config.flow_control.window, 0u);
  EXPECT_NO_THROW(validate_config(config));
}

TEST(Config, ParsesAllSections) {
  const YAML::Node yaml = YAML::Load(R"(
bridge:
  allowed_dirs: [/data/models, /srv/cache]
limits:
  chunk_bytes: 4096
  max_read_bytes: 65536
transport:
  max_message_bytes: 2048
flow_control:
  window: 3
)");

  const BridgeConfig config = parse_config(yaml, default_config());
  const std::vector<std::string> expected = {"/data/models", "/srv/cache"};
  EXPECT_EQ(config.access.allowed_dirs, expected);
  EXPECT_EQ(config.limits.chunk_bytes, 4096u);
  EXPECT_EQ(config.limits.max_read_bytes, 65536u);
  EXPECT_EQ(config.transport.max_message_bytes, 2048u);
  EXPECT_EQ(config.flow_control.window, 3u);
}

TEST(Config, MissingSectionsKeepDefaults) {
  const YAML::Node yaml = YAML::Load("limits:\n  chunk_bytes: 1024\n");
  const BridgeConfig config = parse_config(yaml, default_config());
  EXPECT_EQ(config.limits.chunk_bytes, 1024u);
  EXPECT_EQ(config.access.allowed_dirs, default_config().access.allowed_dirs);
  EXPECT_EQ(config.limits.max_read_bytes, kDefaultMaxReadBytes);
}

TEST(Config, EmptyDocumentYieldsDefaults) {
  const BridgeConfig config = parse_config(YAML::Load(""), default_config());
  EXPECT_EQ(config.access.allowed_dirs, default_config().access.allowed_dirs);
}

TEST(Config, RejectsInvalidValues) {
  const char *bad_docs[] = {
      "bridge:\n  allowed_dirs: [relative/dir]\n",
      "bridge:\n  allowed_dirs: []\n",
      "bridge:\n  allowed_dirs: /tmp\n",
      "bridge: [1, 2]\n",
      "limits:\n  chunk_bytes: 0\n",
      "limits:\n  chunk_bytes: -5\n",
      "limits:\n  chunk_bytes: 5000000000\n",
      "limits:\n  max_read_bytes: 0\n",
      "limits:\n  max_read_bytes: lots\n",
      "transport:\n  max_message_bytes: 8\n",
      "flow_control:\n  window: -1\n",
  };

  for (const char *doc : bad_docs) {
    EXPECT_THROW(parse_config(YAML::Load(doc), default_config()),
                 std::runtime_error)
        << doc;
  }
}

TEST(Config, UnknownSectionsAreIgnored) {
  const YAML::Node yaml = YAML::Load("logging:\n  level: debug\n");
  EXPECT_NO_THROW(parse_config(yaml, default_config()));
}

TEST(Config, LoadConfigReadsFileAndRecordsPath) {
  test_helpers::TempDir dir;
  const std::string text = "bridge:\n  allowed_dirs: [/opt/models]\n";
  const auto path = dir.write_file(
      "bridge.yaml", std::vector<uint8_t>(text.begin(), text.end()));

  const BridgeConfig config = load_config(path.string());
  ASSERT_EQ(config.access.allowed_dirs.size(), 1u);
  EXPECT_EQ(config.access.allowed_dirs[0], "/opt/models");
  EXPECT_EQ(config.config_file_path, path.string());
}

TEST(Config, LoadConfigMissingFileThrows) {
  EXPECT_THROW(load_config("/nonexistent/doppler-bridge.yaml"),
               std::runtime_error);
}

TEST(Config, SplitDirListDropsEmptyEntries) {
  const std::vector<std::string> expected = {"/a", "/b/c", "/d"};
  EXPECT_EQ(split_dir_list("/a::/b/c:/d:"), expected);
  EXPECT_TRUE(split_dir_list("").empty());
  EXPECT_EQ(split_dir_list("/only"), std::vector<std::string>{"/only"});
}

TEST(Config, EnvOverrideReplacesAllowedDirs) {
  ScopedEnv env(kAllowedDirsEnv, "/mnt/a:/mnt/b");
  BridgeConfig config = default_config();
  EXPECT_TRUE(apply_env_overrides(config));
  const std::vector<std::string> expected = {"/mnt/a", "/mnt/b"};
  EXPECT_EQ(config.access.allowed_dirs, expected);
}

TEST(Config, EnvOverrideAbsentLeavesConfigUntouched) {
  ScopedEnv env(kAllowedDirsEnv, nullptr);
  BridgeConfig config = default_config();
  EXPECT_FALSE(apply_env_overrides(config));
  EXPECT_EQ(config.access.allowed_dirs, default_config().access.allowed_dirs);
}

TEST(Config, EnvOverrideWithRelativeDirThrows) {
  ScopedEnv env(kAllowedDirsEnv, "/ok:not-absolute");
  BridgeConfig config = default_config();
  EXPECT_THROW(apply_env_overrides(config), std::runtime_error);
}
