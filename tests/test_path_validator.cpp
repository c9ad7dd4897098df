#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "files/path_validator.hpp"
#include "test_helpers.hpp"

using bridge_fs::PathValidator;
using test_helpers::TempDir;

namespace fs = std::filesystem;

class PathValidatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    allowed_ = tmp_.make_dir("allowed");
    outside_ = tmp_.make_dir("outside");
    inside_file_ = tmp_.write_file("allowed/model.bin", {1, 2, 3});
    outside_file_ = tmp_.write_file("outside/secret.txt", {4, 5, 6});
  }

  TempDir tmp_;
  fs::path allowed_;
  fs::path outside_;
  fs::path inside_file_;
  fs::path outside_file_;
};

TEST_F(PathValidatorTest, AllowsExistingFileUnderRoot) {
  PathValidator validator({allowed_.string()});
  EXPECT_TRUE(validator.is_allowed(inside_file_.string()));
}

TEST_F(PathValidatorTest, AllowsRootItself) {
  PathValidator validator({allowed_.string()});
  EXPECT_TRUE(validator.is_allowed(allowed_.string()));
}

TEST_F(PathValidatorTest, RejectsRelativePaths) {
  PathValidator validator({allowed_.string()});
  EXPECT_FALSE(validator.is_allowed("allowed/model.bin"));
  EXPECT_FALSE(validator.is_allowed(""));
}

TEST_F(PathValidatorTest, RejectsPathsOutsideEveryRoot) {
  PathValidator validator({allowed_.string()});
  EXPECT_FALSE(validator.is_allowed(outside_file_.string()));
  EXPECT_FALSE(validator.is_allowed("/etc/passwd"));
}

TEST_F(PathValidatorTest, EtcPasswdRejectedWithHomeAndTmpRoots) {
  PathValidator validator(std::vector<std::string>{"/home", "/tmp"});
  EXPECT_FALSE(validator.is_allowed("/etc/passwd"));
}

TEST_F(PathValidatorTest, RejectsDotDotTraversalOutOfRoot) {
  PathValidator validator({allowed_.string()});
  const std::string traversal =
      allowed_.string() + "/../outside/secret.txt";
  EXPECT_FALSE(validator.is_allowed(traversal));
}

TEST_F(PathValidatorTest, AllowsDotDotThatStaysInsideRoot) {
  tmp_.make_dir("allowed/sub");
  PathValidator validator({allowed_.string()});
  EXPECT_TRUE(validator.is_allowed(allowed_.string() + "/sub/../model.bin"));
}

TEST_F(PathValidatorTest, RejectsSymlinkEscapingRoot) {
  const fs::path link = allowed_ / "escape";
  fs::create_symlink(outside_file_, link);

  PathValidator validator({allowed_.string()});
  EXPECT_FALSE(validator.is_allowed(link.string()));
}

TEST_F(PathValidatorTest, AllowsSymlinkedRoot) {
  const fs::path link_root = tmp_.path() / "linked";
  fs::create_directory_symlink(allowed_, link_root);

  PathValidator validator({link_root.string()});
  EXPECT_TRUE(validator.is_allowed((link_root / "model.bin").string()));
  ASSERT_EQ(validator.canonical_roots().size(), 1u);
  EXPECT_EQ(validator.canonical_roots()[0], allowed_.string());
}

TEST_F(PathValidatorTest, RespectsDirectoryBoundaries) {
  tmp_.write_file("user/a.bin", {1});
  const auto sibling = tmp_.write_file("username/b.bin", {2});

  PathValidator validator({(tmp_.path() / "user").string()});
  EXPECT_FALSE(validator.is_allowed(sibling.string()));
}

TEST_F(PathValidatorTest, RejectsMissingFiles) {
  PathValidator validator({allowed_.string()});
  EXPECT_FALSE(validator.is_allowed((allowed_ / "missing.bin").string()));
}

TEST_F(PathValidatorTest, RejectsFileUsedAsDirectory) {
  PathValidator validator({allowed_.string()});
  EXPECT_FALSE(validator.is_allowed(inside_file_.string() + "/child"));
}

TEST_F(PathValidatorTest, NormalizesConfiguredRoots) {
  PathValidator validator({allowed_.string() + "/", "relative/ignored"});
  ASSERT_EQ(validator.roots().size(), 1u);
  EXPECT_EQ(validator.roots()[0], allowed_.string());
  EXPECT_TRUE(validator.is_allowed(inside_file_.string()));
}

TEST_F(PathValidatorTest, MultipleRootsAreEachHonored) {
  PathValidator validator({allowed_.string(), outside_.string()});
  EXPECT_TRUE(validator.is_allowed(inside_file_.string()));
  EXPECT_TRUE(validator.is_allowed(outside_file_.string()));
}

TEST_F(PathValidatorTest, ConstructsFromAccessConfig) {
  doppler_bridge::AccessConfig access;
  access.allowed_dirs = {allowed_.string()};
  PathValidator validator(access);
  EXPECT_TRUE(validator.is_allowed(inside_file_.string()));
  EXPECT_FALSE(validator.is_allowed(outside_file_.string()));
}

TEST_F(PathValidatorTest, ResolveReturnsSymlinkFreePath) {
  fs::create_directory_symlink(allowed_, allowed_ / "loop");
  PathValidator validator({allowed_.string()});

  const auto resolved =
      validator.resolve((allowed_ / "loop" / "." / "model.bin").string());
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, inside_file_.string());
}

TEST_F(PathValidatorTest, ResolveFollowsInRootSymlinkToItsTarget) {
  fs::create_symlink(inside_file_, allowed_ / "alias.bin");
  PathValidator validator({allowed_.string()});

  const auto resolved = validator.resolve((allowed_ / "alias.bin").string());
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(*resolved, inside_file_.string());
}

TEST_F(PathValidatorTest, ResolveRejectsWhatIsAllowedRejects) {
  fs::create_symlink(outside_file_, allowed_ / "escape.txt");
  PathValidator validator({allowed_.string()});

  EXPECT_FALSE(validator.resolve((allowed_ / "escape.txt").string()));
  EXPECT_FALSE(validator.resolve(outside_file_.string()));
  EXPECT_FALSE(validator.resolve((allowed_ / "missing.bin").string()));
  EXPECT_FALSE(validator.resolve("allowed/model.bin"));
}
