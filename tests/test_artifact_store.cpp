#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>

#include "keyframe/artifact_store.hpp"
#include "keyframe/system.hpp"
#include "test_helpers.hpp"

namespace keyframe {

namespace fs = std::filesystem;

class ArtifactStoreTest : public ::testing::Test {
protected:
  test::TempDir dir_;
  ArtifactStore store_{dir_.sub("uploads")};
};

TEST_F(ArtifactStoreTest, AllocateCreatesMissingParents) {
  ArtifactStore nested(dir_.sub("a/b/c"));
  OutputLocation location;
  Error err = nested.allocate(location);
  ASSERT_TRUE(err.ok()) << err.detail;
  EXPECT_TRUE(is_uuid(location.job_id));
  EXPECT_TRUE(fs::is_directory(location.path));
  EXPECT_EQ(fs::path(location.path).filename().string(), location.job_id);
}

TEST_F(ArtifactStoreTest, AllocateNeverReusesAnIdentifier) {
  std::set<std::string> ids;
  for (int i = 0; i < 50; ++i) {
    OutputLocation location;
    ASSERT_TRUE(store_.allocate(location).ok());
    EXPECT_TRUE(ids.insert(location.job_id).second);
  }
  EXPECT_EQ(test::count_entries(store_.root()), 50u);
}

TEST_F(ArtifactStoreTest, RemoveDeletesWholeDirectory) {
  OutputLocation location;
  ASSERT_TRUE(store_.allocate(location).ok());
  test::write_file((fs::path(location.path) / "frame_1.jpg").string(), "x");

  EXPECT_TRUE(store_.remove(location.job_id).ok());
  EXPECT_FALSE(fs::exists(location.path));
}

TEST_F(ArtifactStoreTest, RemoveIsIdempotent) {
  std::string id = generate_uuid();
  EXPECT_TRUE(store_.remove(id).ok());
  EXPECT_TRUE(store_.remove(id).ok());
}

TEST_F(ArtifactStoreTest, RemoveIgnoresInvalidIdentifiers) {
  OutputLocation location;
  ASSERT_TRUE(store_.allocate(location).ok());

  EXPECT_TRUE(store_.remove("..").ok());
  EXPECT_TRUE(store_.remove("").ok());
  EXPECT_TRUE(store_.remove("../uploads").ok());
  EXPECT_TRUE(fs::is_directory(store_.root()));
  EXPECT_TRUE(fs::is_directory(location.path));
}

TEST_F(ArtifactStoreTest, ResolveFindsExistingFrame) {
  OutputLocation location;
  ASSERT_TRUE(store_.allocate(location).ok());
  test::write_file((fs::path(location.path) / "frame_1.jpg").string(), "x");

  auto path = store_.resolve(location.job_id, "frame_1.jpg");
  ASSERT_TRUE(path.has_value());
  EXPECT_EQ(test::read_file(*path), "x");

  EXPECT_FALSE(store_.resolve(location.job_id, "frame_2.jpg").has_value());
  EXPECT_FALSE(store_.resolve(generate_uuid(), "frame_1.jpg").has_value());
}

TEST_F(ArtifactStoreTest, ResolveRejectsTraversal) {
  OutputLocation location;
  ASSERT_TRUE(store_.allocate(location).ok());
  test::write_file(dir_.sub("secret.txt"), "secret");
  test::write_file((fs::path(store_.root()) / "outside.jpg").string(), "x");

  EXPECT_FALSE(store_.resolve(location.job_id, "../../etc/passwd"));
  EXPECT_FALSE(store_.resolve(location.job_id, "../../secret.txt"));
  EXPECT_FALSE(store_.resolve(location.job_id, "../outside.jpg"));
  EXPECT_FALSE(store_.resolve(location.job_id, ".."));
  EXPECT_FALSE(store_.resolve(location.job_id, "."));
  EXPECT_FALSE(store_.resolve(location.job_id, ""));
  EXPECT_FALSE(store_.resolve(location.job_id, "..\\..\\secret.txt"));
  EXPECT_FALSE(store_.resolve("..", "secret.txt"));
  EXPECT_FALSE(store_.resolve("../..", "secret.txt"));
}

TEST_F(ArtifactStoreTest, ResolveRejectsSymlinkEscape) {
  OutputLocation location;
  ASSERT_TRUE(store_.allocate(location).ok());
  test::write_file(dir_.sub("secret.txt"), "secret");
  fs::create_symlink(dir_.sub("secret.txt"),
                     fs::path(location.path) / "frame_1.jpg");

  EXPECT_FALSE(store_.resolve(location.job_id, "frame_1.jpg").has_value());
}

TEST(ArtifactStoreComponentTest, SafeComponent) {
  EXPECT_TRUE(ArtifactStore::is_safe_component("frame_1.jpg"));
  EXPECT_TRUE(ArtifactStore::is_safe_component("..frame"));
  EXPECT_FALSE(ArtifactStore::is_safe_component("a/b"));
  EXPECT_FALSE(ArtifactStore::is_safe_component(std::string("a\0b", 3)));
}

} // namespace keyframe
