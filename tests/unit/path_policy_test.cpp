#include "../../src/preprocessor/path_policy.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace mdimport::preprocessor;

using Dirs = std::vector<std::string>;

// ============================================================
// compute_allowed_directories
// ============================================================

TEST(AllowedDirectoriesTest, IncludesBaseDirectory) {
    auto dirs = compute_allowed_directories("/test/path/subdir");
    ASSERT_FALSE(dirs.empty());
    EXPECT_EQ(dirs[0], "/test/path/subdir");
}

TEST(AllowedDirectoriesTest, WalksParentsUpToRoot) {
    EXPECT_EQ(compute_allowed_directories("/a/b/c/d"), (Dirs{"/a/b/c/d", "/a/b/c", "/a/b", "/a"}));
}

TEST(AllowedDirectoriesTest, OneLevelBelowRoot) {
    EXPECT_EQ(compute_allowed_directories("/a"), (Dirs{"/a"}));
}

TEST(AllowedDirectoriesTest, NeverContainsRoot) {
    auto dirs = compute_allowed_directories("/a/b");
    EXPECT_EQ(dirs, (Dirs{"/a/b", "/a"}));
    EXPECT_EQ(std::count(dirs.begin(), dirs.end(), "/"), 0);

    EXPECT_TRUE(compute_allowed_directories("/").empty());
}

TEST(AllowedDirectoriesTest, DeepPath) {
    auto dirs = compute_allowed_directories("/very/deep/nested/path/with/many/levels");
    ASSERT_EQ(dirs.size(), 7u);
    EXPECT_EQ(dirs[0], "/very/deep/nested/path/with/many/levels");
    EXPECT_EQ(dirs[1], "/very/deep/nested/path/with/many");
    EXPECT_EQ(dirs[3], "/very/deep/nested/path");
    EXPECT_EQ(dirs[6], "/very");
}

TEST(AllowedDirectoriesTest, TrailingSeparatorIsIgnored) {
    EXPECT_EQ(compute_allowed_directories("/projects/myproject/"),
              (Dirs{"/projects/myproject", "/projects"}));
}

// ============================================================
// validate_path
// ============================================================

TEST(ValidatePathTest, RejectsUrls) {
    EXPECT_FALSE(validate_path("https://example.com/file.md", "/base", {"/allowed"}));
    EXPECT_FALSE(validate_path("http://example.com/file.md", "/base", {"/allowed"}));
    EXPECT_FALSE(validate_path("file:///path/to/file.md", "/base", {"/allowed"}));
    // ルートを許可していてもURLは拒否
    EXPECT_FALSE(validate_path("file:///base/file.md", "/base", {"/base", "/"}));
}

TEST(ValidatePathTest, AllowsPathsWithinAllowedDirectories) {
    EXPECT_TRUE(validate_path("./file.md", "/base", {"/base"}));
    EXPECT_FALSE(validate_path("../file.md", "/base", {"/allowed"}));
    EXPECT_TRUE(validate_path("../file.md", "/base", {"/base", "/"}));
    EXPECT_TRUE(validate_path("/allowed/sub/file.md", "/base", {"/allowed"}));
}

TEST(ValidatePathTest, RejectsPathsOutsideAllowedDirectories) {
    EXPECT_FALSE(validate_path("/forbidden/file.md", "/base", {"/allowed"}));
    EXPECT_FALSE(validate_path("../../../file.md", "/base", {"/base"}));
}

TEST(ValidatePathTest, MultipleAllowedDirectories) {
    Dirs allowed{"/allowed1", "/allowed2"};
    EXPECT_FALSE(validate_path("./file.md", "/base", allowed));
    EXPECT_TRUE(validate_path("/allowed1/file.md", "/base", allowed));
    EXPECT_TRUE(validate_path("/allowed2/file.md", "/base", allowed));
}

TEST(ValidatePathTest, RelativePaths) {
    EXPECT_TRUE(validate_path("file.md", "/base", {"/base"}));
    EXPECT_TRUE(validate_path("./sub/../file.md", "/base", {"/base"}));
    EXPECT_FALSE(validate_path("../file.md", "/base", {"/parent"}));
}

TEST(ValidatePathTest, RespectsSegmentBoundaries) {
    EXPECT_FALSE(validate_path("/allowed2/x.md", "/base", {"/allowed"}));
    EXPECT_FALSE(validate_path("/allowedXYZ/x.md", "/base", {"/allowed"}));
    EXPECT_TRUE(validate_path("/allowed/x.md", "/base", {"/allowed/"}));
}

TEST(ValidatePathTest, DirectoryItselfIsContained) {
    EXPECT_TRUE(validate_path("/allowed", "/base", {"/allowed"}));
    EXPECT_TRUE(validate_path("/allowed/", "/base", {"/allowed"}));
    EXPECT_TRUE(validate_path(".", "/base", {"/base/"}));
}

TEST(ValidatePathTest, DotDotEscapeIsResolvedBeforeCheck) {
    EXPECT_FALSE(validate_path("/allowed/../secret/file.md", "/base", {"/allowed"}));
    EXPECT_FALSE(validate_path("sub/../../other/file.md", "/base", {"/base"}));
}

TEST(ValidatePathTest, EmptyAllowlistRejectsEverything) {
    EXPECT_FALSE(validate_path("./file.md", "/base", {}));
}

TEST(ValidatePathTest, VeryLongPath) {
    const std::string name = std::string(500000, 'x') + ".md";
    EXPECT_TRUE(validate_path("./" + name, "/base", {"/base"}));
    EXPECT_FALSE(validate_path("/elsewhere/" + name, "/base", {"/base"}));
    EXPECT_FALSE(validate_path("https://" + name, "/base", {"/base", "/"}));
}

// ============================================================
// 補助関数
// ============================================================

TEST(PathPolicyTest, ResolveImportPath) {
    EXPECT_EQ(resolve_import_path("./test.md", "/test/path"), "/test/path/test.md");
    EXPECT_EQ(resolve_import_path("../parent.md", "/test/path/subdir"), "/test/path/parent.md");
    EXPECT_EQ(resolve_import_path("/abs/file.md", "/base"), "/abs/file.md");
    EXPECT_EQ(resolve_import_path("a//b/./c.md", "/base"), "/base/a/b/c.md");
}

TEST(PathPolicyTest, UrlScheme) {
    EXPECT_TRUE(has_url_scheme("https://x"));
    EXPECT_TRUE(has_url_scheme("git+ssh://host/repo"));
    EXPECT_FALSE(has_url_scheme("./https.md"));
    EXPECT_FALSE(has_url_scheme("/abs/path.md"));
    EXPECT_FALSE(has_url_scheme("c:/notes.md"));
    EXPECT_FALSE(has_url_scheme("1http://x"));
    EXPECT_FALSE(has_url_scheme("http:/x"));
    EXPECT_FALSE(has_url_scheme(""));
    EXPECT_TRUE(has_url_scheme(std::string(500000, 'h') + "://x"));
    EXPECT_FALSE(has_url_scheme(std::string(500000, 'h') + ".md"));
}

TEST(PathPolicyTest, IsWithinDirectory) {
    EXPECT_TRUE(is_within_directory("/a/b", "/a"));
    EXPECT_TRUE(is_within_directory("/a", "/a"));
    EXPECT_TRUE(is_within_directory("/x", "/"));
    EXPECT_FALSE(is_within_directory("/ab", "/a"));
    EXPECT_FALSE(is_within_directory("/a", "/a/b"));
    EXPECT_FALSE(is_within_directory("/a", ""));
}
