#include "monitor/pattern/path_pattern.h"
#include "core/utils/path_utils.h"
#include <gtest/gtest.h>
#include <cstdlib>

using namespace fsmon;

namespace {

PathPattern compile_or_fail(const std::string& pattern, const std::string& root = "/proj") {
    auto result = PathPattern::compile(pattern, root);
    EXPECT_TRUE(result.ok()) << pattern;
    return std::move(result).value();
}

}

TEST(PathPatternTest, SingleStarStaysInsideSegment) {
    PathPattern pattern = compile_or_fail("src/*.py");
    EXPECT_EQ(pattern.resolved(), "/proj/src/*.py");
    EXPECT_TRUE(pattern.matches("/proj/src/a.py"));
    EXPECT_TRUE(pattern.matches("/proj/src/.py"));
    EXPECT_FALSE(pattern.matches("/proj/src/sub/a.py"));
    EXPECT_FALSE(pattern.matches("/proj/src/a.pyc"));
    EXPECT_FALSE(pattern.matches("/proj/a.py"));
    EXPECT_FALSE(pattern.is_recursive());
    EXPECT_FALSE(pattern.is_explicit());
}

TEST(PathPatternTest, GlobstarMatchesZeroOrMoreSegments) {
    PathPattern pattern = compile_or_fail("src/**/*.md");
    EXPECT_TRUE(pattern.matches("/proj/src/a.md"));
    EXPECT_TRUE(pattern.matches("/proj/src/sub/a.md"));
    EXPECT_TRUE(pattern.matches("/proj/src/sub/dir/a.md"));
    EXPECT_FALSE(pattern.matches("/proj/other/a.md"));
    EXPECT_FALSE(pattern.matches("/proj/src/sub/a.txt"));
    EXPECT_TRUE(pattern.is_recursive());
}

TEST(PathPatternTest, TrailingGlobstarMatchesEverythingBelow) {
    PathPattern pattern = compile_or_fail("docs/**");
    EXPECT_TRUE(pattern.matches("/proj/docs/a"));
    EXPECT_TRUE(pattern.matches("/proj/docs/a/b/c"));
    EXPECT_FALSE(pattern.matches("/proj/doc/a"));
}

TEST(PathPatternTest, QuestionMarkMatchesOneCharacter) {
    PathPattern pattern = compile_or_fail("file?.txt");
    EXPECT_TRUE(pattern.matches("/proj/file1.txt"));
    EXPECT_TRUE(pattern.matches("/proj/fileA.txt"));
    EXPECT_FALSE(pattern.matches("/proj/file.txt"));
    EXPECT_FALSE(pattern.matches("/proj/file12.txt"));
}

TEST(PathPatternTest, SegmentMatching) {
    EXPECT_TRUE(PathPattern::match_segment("*", "anything"));
    EXPECT_TRUE(PathPattern::match_segment("*", ""));
    EXPECT_TRUE(PathPattern::match_segment("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(PathPattern::match_segment("a*b*c", "aXXbYY"));
    EXPECT_TRUE(PathPattern::match_segment("??", "ab"));
    EXPECT_FALSE(PathPattern::match_segment("??", "abc"));
}

TEST(PathPatternTest, InvalidPatterns) {
    auto empty = PathPattern::compile("", "/proj");
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidPattern);

    auto partial_globstar = PathPattern::compile("src/a**/b", "/proj");
    ASSERT_FALSE(partial_globstar.ok());
    EXPECT_EQ(partial_globstar.error().code, ErrorCode::InvalidPattern);

    std::string with_nul("src/a", 5);
    with_nul.push_back('\0');
    auto nul = PathPattern::compile(with_nul, "/proj");
    ASSERT_FALSE(nul.ok());
    EXPECT_EQ(nul.error().code, ErrorCode::InvalidPattern);
}

TEST(PathPatternTest, AbsolutePatternIgnoresRoot) {
    PathPattern pattern = compile_or_fail("/var/data/*.csv");
    EXPECT_EQ(pattern.resolved(), "/var/data/*.csv");
    EXPECT_TRUE(pattern.matches("/var/data/x.csv"));
}

TEST(PathPatternTest, HomeExpansion) {
    const char* home = std::getenv("HOME");
    if (!home || home[0] != '/') {
        GTEST_SKIP() << "HOME not set";
    }
    PathPattern pattern = compile_or_fail("~/notes/*.txt");
    EXPECT_EQ(pattern.resolved(), core::PathUtils::normalize(std::string(home) + "/notes/*.txt"));
}

TEST(PathPatternTest, ExplicitPathWatchesParent) {
    PathPattern pattern = compile_or_fail("config/app.json");
    EXPECT_TRUE(pattern.is_explicit());
    EXPECT_TRUE(pattern.matches("/proj/config/app.json"));
    EXPECT_FALSE(pattern.matches("/proj/config/app.json.bak"));

    ASSERT_EQ(pattern.minimal_dirs().size(), 1u);
    EXPECT_EQ(pattern.minimal_dirs()[0].path, "/proj/config");
    EXPECT_EQ(pattern.minimal_dirs()[0].depth, 0);
}

TEST(PathPatternTest, MinimalDirsStopAtFirstWildcard) {
    PathPattern flat = compile_or_fail("src/*.py");
    ASSERT_EQ(flat.minimal_dirs().size(), 1u);
    EXPECT_EQ(flat.minimal_dirs()[0].path, "/proj/src");
    EXPECT_EQ(flat.minimal_dirs()[0].depth, 0);

    PathPattern nested = compile_or_fail("src/*/*.py");
    EXPECT_EQ(nested.minimal_dirs()[0].path, "/proj/src");
    EXPECT_EQ(nested.minimal_dirs()[0].depth, 1);

    PathPattern deep = compile_or_fail("src/**/*.md");
    EXPECT_EQ(deep.minimal_dirs()[0].path, "/proj/src");
    EXPECT_TRUE(deep.minimal_dirs()[0].recursive());
}

TEST(PathPatternTest, MayMatchUnder) {
    PathPattern flat = compile_or_fail("src/*.py");
    EXPECT_TRUE(flat.may_match_under("/proj"));
    EXPECT_TRUE(flat.may_match_under("/proj/src"));
    EXPECT_FALSE(flat.may_match_under("/proj/src/sub"));
    EXPECT_FALSE(flat.may_match_under("/proj/other"));

    PathPattern deep = compile_or_fail("src/**/*.md");
    EXPECT_TRUE(deep.may_match_under("/proj/src"));
    EXPECT_TRUE(deep.may_match_under("/proj/src/a/b/c"));
    EXPECT_FALSE(deep.may_match_under("/proj/lib"));
}

TEST(PathPatternTest, DriveLetterRoots) {
    PathPattern pattern = compile_or_fail("src/*.py", "C:/proj");
    EXPECT_EQ(pattern.resolved(), "C:/proj/src/*.py");
    EXPECT_TRUE(pattern.matches("C:/proj/src/a.py"));
    EXPECT_FALSE(pattern.matches("C:/proj/a.py"));
    EXPECT_FALSE(pattern.matches("D:/proj/src/a.py"));
    ASSERT_EQ(pattern.minimal_dirs().size(), 1u);
    EXPECT_EQ(pattern.minimal_dirs()[0].path, "C:/proj/src");
    EXPECT_TRUE(pattern.may_match_under("C:/proj"));

    PathPattern top = compile_or_fail("C:/*.txt");
    EXPECT_EQ(top.resolved(), "C:/*.txt");
    EXPECT_EQ(top.minimal_dirs()[0].path, "C:/");
    EXPECT_TRUE(top.matches("C:/notes.txt"));

    PathPattern exact = compile_or_fail("C:/proj/app.json");
    EXPECT_EQ(exact.minimal_dirs()[0].path, "C:/proj");
}

TEST(PathUtilsTest, DriveRootsAreAbsolute) {
    using core::PathUtils;
    EXPECT_TRUE(PathUtils::is_absolute("/a"));
    EXPECT_TRUE(PathUtils::is_absolute("C:/a"));
    EXPECT_FALSE(PathUtils::is_absolute("C:a"));
    EXPECT_FALSE(PathUtils::is_absolute("a/b"));

    EXPECT_EQ(PathUtils::normalize("C:/proj/"), "C:/proj");
    EXPECT_EQ(PathUtils::normalize("C:/"), "C:/");
    EXPECT_EQ(PathUtils::parent("C:/proj/src"), "C:/proj");
    EXPECT_EQ(PathUtils::parent("C:/proj"), "C:/");
    EXPECT_EQ(PathUtils::parent("C:/"), "C:/");
    EXPECT_EQ(PathUtils::parent("/a"), "/");
    EXPECT_EQ(PathUtils::parent("/"), "/");

    EXPECT_TRUE(PathUtils::is_within("C:/proj/a", "C:/"));
    EXPECT_TRUE(PathUtils::is_within("/x/y", "/"));
    EXPECT_FALSE(PathUtils::is_within("D:/proj", "C:/"));
    EXPECT_FALSE(PathUtils::is_within("C:/project", "C:/proj"));
}
