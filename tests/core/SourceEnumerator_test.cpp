#include <gtest/gtest.h>
#include "core/SourceEnumerator.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace cycle_mcp;
namespace fs = std::filesystem;

class SourceEnumeratorTest : public ::testing::Test {
protected:
    fs::path test_dir_;

    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "source_enumerator_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);
        test_dir_ = fs::canonical(test_dir_);

        create_file(test_dir_ / "main.ts", "export {};");
        create_file(test_dir_ / "view.tsx", "export {};");
        create_file(test_dir_ / "legacy.cjs", "module.exports = {};");
        create_file(test_dir_ / "readme.md", "Not a source file");
        create_file(test_dir_ / "styles.css", "body {}");

        auto subdir = test_dir_ / "lib";
        fs::create_directories(subdir);
        create_file(subdir / "helper.js", "module.exports = {};");
        create_file(subdir / "UPPER.TS", "export {};");

        auto deep_dir = subdir / "deep";
        fs::create_directories(deep_dir);
        create_file(deep_dir / "leaf.mts", "export {};");

        for (const char* skipped : {"node_modules/pkg", ".git", "dist", "build", "coverage", ".next", "out"}) {
            fs::create_directories(test_dir_ / skipped);
            create_file(test_dir_ / skipped / "ignored.js", "module.exports = {};");
        }
    }

    void TearDown() override {
        std::error_code ec;
        fs::permissions(test_dir_ / "locked", fs::perms::owner_all, ec);
        fs::remove_all(test_dir_, ec);
    }

    void create_file(const fs::path& path, const std::string& content) {
        std::ofstream file(path);
        file << content;
        file.close();
    }

    std::string node(const fs::path& path) const {
        return SourceEnumerator::normalize(path);
    }

    static bool contains(const std::vector<std::string>& files, const std::string& file) {
        return std::find(files.begin(), files.end(), file) != files.end();
    }
};

TEST_F(SourceEnumeratorTest, FindsSupportedExtensionsRecursively) {
    auto files = SourceEnumerator::enumerate(test_dir_);

    // main.ts, view.tsx, legacy.cjs, lib/helper.js, lib/UPPER.TS, lib/deep/leaf.mts
    ASSERT_EQ(files.size(), 6);
    EXPECT_TRUE(contains(files, node(test_dir_ / "lib" / "deep" / "leaf.mts")));
    EXPECT_TRUE(contains(files, node(test_dir_ / "lib" / "UPPER.TS")));
    EXPECT_FALSE(contains(files, node(test_dir_ / "readme.md")));
}

TEST_F(SourceEnumeratorTest, SkipsBuildAndToolDirectories) {
    auto files = SourceEnumerator::enumerate(test_dir_);

    for (const auto& file : files) {
        EXPECT_EQ(file.find("ignored.js"), std::string::npos) << file;
    }
}

TEST_F(SourceEnumeratorTest, IncludeNodeModulesOnlyUnskipsNodeModules) {
    auto files = SourceEnumerator::enumerate(test_dir_, true);

    ASSERT_EQ(files.size(), 7);
    EXPECT_TRUE(contains(files, node(test_dir_ / "node_modules" / "pkg" / "ignored.js")));
    EXPECT_FALSE(contains(files, node(test_dir_ / "dist" / "ignored.js")));
}

TEST_F(SourceEnumeratorTest, ResultsAreAbsoluteSortedAndNormalized) {
    auto files = SourceEnumerator::enumerate(test_dir_);

    EXPECT_TRUE(std::is_sorted(files.begin(), files.end()));
    for (const auto& file : files) {
        EXPECT_TRUE(fs::path(file).is_absolute()) << file;
        EXPECT_EQ(file.find('\\'), std::string::npos) << file;
        EXPECT_EQ(file, SourceEnumerator::normalize(file));
    }
}

TEST_F(SourceEnumeratorTest, NonexistentRootThrows) {
    auto fake_path = test_dir_ / "nonexistent";

    try {
        SourceEnumerator::enumerate(fake_path);
        FAIL() << "Expected ScanError";
    } catch (const ScanError& e) {
        EXPECT_EQ(e.reason(), ScanError::Reason::NOT_FOUND);
        EXPECT_EQ(e.path(), fake_path);
        EXPECT_EQ(std::string(e.what()), "Path does not exist: " + fake_path.string());
        EXPECT_EQ(e.describe("nonexistent"), "Path does not exist: nonexistent");
    }
}

TEST_F(SourceEnumeratorTest, FileRootThrows) {
    try {
        SourceEnumerator::enumerate(test_dir_ / "main.ts");
        FAIL() << "Expected ScanError";
    } catch (const ScanError& e) {
        EXPECT_EQ(e.reason(), ScanError::Reason::NOT_A_DIRECTORY);
        EXPECT_EQ(e.describe("main.ts"), "Path is not a directory: main.ts");
    }
}

TEST_F(SourceEnumeratorTest, EmptyDirectory) {
    auto empty_dir = test_dir_ / "empty";
    fs::create_directories(empty_dir);

    auto files = SourceEnumerator::enumerate(empty_dir);

    EXPECT_EQ(files.size(), 0);
}

TEST_F(SourceEnumeratorTest, SymlinksAreNotFollowed) {
    std::error_code ec;
    fs::create_directory_symlink(test_dir_ / "lib", test_dir_ / "lib_link", ec);
    if (ec) {
        GTEST_SKIP() << "Cannot create symlinks here: " << ec.message();
    }

    auto files = SourceEnumerator::enumerate(test_dir_);

    EXPECT_EQ(files.size(), 6);
}

TEST_F(SourceEnumeratorTest, UnreadableSubdirectoryIsSkipped) {
    auto locked = test_dir_ / "locked";
    fs::create_directories(locked);
    create_file(locked / "hidden.ts", "export {};");
    create_file(test_dir_ / "sibling.ts", "export {};");

    fs::permissions(locked, fs::perms::none);

    std::error_code ec;
    fs::directory_iterator listing(locked, ec);
    if (!ec) {
        fs::permissions(locked, fs::perms::owner_all);
        GTEST_SKIP() << "Directory permissions are not enforced for this user";
    }

    std::vector<std::string> files;
    EXPECT_NO_THROW(files = SourceEnumerator::enumerate(test_dir_));

    fs::permissions(locked, fs::perms::owner_all);

    EXPECT_TRUE(contains(files, node(test_dir_ / "sibling.ts")));
    EXPECT_TRUE(contains(files, node(test_dir_ / "main.ts")));
    EXPECT_FALSE(contains(files, node(locked / "hidden.ts")));
}

TEST(SourceEnumeratorNormalizeTest, CollapsesDotsAndTrailingSeparators) {
    EXPECT_EQ(SourceEnumerator::normalize("/project/src/./lib/../a.ts"), "/project/src/a.ts");
    EXPECT_EQ(SourceEnumerator::normalize("/project/src/lib/"), "/project/src/lib");
    EXPECT_EQ(SourceEnumerator::normalize("/"), "/");
}
