#include <gtest/gtest.h>
#include "core/ReferenceResolver.hpp"

using namespace cycle_mcp;

class ReferenceResolverTest : public ::testing::Test {
protected:
    ReferenceResolver make_resolver(std::unordered_set<std::string> files) const {
        return ReferenceResolver(std::move(files));
    }

    const std::string src_dir_ = "/project/src";
};

TEST_F(ReferenceResolverTest, ExactPathWins) {
    auto resolver = make_resolver({"/project/src/a.ts", "/project/src/a.ts.ts"});

    EXPECT_EQ(resolver.resolve("./a.ts", src_dir_), "/project/src/a.ts");
}

TEST_F(ReferenceResolverTest, ExtensionsProbedInDeclaredOrder) {
    auto resolver = make_resolver({"/project/src/a.js", "/project/src/a.tsx", "/project/src/a.mjs"});

    EXPECT_EQ(resolver.resolve("./a", src_dir_), "/project/src/a.tsx");
}

TEST_F(ReferenceResolverTest, ExtensionProbeBeatsIndexProbe) {
    auto resolver = make_resolver({"/project/src/x.ts", "/project/src/x/index.ts"});

    EXPECT_EQ(resolver.resolve("./x", src_dir_), "/project/src/x.ts");
}

TEST_F(ReferenceResolverTest, DirectoryResolvesToIndex) {
    auto resolver = make_resolver({"/project/src/lib/index.js", "/project/src/lib/other.ts"});

    EXPECT_EQ(resolver.resolve("./lib", src_dir_), "/project/src/lib/index.js");
    EXPECT_EQ(resolver.resolve("./lib/", src_dir_), "/project/src/lib/index.js");
}

TEST_F(ReferenceResolverTest, ParentDirectoryReference) {
    auto resolver = make_resolver({"/project/shared/util.ts"});

    EXPECT_EQ(resolver.resolve("../shared/util", src_dir_), "/project/shared/util.ts");
}

TEST_F(ReferenceResolverTest, CompiledOutputBridgesToSource) {
    auto resolver = make_resolver({"/project/src/service.ts", "/project/src/view.tsx"});

    EXPECT_EQ(resolver.resolve("./service.js", src_dir_), "/project/src/service.ts");
    EXPECT_EQ(resolver.resolve("./view.js", src_dir_), "/project/src/view.tsx");
}

TEST_F(ReferenceResolverTest, CompiledOutputPrefersExistingJsFile) {
    auto resolver = make_resolver({"/project/src/service.js", "/project/src/service.ts"});

    EXPECT_EQ(resolver.resolve("./service.js", src_dir_), "/project/src/service.js");
}

TEST_F(ReferenceResolverTest, CompiledOutputBridgesToIndex) {
    auto resolver = make_resolver({"/project/src/feature/index.ts"});

    EXPECT_EQ(resolver.resolve("./feature.js", src_dir_), "/project/src/feature/index.ts");
}

TEST_F(ReferenceResolverTest, RootedReference) {
    auto resolver = make_resolver({"/project/src/a.ts"});

    EXPECT_EQ(resolver.resolve("/project/src/a", "/elsewhere"), "/project/src/a.ts");
}

TEST_F(ReferenceResolverTest, UnknownTargetIsDropped) {
    auto resolver = make_resolver({"/project/src/a.ts"});

    EXPECT_FALSE(resolver.resolve("./deleted", src_dir_).has_value());
    EXPECT_FALSE(resolver.resolve("./deleted.js", src_dir_).has_value());
    EXPECT_FALSE(resolver.resolve("", src_dir_).has_value());
}

TEST_F(ReferenceResolverTest, ResolutionIsPure) {
    auto resolver = make_resolver({"/project/src/a.ts"});

    auto first = resolver.resolve("./a", src_dir_);
    auto second = resolver.resolve("./a", src_dir_);

    EXPECT_EQ(first, second);
}

TEST(ReferenceResolverJoinTest, JoinNormalizes) {
    EXPECT_EQ(ReferenceResolver::join("/project/src", "./a/../b"), "/project/src/b");
    EXPECT_EQ(ReferenceResolver::join("/project/src", "../lib/"), "/project/lib");
    EXPECT_EQ(ReferenceResolver::join("/project/src", "/other/x"), "/other/x");
}
