#include <gtest/gtest.h>
#include <cli/cli_common.hpp>
#include <string>
#include <vector>

using namespace pretenst::cli;

namespace {

std::pair<CommandContext, int> parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_common_args(static_cast<int>(argv.size()), argv.data(), 0);
}

}  // namespace

TEST(CliCommonTest, ParsesFlagsAndInput) {
    auto [ctx, next] = parse({"tower.tsc", "-o", "out.json", "--iterations", "50", "--pretense", "-v"});
    EXPECT_EQ(next, 7);
    EXPECT_EQ(ctx.input_path, "tower.tsc");
    EXPECT_EQ(ctx.output_path, "out.json");
    ASSERT_TRUE(ctx.iterations.has_value());
    EXPECT_EQ(*ctx.iterations, 50);
    EXPECT_TRUE(ctx.pretense);
    EXPECT_TRUE(ctx.verbose);
    EXPECT_FALSE(ctx.help);
}

TEST(CliCommonTest, RejectsBadArguments) {
    EXPECT_THROW(parse({"--bogus"}), std::runtime_error);
    EXPECT_THROW(parse({"a.tsc", "b.tsc"}), std::runtime_error);
    EXPECT_THROW(parse({"--segments", "zero"}), std::runtime_error);
    EXPECT_THROW(parse({"--segments", "-3"}), std::runtime_error);
    EXPECT_THROW(parse({"-o"}), std::runtime_error);
}

TEST(CliCommonTest, ResolveOutputPath) {
    EXPECT_EQ(resolve_output_path("dir/tower.tsc", ".tree.json", ""), "dir/tower.tree.json");
    EXPECT_EQ(resolve_output_path("dir.d/tower", ".fabric.json", ""), "dir.d/tower.fabric.json");
    EXPECT_EQ(resolve_output_path("tower.tsc", ".tree.json", "given.json"), "given.json");
    EXPECT_EQ(resolve_output_path("out/tower.tree.json", ".fabric.json", ""), "out/tower.fabric.json");
}
