#include <gtest/gtest.h>
#include "cli/cli.hpp"
#include <sstream>

using namespace isum;

class CommandLineTest : public ::testing::Test {
protected:
    Command merge;

    void SetUp() override {
        merge = Command{
            "merge",
            "Merge ids into one supernode",
            {
                {"input", 'i', "Input summary", "", true, false},
                {"members", 'm', "Ids to merge", "", true, false},
                {"into", 'n', "Supernode id", "", false, false},
                {"output", 'o', "Output summary", "merged.json", false, false},
                {"quiet", 'q', "Less output", "", false, true}
            },
            [](const ParsedOptions&) { return 0; }
        };
    }
};

// ==========================================
// Id Parsing Tests
// ==========================================

TEST(ParseIdTest, AcceptsFullRange) {
    EXPECT_EQ(parse_id("0"), 0);
    EXPECT_EQ(parse_id("4294967295"), 0xFFFFFFFF);
}

TEST(ParseIdTest, RejectsMalformedAndWideIds) {
    EXPECT_THROW(parse_id(""), std::runtime_error);
    EXPECT_THROW(parse_id("-1"), std::runtime_error);
    EXPECT_THROW(parse_id("+3"), std::runtime_error);
    EXPECT_THROW(parse_id("12a"), std::runtime_error);
    EXPECT_THROW(parse_id("4294967296"), std::runtime_error);
    EXPECT_THROW(parse_id("18446744073709551617"), std::runtime_error);
}

TEST(ParseIdTest, IdList) {
    EXPECT_EQ(parse_id_list("3,1,,7"), (std::vector<NodeId>{3, 1, 7}));
    EXPECT_TRUE(parse_id_list("").empty());
    EXPECT_THROW(parse_id_list("3,x"), std::runtime_error);
}

// ==========================================
// Option Parsing Tests
// ==========================================

TEST_F(CommandLineTest, LongShortAndInlineForms) {
    ParsedOptions options = parse_options(merge, {"--input", "s.json", "-m", "2,3", "--into=99", "-q"});

    EXPECT_EQ(options.get("input"), "s.json");
    EXPECT_EQ(options.id_list("members"), (std::vector<NodeId>{2, 3}));
    EXPECT_EQ(options.id("into"), 99);
    EXPECT_TRUE(options.flag("quiet"));
    EXPECT_EQ(options.get("output"), "merged.json");
}

TEST_F(CommandLineTest, UnsetOptionalStaysUnset) {
    ParsedOptions options = parse_options(merge, {"-i", "s.json", "-m", "2,3"});

    EXPECT_FALSE(options.has("into"));
    EXPECT_FALSE(options.flag("quiet"));
    EXPECT_THROW(options.get("into"), std::runtime_error);
}

TEST_F(CommandLineTest, RejectsBadCommandLines) {
    EXPECT_THROW(parse_options(merge, {"-m", "2,3"}), std::runtime_error);
    EXPECT_THROW(parse_options(merge, {"-i", "s.json", "-m", "2,3", "extra"}), std::runtime_error);
    EXPECT_THROW(parse_options(merge, {"-i", "s.json", "-m", "2,3", "--bogus"}), std::runtime_error);
    EXPECT_THROW(parse_options(merge, {"-i", "a.json", "-i", "b.json", "-m", "2"}), std::runtime_error);
    EXPECT_THROW(parse_options(merge, {"-i", "s.json", "-m"}), std::runtime_error);
    EXPECT_THROW(parse_options(merge, {"-i", "s.json", "-m", "2", "--quiet=yes"}), std::runtime_error);
}

TEST_F(CommandLineTest, HelpListsOptions) {
    std::ostringstream out;
    merge.print_help(out);

    std::string help = out.str();
    EXPECT_NE(help.find("Usage: isum merge --input <value> --members <value>"), std::string::npos);
    EXPECT_NE(help.find("--into, -n <value>"), std::string::npos);
    EXPECT_NE(help.find("(default: merged.json)"), std::string::npos);
}

// ==========================================
// Dispatch Tests
// ==========================================

TEST_F(CommandLineTest, RunDispatchesToHandler) {
    NodeId seen = 0;
    merge.handler = [&seen](const ParsedOptions& options) {
        seen = options.id("into");
        return 7;
    };

    CommandLine cli;
    cli.add(merge);

    std::vector<std::string> words = {"isum", "merge", "-i", "s.json", "-m", "1,2", "-n", "42"};
    std::vector<char*> argv;
    for (auto& word : words) argv.push_back(&word[0]);

    EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 7);
    EXPECT_EQ(seen, 42);
}

TEST_F(CommandLineTest, HandlerErrorsBecomeExitCodeOne) {
    merge.handler = [](const ParsedOptions& options) { return static_cast<int>(options.id("into")); };

    CommandLine cli;
    cli.add(merge);
    EXPECT_THROW(cli.add(merge), std::logic_error);

    std::vector<std::string> words = {"isum", "merge", "-i", "s.json", "-m", "1", "-n", "x"};
    std::vector<char*> argv;
    for (auto& word : words) argv.push_back(&word[0]);

    EXPECT_EQ(cli.run(static_cast<int>(argv.size()), argv.data()), 1);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
