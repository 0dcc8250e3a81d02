#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

#include "pv_options.h"

namespace {
    ProgramOptions parse(std::vector<std::string> args) {
        args.insert(args.begin(), "pan_validator");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parseArguments(static_cast<int>(argv.size()), argv.data());
    }
}

TEST(OptionsTest, DefaultsWithoutArguments) {
    const ProgramOptions options = parse({});
    EXPECT_FALSE(options.batchMode);
    EXPECT_FALSE(options.silentMode);
    EXPECT_FALSE(options.skipHeader);
    EXPECT_EQ(options.databasePath, std::filesystem::path(DEFAULT_DATABASE_FILE));
    EXPECT_FALSE(options.reportPath.has_value());
    EXPECT_FALSE(options.checkValue.has_value());
    EXPECT_TRUE(options.inputFiles.empty());
}

TEST(OptionsTest, ParsesFlagsAndValues) {
    const ProgramOptions options = parse({ "-b", "-s", "-H", "-d", "data.db", "-r", "reports", "first.csv", "second.json" });
    EXPECT_TRUE(options.batchMode);
    EXPECT_TRUE(options.silentMode);
    EXPECT_TRUE(options.skipHeader);
    EXPECT_EQ(options.databasePath, std::filesystem::path("data.db"));
    ASSERT_TRUE(options.reportPath.has_value());
    EXPECT_EQ(*options.reportPath, std::filesystem::path("reports"));
    ASSERT_EQ(options.inputFiles.size(), 2u);
    EXPECT_EQ(options.inputFiles[0], std::filesystem::path("first.csv"));
    EXPECT_EQ(options.inputFiles[1], std::filesystem::path("second.json"));
}

TEST(OptionsTest, LongOptionsIgnoreCase) {
    const ProgramOptions options = parse({ "--BATCH", "--Silent", "--check", " ahgve1276f " });
    EXPECT_TRUE(options.batchMode);
    EXPECT_TRUE(options.silentMode);
    ASSERT_TRUE(options.checkValue.has_value());
    EXPECT_EQ(*options.checkValue, " ahgve1276f ");
}

TEST(OptionsTest, ShortOptionsAreCaseSensitive) {
    const ProgramOptions options = parse({ "-B" });
    EXPECT_FALSE(options.batchMode);
    ASSERT_EQ(options.inputFiles.size(), 1u);
    EXPECT_EQ(options.inputFiles[0], std::filesystem::path("-B"));
}

TEST(OptionsTest, MissingValueThrows) {
    EXPECT_THROW(parse({ "--database" }), std::invalid_argument);
    EXPECT_THROW(parse({ "-s", "-c" }), std::invalid_argument);
}

TEST(OptionsTest, NonAsciiLongOptionIsAnInputFile) {
    const ProgramOptions options = parse({ "--b\xC3\x84tch" });
    EXPECT_FALSE(options.batchMode);
    ASSERT_EQ(options.inputFiles.size(), 1u);
}

TEST(OptionsTest, ProgramMetadataIsFilled) {
    EXPECT_STRNE(PROGRAM_NAME, "");
    EXPECT_STRNE(PROGRAM_VERSION, "");
    EXPECT_STRNE(PROGRAM_AUTHOR, "");
    EXPECT_STRNE(PROGRAM_DESCRIPTION, "");
}
