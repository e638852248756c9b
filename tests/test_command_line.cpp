#include "cli/command_line.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

cli::CommandLineOptions parse(const std::vector<std::string> &args,
                              std::vector<std::string> &errors) {
  return cli::parse_command_line(args, errors);
}

} // namespace

TEST(CommandLineTest, NoArgumentsLeavesEverythingUnset) {
  std::vector<std::string> errors;
  auto options = parse({}, errors);
  EXPECT_TRUE(errors.empty());
  EXPECT_FALSE(options.config_path.has_value());
  EXPECT_FALSE(options.input_path.has_value());
  EXPECT_FALSE(options.show_help);
  EXPECT_FALSE(options.compare_reference);
}

TEST(CommandLineTest, ParsesAllOptions) {
  std::vector<std::string> errors;
  auto options = parse({"job.ini", "--input", "values.csv", "--format", "JSON",
                        "--stream", "latency", "--ddof", "1", "--workers", "4",
                        "--column", "2", "--compare"},
                       errors);

  ASSERT_TRUE(errors.empty());
  EXPECT_EQ(options.config_path.value_or(""), "job.ini");
  EXPECT_EQ(options.input_path.value_or(""), "values.csv");
  EXPECT_EQ(options.output_format.value_or(""), "json");
  EXPECT_EQ(options.stream_name.value_or(""), "latency");
  EXPECT_EQ(options.ddof.value_or(0), 1u);
  EXPECT_EQ(options.worker_count.value_or(0), 4u);
  EXPECT_EQ(options.column.value_or(-1), 2);
  EXPECT_TRUE(options.compare_reference);
}

TEST(CommandLineTest, HelpFlag) {
  std::vector<std::string> errors;
  EXPECT_TRUE(parse({"-h"}, errors).show_help);
  EXPECT_TRUE(parse({"--help"}, errors).show_help);
  EXPECT_TRUE(errors.empty());
}

TEST(CommandLineTest, DashIsStdinNotAnOption) {
  std::vector<std::string> errors;
  auto options = parse({"--input", "-"}, errors);
  EXPECT_TRUE(errors.empty());
  EXPECT_EQ(options.input_path.value_or(""), "-");
}

TEST(CommandLineTest, ReportsBadArguments) {
  std::vector<std::string> errors;
  parse({"--verbose", "--ddof", "two", "--workers", "-1", "a.ini", "b.ini",
         "--column"},
        errors);

  ASSERT_EQ(errors.size(), 5u);
  EXPECT_EQ(errors[0], "Unknown option: --verbose");
  EXPECT_EQ(errors[1], "Invalid --ddof value: two");
  EXPECT_EQ(errors[2], "Invalid --workers value: -1");
  EXPECT_EQ(errors[3], "Unexpected extra argument: b.ini");
  EXPECT_EQ(errors[4], "Missing value for --column");
}

TEST(CommandLineTest, OverridesReplaceConfigValues) {
  Config::AppConfig config;
  config.input_path = "from_file.txt";
  config.stream_name = "from_file";
  config.reader.column = 3;

  std::vector<std::string> errors;
  auto options = parse({"--stream", "cli", "--workers", "8", "--compare"},
                       errors);
  cli::apply_overrides(options, config);

  EXPECT_EQ(config.input_path, "from_file.txt");
  EXPECT_EQ(config.stream_name, "cli");
  EXPECT_EQ(config.reader.column, 3);
  EXPECT_EQ(config.ingest.worker_count, 8u);
  EXPECT_TRUE(config.compare_reference);
}

TEST(CommandLineTest, UsageNamesTheProgram) {
  auto text = cli::usage("streamstat");
  EXPECT_EQ(text.rfind("Usage: streamstat", 0), 0u);
  EXPECT_NE(text.find("--ddof"), std::string::npos);
}
