#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "blobpack/CommandLine.hpp"

namespace
{
  blobpack::ParseResult Parse(std::vector<const char *> args)
  {
    args.insert(args.begin(), "blobpack");
    return blobpack::ParseCommandLine(static_cast<int>(args.size()), args.data());
  }
}

TEST(CommandLine, Merge)
{
  auto const result = Parse({ "-m", "a.jpg", "b.txt", "c.zip", "-o", "out.jpg" });
  ASSERT_TRUE(result.command);
  EXPECT_EQ(blobpack::Command::Kind::Merge, result.command->kind);
  std::vector<std::string> const expected{ "a.jpg", "b.txt", "c.zip" };
  EXPECT_EQ(expected, result.command->sources);
  EXPECT_EQ("out.jpg", result.command->output);
  EXPECT_FALSE(result.command->mergeOptions.noFooter);
}

TEST(CommandLine, MergeTwoFiles)
{
  auto const result = Parse({ "-m", "a", "b", "-o", "out" });
  ASSERT_TRUE(result.command);
  EXPECT_EQ(2u, result.command->sources.size());
}

TEST(CommandLine, MergeNoFooter)
{
  auto const result = Parse({ "-m", "--no-footer", "a", "b", "-o", "out" });
  ASSERT_TRUE(result.command);
  EXPECT_TRUE(result.command->mergeOptions.noFooter);
  std::vector<std::string> const expected{ "a", "b" };
  EXPECT_EQ(expected, result.command->sources);
}

TEST(CommandLine, MergeUsageErrors)
{
  EXPECT_FALSE(Parse({ "-m" }).command);
  EXPECT_FALSE(Parse({ "-m", "a", "-o", "out" }).command);
  EXPECT_FALSE(Parse({ "-m", "--no-footer", "a", "-o", "out" }).command);
  EXPECT_FALSE(Parse({ "-m", "a", "b", "c", "out" }).command);
  EXPECT_FALSE(Parse({ "-m", "a", "b", "c", "-x", "out" }).command);
}

TEST(CommandLine, Split)
{
  auto const result = Parse({ "-s", "in.bin", "-o", "dir/" });
  ASSERT_TRUE(result.command);
  EXPECT_EQ(blobpack::Command::Kind::Split, result.command->kind);
  ASSERT_EQ(1u, result.command->sources.size());
  EXPECT_EQ("in.bin", result.command->sources.front());
  EXPECT_EQ("dir/", result.command->output);
}

TEST(CommandLine, SplitUsageErrors)
{
  EXPECT_FALSE(Parse({ "-s", "in.bin" }).command);
  EXPECT_FALSE(Parse({ "-s", "in.bin", "-o" }).command);
  EXPECT_FALSE(Parse({ "-s", "in.bin", "-x", "dir" }).command);
  EXPECT_FALSE(Parse({ "-s", "in.bin", "-o", "dir", "extra" }).command);
}

TEST(CommandLine, Other)
{
  EXPECT_FALSE(Parse({}).command);
  EXPECT_FALSE(Parse({ "-x" }).command);
  EXPECT_FALSE(Parse({ "merge", "a", "b" }).command);
}

TEST(CommandLine, HelpIsUsageError)
{
  for (const char * flag : { "-h", "--help" })
  {
    auto const result = Parse({ flag });
    EXPECT_FALSE(result.command) << flag;
    EXPECT_TRUE(result.error.empty()) << flag;
  }
}

TEST(CommandLine, Usage)
{
  std::string const usage = blobpack::UsageText("prog");
  EXPECT_NE(std::string::npos, usage.find("prog -m"));
  EXPECT_NE(std::string::npos, usage.find("prog -s"));
}
