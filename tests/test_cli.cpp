#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <pakx/pakx.hpp>

#include <gtest/gtest.h>

#include "cli.hpp"

namespace fs = std::filesystem;
using namespace pakx::cli;

namespace {

ParseResult parse(std::vector<std::string> args) {
  args.insert(args.begin(), "pakx");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return parseCli(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST(CliParseTest, Commands) {
  auto list = parse({"list", "a.pakx"});
  ASSERT_TRUE(list.cmd.has_value()) << list.error;
  ASSERT_TRUE(std::holds_alternative<CmdList>(*list.cmd));
  EXPECT_EQ(std::get<CmdList>(*list.cmd).archive, "a.pakx");
  EXPECT_FALSE(list.verbose);

  auto extract = parse({"-v", "extract", "a.pakx", "out", "x", "y"});
  ASSERT_TRUE(extract.cmd.has_value()) << extract.error;
  EXPECT_TRUE(extract.verbose);
  const auto &cmd = std::get<CmdExtract>(*extract.cmd);
  EXPECT_EQ(cmd.outDir, "out");
  EXPECT_EQ(cmd.names, (std::vector<std::string>{"x", "y"}));

  auto rename = parse({"rename", "a.pakx", "from", "to"});
  ASSERT_TRUE(rename.cmd.has_value()) << rename.error;
  EXPECT_EQ(std::get<CmdRename>(*rename.cmd).to, "to");

  auto replace = parse({"rename", "-o", "a.pakx", "from", "to"});
  ASSERT_TRUE(replace.cmd.has_value()) << replace.error;
  EXPECT_TRUE(std::get<CmdRename>(*replace.cmd).overwrite);
  EXPECT_FALSE(std::get<CmdRename>(*rename.cmd).overwrite);

  auto compress = parse({"compress", "a.pakx", "9"});
  ASSERT_TRUE(compress.cmd.has_value()) << compress.error;
  EXPECT_EQ(std::get<CmdCompress>(*compress.cmd).level, 9);

  auto help = parse({"--help"});
  ASSERT_TRUE(help.cmd.has_value());
  EXPECT_TRUE(std::holds_alternative<CmdHelp>(*help.cmd));
}

TEST(CliParseTest, AddOptions) {
  auto plain = parse({"add", "a.pakx", "f1", "dir"});
  ASSERT_TRUE(plain.cmd.has_value()) << plain.error;
  const auto &add = std::get<CmdAdd>(*plain.cmd);
  EXPECT_EQ(add.inputs, (std::vector<std::string>{"f1", "dir"}));
  EXPECT_FALSE(add.level.has_value());
  EXPECT_FALSE(add.overwrite);
  EXPECT_FALSE(add.repack);

  auto flagged = parse({"add", "-c", "9", "-o", "--repack", "a.pakx", "f1"});
  ASSERT_TRUE(flagged.cmd.has_value()) << flagged.error;
  const auto &options = std::get<CmdAdd>(*flagged.cmd);
  EXPECT_EQ(options.level.value_or(-1), 9);
  EXPECT_TRUE(options.overwrite);
  EXPECT_TRUE(options.repack);
  EXPECT_EQ(options.archive, "a.pakx");
}

TEST(CliParseTest, Errors) {
  EXPECT_FALSE(parse({}).cmd.has_value());
  EXPECT_FALSE(parse({"bogus"}).cmd.has_value());
  EXPECT_FALSE(parse({"list"}).cmd.has_value());
  EXPECT_FALSE(parse({"list", "a", "b"}).cmd.has_value());
  EXPECT_FALSE(parse({"add", "a.pakx"}).cmd.has_value());
  EXPECT_FALSE(parse({"add", "-c", "x", "a.pakx", "f"}).cmd.has_value());
  EXPECT_FALSE(parse({"add", "-c"}).cmd.has_value());
  EXPECT_FALSE(parse({"compress", "a.pakx", "10"}).cmd.has_value());
  EXPECT_FALSE(parse({"list", "-o", "a.pakx"}).cmd.has_value());

  auto unknown = parse({"bogus"});
  EXPECT_EQ(unknown.error, "unknown command: bogus");
}

class CliRunTest : public ::testing::Test {
protected:
  void SetUp() override {
    configureLogging(false);
    previous_ = fs::current_path();
    tempDir_ = fs::temp_directory_path() / "pakx_test_cli";
    fs::remove_all(tempDir_);
    fs::create_directories(tempDir_);
    fs::current_path(tempDir_);
  }

  void TearDown() override {
    fs::current_path(previous_);
    fs::remove_all(tempDir_);
  }

  void createTestFile(const fs::path &path, const std::string &content) {
    if (path.has_parent_path()) {
      fs::create_directories(path.parent_path());
    }
    std::ofstream file(path, std::ios::binary);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
  }

  static std::string readText(const fs::path &path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  }

  static CmdAdd addCommand(std::vector<std::string> inputs, bool overwrite = false) {
    CmdAdd add;
    add.archive = "test.pakx";
    add.inputs = std::move(inputs);
    add.overwrite = overwrite;
    return add;
  }

  fs::path previous_;
  fs::path tempDir_;
};

// Test adding, listing and extracting files
TEST_F(CliRunTest, AddListExtract) {
  createTestFile("docs/a.txt", "alpha");
  createTestFile("docs/sub/b.txt", "bravo");
  createTestFile("c.bin", "charlie");

  ASSERT_EQ(runCommand(addCommand({"docs", "c.bin"})), 0);
  ASSERT_TRUE(fs::exists("test.pakx"));

  ::testing::internal::CaptureStdout();
  ASSERT_EQ(runCommand(CmdList{"test.pakx"}), 0);
  std::string listing = ::testing::internal::GetCapturedStdout();
  EXPECT_NE(listing.find("docs/a.txt\n"), std::string::npos);
  EXPECT_NE(listing.find("docs/sub/b.txt\n"), std::string::npos);
  EXPECT_NE(listing.find("c.bin\n"), std::string::npos);

  ASSERT_EQ(runCommand(CmdExtract{"test.pakx", "out", {}}), 0);
  EXPECT_EQ(readText("out/docs/a.txt"), "alpha");
  EXPECT_EQ(readText("out/docs/sub/b.txt"), "bravo");
  EXPECT_EQ(readText("out/c.bin"), "charlie");

  // Existing outputs are never overwritten
  EXPECT_EQ(runCommand(CmdExtract{"test.pakx", "out", {"c.bin"}}), 1);
  EXPECT_EQ(runCommand(CmdExtract{"test.pakx", "fresh", {"missing"}}), 1);
  EXPECT_FALSE(fs::exists("fresh"));
}

// Test adding an existing entry needs -o
TEST_F(CliRunTest, AddRefusesDuplicatesWithoutOverwrite) {
  createTestFile("a.txt", "one");
  ASSERT_EQ(runCommand(addCommand({"a.txt"})), 0);

  createTestFile("a.txt", "two");
  EXPECT_EQ(runCommand(addCommand({"a.txt"})), 1);
  ASSERT_EQ(runCommand(addCommand({"a.txt"}, true)), 0);

  auto reader = pakx::Reader::open(fs::path("test.pakx"));
  ASSERT_TRUE(reader.has_value());
  EXPECT_EQ(reader->entryCount(), 1u);
  auto data = reader->get("a.txt");
  ASSERT_TRUE(data.has_value());
  EXPECT_EQ(std::string(data->begin(), data->end()), "two");

  EXPECT_EQ(runCommand(addCommand({"missing.txt"})), 1);
}

// Test remove, rename and repack through the command layer
TEST_F(CliRunTest, EditCommands) {
  createTestFile("a.txt", std::string(1000, 'a'));
  createTestFile("b.txt", std::string(500, 'b'));
  createTestFile("c.txt", std::string(200, 'c'));
  ASSERT_EQ(runCommand(addCommand({"a.txt", "b.txt", "c.txt"})), 0);

  EXPECT_EQ(runCommand(CmdRemove{"test.pakx", {"a.txt", "missing"}}), 1);
  ASSERT_EQ(runCommand(CmdRemove{"test.pakx", {"a.txt"}}), 0);
  ASSERT_EQ(runCommand(CmdRename{"test.pakx", "b.txt", "renamed.txt"}), 0);
  EXPECT_EQ(runCommand(CmdRename{"test.pakx", "b.txt", "x.txt"}), 1);
  ASSERT_EQ(runCommand(CmdRepack{"test.pakx"}), 0);

  EXPECT_EQ(fs::file_size("test.pakx"), 32u + 16u * 128u + 700u);

  auto reader = pakx::Reader::open(fs::path("test.pakx"));
  ASSERT_TRUE(reader.has_value());
  EXPECT_FALSE(reader->contains("a.txt"));
  EXPECT_TRUE(reader->contains("renamed.txt"));
  EXPECT_TRUE(reader->contains("c.txt"));
}

// Test rename -o overwrites an existing entry
TEST_F(CliRunTest, RenameOverwrite) {
  createTestFile("a.txt", "alpha");
  createTestFile("b.txt", "bravo");
  ASSERT_EQ(runCommand(addCommand({"a.txt", "b.txt"})), 0);

  EXPECT_EQ(runCommand(CmdRename{"test.pakx", "a.txt", "b.txt"}), 1);
  ASSERT_EQ(runCommand(CmdRename{"test.pakx", "a.txt", "b.txt", true}), 0);

  auto reader = pakx::Reader::open(fs::path("test.pakx"));
  ASSERT_TRUE(reader.has_value());
  EXPECT_EQ(reader->entryCount(), 1u);
  auto data = reader->get("b.txt");
  ASSERT_TRUE(data.has_value());
  EXPECT_EQ(std::string(data->begin(), data->end()), "alpha");
}

// Test a damaged entry stops compress before anything is rewritten
TEST_F(CliRunTest, CompressVerifiesEveryEntryFirst) {
  createTestFile("a.txt", std::string(3000, 'a'));
  createTestFile("b.txt", std::string(3000, 'b'));
  ASSERT_EQ(runCommand(addCommand({"a.txt", "b.txt"})), 0);

  // Damage the entry processed last
  uint64_t damagedOffset = 0;
  {
    auto reader = pakx::Reader::open(fs::path("test.pakx"));
    ASSERT_TRUE(reader.has_value());
    std::vector<std::string> names(reader->list().begin(), reader->list().end());
    ASSERT_EQ(names.size(), 2u);
    damagedOffset = reader->info(names.back())->offset;
  }
  std::string bytes = readText("test.pakx");
  bytes[damagedOffset] ^= 0x5A;
  createTestFile("test.pakx", bytes);

  EXPECT_EQ(runCommand(CmdCompress{"test.pakx", 9}), 1);
  EXPECT_EQ(readText("test.pakx"), bytes);
}

// Test entry names cannot steer extraction outside the output directory
TEST_F(CliRunTest, ExtractRefusesEscapingNames) {
  {
    auto archive = pakx::Archive::create(fs::path("test.pakx"));
    ASSERT_TRUE(archive.has_value());
    ASSERT_TRUE(archive->insert("safe.txt", std::vector<uint8_t>{'s'}));
    ASSERT_TRUE(archive->insert("../evil.txt", std::vector<uint8_t>{'x'}));
  }

  EXPECT_EQ(runCommand(CmdExtract{"test.pakx", "out", {}}), 1);
  EXPECT_FALSE(fs::exists("evil.txt"));
  EXPECT_FALSE(fs::exists("out"));
}

// Test compressing every entry in place
TEST_F(CliRunTest, Compress) {
  createTestFile("text.txt", std::string(4000, 'z'));
  ASSERT_EQ(runCommand(addCommand({"text.txt"})), 0);
  ASSERT_EQ(runCommand(CmdCompress{"test.pakx", 9}), 0);

  auto reader = pakx::Reader::open(fs::path("test.pakx"));
  ASSERT_TRUE(reader.has_value());
  auto info = reader->info("text.txt");
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->compressed);
  EXPECT_LT(info->storedSize, 4000u);
  EXPECT_EQ(fs::file_size("test.pakx"), 32u + 16u * 128u + info->storedSize);
  EXPECT_EQ(reader->get("text.txt")->size(), 4000u);
}

// Test info on a file that is not an archive
TEST_F(CliRunTest, InfoOnForeignFile) {
  createTestFile("notes.txt", "this is not an archive, just some text");
  EXPECT_EQ(runCommand(CmdInfo{"notes.txt"}), 1);
  EXPECT_EQ(runCommand(CmdInfo{"missing.pakx"}), 1);

  ASSERT_EQ(runCommand(addCommand({"notes.txt"})), 0);
  ::testing::internal::CaptureStdout();
  EXPECT_EQ(runCommand(CmdInfo{"test.pakx"}), 0);
  std::string output = ::testing::internal::GetCapturedStdout();
  EXPECT_NE(output.find("1 / 16 slots"), std::string::npos);
}
