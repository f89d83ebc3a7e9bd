#include "exception.hpp"
#include "tail.hpp"

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace fsutils;
namespace fs = std::filesystem;

class TailTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = fs::temp_directory_path() / "fsutils_test_tail";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string CreateFile(const std::string& name, const std::string& content) {
        fs::path full_path = test_dir / name;
        std::ofstream file(full_path, std::ios::binary);
        file << content;
        return full_path.string();
    }

    argparser Parse(const std::vector<std::string>& argv) {
        argparser args;
        tail::register_options(args);
        args.parse(argv);
        return args;
    }

    static std::string Header(const std::string& path) {
        std::ostringstream out;
        tail::print_header(out, path);
        return out.str();
    }

    fs::path test_dir;
};

TEST_F(TailTest, LastLines) {
    EXPECT_EQ(std::vector<std::string>({"c", "d"}), tail::last_lines("a\nb\nc\nd", 2));
    EXPECT_EQ(std::vector<std::string>({"a", "b"}), tail::last_lines("a\nb", 10));
    EXPECT_EQ(std::vector<std::string>({""}), tail::last_lines("", 3));
    EXPECT_TRUE(tail::last_lines("a\nb", 0).empty());
}

TEST_F(TailTest, TrailingNewlineYieldsEmptyLine) {
    EXPECT_EQ(std::vector<std::string>({"c", ""}), tail::last_lines("a\nb\nc\n", 2));
}

TEST_F(TailTest, HeaderRuleMatchesVisibleWidth) {
    EXPECT_EQ("==> \x1b[32ma.txt\x1b[0m <==\n-------------\n", Header("a.txt"));
}

TEST_F(TailTest, PrintsLastTenLinesByDefault) {
    std::string content;
    for (int i = 1; i <= 15; ++i) {
        content += "line" + std::to_string(i) + "\n";
    }
    std::string path = CreateFile("long.txt", content);

    std::ostringstream out;
    tail::print_file(out, path, tail::options{});

    // The trailing newline makes the final element empty
    std::string expected = Header(path);
    for (int i = 7; i <= 15; ++i) {
        expected += "line" + std::to_string(i) + "\n";
    }
    expected += "\n\n";
    EXPECT_EQ(expected, out.str());
}

TEST_F(TailTest, BytesMode) {
    std::string path = CreateFile("bytes.txt", "hello world");

    tail::options opts;
    opts.num_bytes = 5;

    std::ostringstream out;
    tail::print_file(out, path, opts);
    EXPECT_EQ(Header(path) + "world\n", out.str());
}

TEST_F(TailTest, BytesModeLargerThanFile) {
    std::string path = CreateFile("short.txt", "abc");

    tail::options opts;
    opts.num_bytes = 1024;

    std::ostringstream out;
    tail::print_file(out, path, opts);
    EXPECT_EQ(Header(path) + "abc\n", out.str());
}

TEST_F(TailTest, SplitCharacterIsReplaced) {
    // The first byte of the euro sign is cut off
    std::string path = CreateFile("utf8.txt", "\xE2\x82\xAC");

    tail::options opts;
    opts.num_bytes = 2;

    std::ostringstream out;
    tail::print_file(out, path, opts);
    EXPECT_EQ(Header(path) + "\xEF\xBF\xBD\xEF\xBF\xBD\n", out.str());
}

TEST_F(TailTest, FlagsApplyToFollowingFiles) {
    std::string first = CreateFile("first.txt", "1\n2\n3");
    std::string second = CreateFile("second.txt", "abcdef");

    auto args = Parse({"tail", "/n", "1", first, "--num-bytes", "2", second});

    std::ostringstream out;
    EXPECT_EQ(EXIT_SUCCESS, tail::run(out, args));
    EXPECT_EQ(Header(first) + "3\n\n" + Header(second) + "ef\n", out.str());
}

TEST_F(TailTest, EachFileIsPrintedOnce) {
    std::string a = CreateFile("a.txt", "a");
    std::string b = CreateFile("b.txt", "b");

    std::ostringstream out;
    tail::run(out, Parse({"tail", a, b}));
    EXPECT_EQ(Header(a) + "a\n\n" + Header(b) + "b\n\n", out.str());
}

TEST_F(TailTest, NumLinesAcceptsPlusSign) {
    tail::options opts;
    std::ostringstream out;
    tail::scan(out, Parse({"tail", "/l", "+3"}), opts);
    EXPECT_EQ(3u, opts.num_lines);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(TailTest, SizeSuffix) {
    tail::options opts;
    std::ostringstream out;
    tail::scan(out, Parse({"tail", "/b", "2k"}), opts);
    ASSERT_TRUE(opts.num_bytes.has_value());
    EXPECT_EQ(2048u, *opts.num_bytes);
}

TEST_F(TailTest, InvalidValues) {
    tail::options opts;
    std::ostringstream out;
    try {
        tail::scan(out, Parse({"tail", "/l", "ten"}), opts);
        FAIL() << "expected usage_error";
    }
    catch (const usage_error& e) {
        EXPECT_EQ(std::string("Invalid number of lines 'ten'"), e.what());
    }
    try {
        tail::scan(out, Parse({"tail", "/b", "5x"}), opts);
        FAIL() << "expected usage_error";
    }
    catch (const usage_error& e) {
        EXPECT_EQ(std::string("Invalid size format '5x'"), e.what());
    }
}

TEST_F(TailTest, MissingValue) {
    EXPECT_THROW(Parse({"tail", "/l"}), usage_error);

    std::string path = CreateFile("a.txt", "a");
    tail::options opts;
    std::ostringstream out;
    try {
        tail::scan(out, Parse({"tail", path, "--num-bytes"}), opts);
        FAIL() << "expected usage_error";
    }
    catch (const usage_error& e) {
        EXPECT_EQ(std::string("Missing value for '--num-bytes'"), e.what());
    }
}

TEST_F(TailTest, UnknownArgument) {
    tail::options opts;
    std::ostringstream out;
    try {
        tail::scan(out, Parse({"tail", "--follow", "x.txt"}), opts);
        FAIL() << "expected usage_error";
    }
    catch (const usage_error& e) {
        EXPECT_EQ(std::string("Unknown argument '--follow'"), e.what());
    }
    EXPECT_THROW(tail::scan(out, Parse({"tail", "/q"}), opts), usage_error);
    EXPECT_TRUE(out.str().empty());
}

TEST_F(TailTest, LaterHelpIsSkipped) {
    std::string path = CreateFile("a.txt", "a");

    std::ostringstream out;
    tail::run(out, Parse({"tail", path, "/h"}));
    EXPECT_EQ(Header(path) + "a\n\n", out.str());
}

TEST_F(TailTest, MissingFileStopsAfterEarlierOutput) {
    std::string good = CreateFile("good.txt", "ok");
    std::string missing = (test_dir / "missing.txt").string();

    std::ostringstream out;
    try {
        tail::run(out, Parse({"tail", good, missing}));
        FAIL() << "expected io_error";
    }
    catch (const io_error& e) {
        EXPECT_EQ(0u, std::string(e.what()).find("Error reading file '" + missing + "': "));
    }
    EXPECT_EQ(Header(good) + "ok\n\n", out.str());
}

TEST_F(TailTest, Help) {
    std::ostringstream out;
    tail::print_help(out, "tail");
    EXPECT_NE(std::string::npos, out.str().find("Usage: tail[.exe] [args] <file_name>"));
    EXPECT_NE(std::string::npos, out.str().find("/b or --num-bytes <size>"));
}
