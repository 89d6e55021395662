#include <gtest/gtest.h>
#include "asm_source.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

TEST(AsmSource, TokenizesAndLowercases) {
    auto lines = tokenize_source("ORG 100\n  Lda   X\nX, HEX 1F\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].tokens, (std::vector<std::string>{"org", "100"}));
    EXPECT_EQ(lines[1].tokens, (std::vector<std::string>{"lda", "x"}));
    EXPECT_EQ(lines[2].tokens, (std::vector<std::string>{"x,", "hex", "1f"}));
    EXPECT_EQ(lines[2].number, 3);
}

TEST(AsmSource, StripsCommentsKeepsEmptyLines) {
    auto lines = tokenize_source("/ header\ncla /clear\n\nhlt\n");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_TRUE(lines[0].empty());
    EXPECT_EQ(lines[1].tokens, (std::vector<std::string>{"cla"}));
    EXPECT_TRUE(lines[2].empty());
    EXPECT_EQ(lines[3].number, 4);
}

TEST(AsmSource, CommentMustStartToken) {
    auto lines = tokenize_source("a/b c\n");
    EXPECT_EQ(lines[0].tokens, (std::vector<std::string>{"a/b", "c"}));
}

TEST(AsmSource, CustomCommentMarker) {
    auto lines = tokenize_source("cla ; clear\n", ';');
    EXPECT_EQ(lines[0].tokens, (std::vector<std::string>{"cla"}));
}

TEST(AsmSource, HandlesCrLf) {
    auto lines = tokenize_source("cla\r\nend\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].tokens, (std::vector<std::string>{"end"}));
}

TEST(AsmSource, LineText) {
    SourceLine line{5, {"x,", "hex", "1f"}};
    EXPECT_EQ(line.text(), "x, hex 1f");
}

TEST(AsmSource, ReadRejectsWrongExtension) {
    std::string source;
    auto err = read_source_file("program.txt", source);
    EXPECT_NE(err.find(".asm or .S"), std::string::npos);
}

TEST(AsmSource, ReadFile) {
    auto path = fs::temp_directory_path() / "bcasm_read_test.asm";
    {
        std::ofstream f(path);
        f << "cla\nend\n";
    }
    std::string source;
    EXPECT_EQ(read_source_file(path.string(), source), "");
    EXPECT_EQ(source, "cla\nend\n");
    std::error_code ec;
    fs::remove(path, ec);
}

TEST(AsmSource, ReadMissingFile) {
    std::string source;
    auto err = read_source_file((fs::temp_directory_path() / "bcasm_missing.S").string(), source);
    EXPECT_NE(err, "");
}

}
