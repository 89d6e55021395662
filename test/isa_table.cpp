#include <gtest/gtest.h>
#include "isa_table.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

TEST(InstructionTable, WidthFollowsKind) {
    EXPECT_EQ(InstructionTable(TableKind::MRI).width(), 3);
    EXPECT_EQ(InstructionTable(TableKind::RRI).width(), 16);
    EXPECT_EQ(InstructionTable(TableKind::IOI).width(), 16);
}

TEST(InstructionTable, AddAndFind) {
    InstructionTable t(TableKind::MRI);
    EXPECT_EQ(t.add("LDA", "010"), "");
    ASSERT_NE(t.find("lda"), nullptr);
    EXPECT_EQ(*t.find("lda"), "010");
    EXPECT_EQ(t.find("sta"), nullptr);
    EXPECT_TRUE(t.contains("lda"));
}

TEST(InstructionTable, RejectsWrongWidthOrDigits) {
    InstructionTable mri(TableKind::MRI);
    EXPECT_NE(mri.add("lda", "0100"), "");
    EXPECT_NE(mri.add("lda", "012"), "");
    InstructionTable rri(TableKind::RRI);
    EXPECT_NE(rri.add("cla", "7800"), "");
    EXPECT_TRUE(rri.empty());
}

TEST(InstructionTable, ParseSkipsBlankAndCommentLines) {
    InstructionTable t(TableKind::IOI);
    std::string text =
        "# input/output\n"
        "INP 1111100000000000\n"
        "\n"
        "out\t1111010000000000\r\n";
    EXPECT_EQ(InstructionTable::parse(text, "ioi.txt", t), "");
    EXPECT_EQ(t.size(), 2u);
    EXPECT_EQ(*t.find("out"), "1111010000000000");
}

TEST(InstructionTable, ParseReportsOriginAndLine) {
    InstructionTable t(TableKind::RRI);
    auto err = InstructionTable::parse("cla 0111100000000000\ncle\n", "rri.txt", t);
    EXPECT_EQ(err.rfind("rri.txt:2:", 0), 0u) << err;
}

TEST(InstructionTable, BuiltinSet) {
    auto set = builtin_instruction_set();
    EXPECT_EQ(set.mri.size(), 7u);
    EXPECT_EQ(set.rri.size(), 12u);
    EXPECT_EQ(set.ioi.size(), 6u);
    EXPECT_EQ(*set.mri.find("isz"), "110");
    EXPECT_EQ(*set.rri.find("hlt"), "0111000000000001");
    EXPECT_EQ(*set.ioi.find("iof"), "1111000001000000");
}

class InstructionSetFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "bcasm_isa_test";
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = (test_dir_ / name).string();
        std::ofstream f(path);
        f << content;
        return path;
    }

    fs::path test_dir_;
};

TEST_F(InstructionSetFileTest, LoadsGivenTablesAndKeepsBuiltinsForOthers) {
    auto rri = write("rri.txt", "cle 0111100000000000\n");
    InstructionSet set;
    ASSERT_EQ(load_instruction_set("", rri, "", set), "");
    EXPECT_EQ(set.rri.size(), 1u);
    EXPECT_EQ(*set.rri.find("cle"), "0111100000000000");
    EXPECT_EQ(set.mri.size(), 7u);
    EXPECT_EQ(set.ioi.size(), 6u);
}

TEST_F(InstructionSetFileTest, MissingFileFails) {
    InstructionSet set;
    auto err = load_instruction_set((test_dir_ / "nope.txt").string(), "", "", set);
    EXPECT_NE(err.find("nope.txt"), std::string::npos);
}

TEST_F(InstructionSetFileTest, BadFileLeavesSetUnchanged) {
    auto mri = write("mri.txt", "lda 010\nsta 11\n");
    InstructionSet set;
    EXPECT_NE(load_instruction_set(mri, "", "", set), "");
    EXPECT_TRUE(set.mri.empty());
}

}
