/**
 * @file FileRecordCodecTest.cpp
 * @brief Unit tests for the one-line registry record format
 */

#include <gtest/gtest.h>

#include <filereg/error/RegistryError.hpp>
#include <filereg/record/FileRecordCodec.hpp>

using namespace FileReg;

namespace {

Timestamp at(long long secs) { return Timestamp{std::chrono::seconds(secs)}; }

} // namespace

TEST(FileRecordCodecTest, FieldOrder) {
    FileRecord r("id-1", "notes.txt", "hello", "/docs", "Work", at(1700000000),
                 at(1700000060));
    EXPECT_EQ(codec::toLine(r),
              "id-1|notes.txt|/docs|Work|2023-11-14T22:13:20|2023-11-14T22:14:20|hello");
}

TEST(FileRecordCodecTest, ContentIsEscaped) {
    FileRecord r("id-1", "a.txt", "x|y\nz\\", "/d", "General", at(0), at(0));
    std::string line = codec::toLine(r);
    EXPECT_EQ(line, "id-1|a.txt|/d|General|1970-01-01T00:00:00|1970-01-01T00:00:00|x\\py\\nz\\\\");
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(FileRecordCodecTest, DecodeRestoresAllFields) {
    FileRecord r("id-1", "a b.txt", "first|second\r\nthird", "/d/e", "Personal",
                 at(1700000000), at(1700000999));
    std::error_code ec;
    auto back = codec::fromLine(codec::toLine(r), ec);
    ASSERT_NE(back, nullptr) << ec.message();
    EXPECT_FALSE(ec);
    EXPECT_EQ(back->id(), r.id());
    EXPECT_EQ(back->fileName(), r.fileName());
    EXPECT_EQ(back->storagePath(), r.storagePath());
    EXPECT_EQ(back->category(), r.category());
    EXPECT_EQ(back->createdAt(), r.createdAt());
    EXPECT_EQ(back->updatedAt(), r.updatedAt());
    EXPECT_EQ(back->content(), r.content());
}

TEST(FileRecordCodecTest, EmptyContentIsValid) {
    std::error_code ec;
    auto r = codec::fromLine("id|a.txt|/d|Cat|2024-01-01T00:00:00|2024-01-01T00:00:00|", ec);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->content(), "");
}

TEST(FileRecordCodecTest, RawPipesInContentKept) {
    // 손으로 편집되어 escape 되지 않은 '|'도 마지막 필드에 그대로 남는다.
    std::error_code ec;
    auto r = codec::fromLine("id|a.txt|/d|Cat|2024-01-01T00:00:00|2024-01-01T00:00:00|a|b", ec);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->content(), "a|b");
}

TEST(FileRecordCodecTest, TrailingCarriageReturnIgnored) {
    std::error_code ec;
    auto r = codec::fromLine("id|a.txt|/d|Cat|2024-01-01T00:00:00|2024-01-01T00:00:00|x\r", ec);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->content(), "x");
}

TEST(FileRecordCodecTest, IdAndTimestampsTrimmed) {
    std::error_code ec;
    auto r = codec::fromLine(
        "  id  |a.txt|/d| Cat |2024-01-01T00:00:00 | 2024-01-01T00:00:05|x", ec);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->id(), "id");
    EXPECT_EQ(r->category(), "Cat");
}

TEST(FileRecordCodecTest, BlankCategoryLoadsAsGeneral) {
    std::error_code ec;
    auto r = codec::fromLine("id|a.txt|/d||2024-01-01T00:00:00|2024-01-01T00:00:00|x", ec);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->category(), "General");
}

TEST(FileRecordCodecTest, TooFewFields) {
    std::error_code ec;
    std::string why;
    EXPECT_EQ(codec::fromLine("id|a.txt|/d", ec, &why), nullptr);
    EXPECT_EQ(ec, Errc::corrupt_record);
    EXPECT_EQ(why, "expected 7 fields, found 3");
}

TEST(FileRecordCodecTest, EmptyId) {
    std::error_code ec;
    std::string why;
    EXPECT_EQ(codec::fromLine(" |a.txt|/d|C|2024-01-01T00:00:00|2024-01-01T00:00:00|x", ec, &why),
              nullptr);
    EXPECT_EQ(ec, Errc::corrupt_record);
    EXPECT_EQ(why, "empty id field");
}

TEST(FileRecordCodecTest, BadTimestamp) {
    std::error_code ec;
    std::string why;
    EXPECT_EQ(codec::fromLine("id|a.txt|/d|C|yesterday|2024-01-01T00:00:00|x", ec, &why), nullptr);
    EXPECT_EQ(ec, Errc::corrupt_record);
    EXPECT_EQ(why, "cannot parse createdAt 'yesterday'");
}

TEST(FileRecordCodecTest, BadEscape) {
    std::error_code ec;
    std::string why;
    EXPECT_EQ(codec::fromLine("id|a.txt|/d|C|2024-01-01T00:00:00|2024-01-01T00:00:00|\\q", ec,
                              &why),
              nullptr);
    EXPECT_EQ(ec, ErrorKind::corruption);
    EXPECT_EQ(why, "invalid escape sequence in content");
}

TEST(FileRecordCodecTest, EmptyFileName) {
    std::error_code ec;
    std::string why;
    EXPECT_EQ(codec::fromLine("id||/d|C|2024-01-01T00:00:00|2024-01-01T00:00:00|x", ec, &why),
              nullptr);
    EXPECT_EQ(ec, Errc::corrupt_record);
    EXPECT_EQ(why, "empty fileName field");

    EXPECT_EQ(codec::fromLine("id|  |/d|C|2024-01-01T00:00:00|2024-01-01T00:00:00|x", ec), nullptr);
    EXPECT_EQ(ec, Errc::corrupt_record);
}
