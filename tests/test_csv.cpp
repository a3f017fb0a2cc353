#include <gtest/gtest.h>
#include "csv.hpp"
#include "errors.hpp"
#include "test_util.hpp"

// ==================== Parsing ====================

TEST(ParseCsvTest, HeaderAndRows) {
    CsvTable t = parse_csv("a,b,c\n1,2,3\n4,5,6\n");
    ASSERT_EQ(t.header, (std::vector<std::string>{ "a", "b", "c" }));
    ASSERT_EQ(t.rows.size(), 2u);
    EXPECT_EQ(t.rows[1], (std::vector<std::string>{ "4", "5", "6" }));
    EXPECT_EQ(t.row_lines, (std::vector<std::size_t>{ 2, 3 }));
}

TEST(ParseCsvTest, NoTrailingNewline) {
    CsvTable t = parse_csv("a,b\n1,2");
    ASSERT_EQ(t.rows.size(), 1u);
    EXPECT_EQ(t.rows[0], (std::vector<std::string>{ "1", "2" }));
}

TEST(ParseCsvTest, CrLfLineEndings) {
    CsvTable t = parse_csv("a,b\r\n1,2\r\n3,4\r\n");
    ASSERT_EQ(t.rows.size(), 2u);
    EXPECT_EQ(t.header[1], "b");
    EXPECT_EQ(t.rows[1][1], "4");
}

TEST(ParseCsvTest, QuotedFields) {
    CsvTable t = parse_csv("name,note\n\"Horvat, Ana\",\"says \"\"hi\"\"\"\n");
    ASSERT_EQ(t.rows.size(), 1u);
    EXPECT_EQ(t.rows[0][0], "Horvat, Ana");
    EXPECT_EQ(t.rows[0][1], "says \"hi\"");
}

TEST(ParseCsvTest, QuotedFieldSpansLines) {
    CsvTable t = parse_csv("a,b\n\"line one\nline two\",x\n5,6\n");
    ASSERT_EQ(t.rows.size(), 2u);
    EXPECT_EQ(t.rows[0][0], "line one\nline two");
    EXPECT_EQ(t.row_lines[0], 2u);
    EXPECT_EQ(t.row_lines[1], 4u);
}

TEST(ParseCsvTest, BlankLinesSkipped) {
    CsvTable t = parse_csv("a,b\n\n1,2\n\n\n3,4\n");
    ASSERT_EQ(t.rows.size(), 2u);
    EXPECT_EQ(t.row_lines[0], 3u);
    EXPECT_EQ(t.row_lines[1], 6u);
}

TEST(ParseCsvTest, EmptyCellsKept) {
    CsvTable t = parse_csv("a,b,c\n,,\n");
    ASSERT_EQ(t.rows.size(), 1u);
    EXPECT_EQ(t.rows[0], (std::vector<std::string>{ "", "", "" }));
}

TEST(ParseCsvTest, EmptyInput) {
    CsvTable t = parse_csv("");
    EXPECT_TRUE(t.header.empty());
    EXPECT_TRUE(t.rows.empty());
}

TEST(ParseCsvTest, UnterminatedQuoteIsFormatError) {
    try {
        parse_csv("a,b\n1,\"open\n2,3\n");
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ValidationKind::Format);
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
}

// ==================== Encoding ====================

TEST(EncodingTest, Utf8Validation) {
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("Babi\xC4\x87"));           // ć
    EXPECT_TRUE(is_valid_utf8("\xE2\x82\xAC"));           // €
    EXPECT_FALSE(is_valid_utf8("Babi\xE6"));              // Latin-1 æ
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));              // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));          // surrogate
    EXPECT_FALSE(is_valid_utf8("\xC4"));                  // truncated
}

TEST(EncodingTest, Latin1Conversion) {
    EXPECT_EQ(latin1_to_utf8("J\xFCrgen"), "J\xC3\xBCrgen");
    EXPECT_EQ(latin1_to_utf8("abc"), "abc");
}

TEST(EncodingTest, DecodeTextStripsBom) {
    EXPECT_EQ(decode_text("\xEF\xBB\xBFid,ime"), "id,ime");
}

TEST(EncodingTest, DecodeTextFallsBackToLatin1) {
    EXPECT_EQ(decode_text("Ren\xE9"), "Ren\xC3\xA9");
    EXPECT_EQ(decode_text("Ren\xC3\xA9"), "Ren\xC3\xA9");
}

// ==================== Writing ====================

TEST(WriteCsvTest, CanonicalHeaderAndRows) {
    Dataset d({ rec(3, "Ana", "Horvat", "2025-01", 92, 5), rec(1, "Ivan", "Perić", "2025-06", 45, 1) });
    EXPECT_EQ(to_csv(d),
        "student_id,first_name,last_name,term,score,grade\n"
        "3,Ana,Horvat,2025-01,92,5\n"
        "1,Ivan,Perić,2025-06,45,1\n");
}

TEST(WriteCsvTest, QuotesCellsThatNeedIt) {
    Dataset d({ rec(1, "Ana, Marija", "O\"Neil", "2025-01", 70, 3) });
    CsvTable back = parse_csv(to_csv(d));
    ASSERT_EQ(back.rows.size(), 1u);
    EXPECT_EQ(back.rows[0][1], "Ana, Marija");
    EXPECT_EQ(back.rows[0][2], "O\"Neil");
}

TEST(WriteCsvTest, WritesAndReadsFile) {
    TempPath csv(".csv");
    write_csv(sample_dataset(), csv.str());
    CsvTable t = read_csv_file(csv.str());
    EXPECT_EQ(t.header.size(), 6u);
    EXPECT_EQ(t.rows.size(), 8u);
    EXPECT_EQ(t.rows[3][2], "Šimić");
}

TEST(WriteCsvTest, UnwritablePathIsIoError) {
    try {
        write_csv(sample_dataset(), "/nonexistent-dir/out.csv");
        FAIL() << "expected IoError";
    }
    catch (const IoError& e) {
        EXPECT_EQ(e.path(), "/nonexistent-dir/out.csv");
    }
}

TEST(ReadCsvTest, MissingFileIsIoError) {
    EXPECT_THROW(read_csv_file("/nonexistent-dir/in.csv"), IoError);
}
