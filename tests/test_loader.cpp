#include <gtest/gtest.h>
#include <filesystem>
#include "loader.hpp"
#include "generator.hpp"
#include "errors.hpp"
#include "test_util.hpp"

static const std::string kHeader = "student_id,first_name,last_name,term,score,grade\n";
static const std::string kRows =
    "1,Ana,Horvat,2025-01,92,5\n"
    "2,Ivan,Perić,2025-06,45,1\n"
    "3,Petra,Novak,2025-02,67,3\n";

// Load `body` from a temp .csv file and return the ValidationError it raises.
static ValidationError load_failure(const std::string& body) {
    TempPath f(".csv");
    f.write(body);
    try {
        load(f.str());
    }
    catch (const ValidationError& e) {
        return e;
    }
    ADD_FAILURE() << "expected ValidationError for:\n" << body;
    return ValidationError(ValidationKind::Format, "", "none");
}

// ==================== Successful loads ====================

TEST(LoaderTest, CanonicalFile) {
    TempPath f(".csv");
    f.write(kHeader + kRows);
    Dataset d = load(f.str());
    ASSERT_EQ(d.record_count(), 3u);
    EXPECT_EQ(d[1], rec(2, "Ivan", "Perić", "2025-06", 45, 1));
    ASSERT_TRUE(d.source_path().has_value());
    EXPECT_EQ(*d.source_path(), f.str());
}

TEST(LoaderTest, GeneratedFileRoundTrips) {
    TempPath f(".csv");
    Generator g(GeneratorConfig::defaults(), 1234);
    Dataset generated = g.generate(60);
    write_csv(generated, f.str());

    Dataset back = load(f.str());
    EXPECT_EQ(back.records(), generated.records());
}

TEST(LoaderTest, CroatianHeadersGiveSameDataset) {
    TempPath canonical(".csv");
    TempPath croatian(".csv");
    canonical.write(kHeader + kRows);
    croatian.write("ID,Ime,Prezime,Termin,Bodovi,Ocjena\n" + kRows);
    EXPECT_EQ(load(croatian.str()).records(), load(canonical.str()).records());
}

TEST(LoaderTest, AliasesAnyCaseAndPadding) {
    TempPath f(".csv");
    f.write("\xC5\xA0IFRA, IME ,Surname,DATUM,Points,OCJ\n" + kRows);  // ŠIFRA
    Dataset d = load(f.str());
    ASSERT_EQ(d.record_count(), 3u);
    EXPECT_EQ(d[0], rec(1, "Ana", "Horvat", "2025-01", 92, 5));
}

TEST(LoaderTest, FirstAliasInTableOrderWins) {
    TempPath f(".csv");
    // Both "student_id" and "id" are present; "id" is listed first.
    f.write("student_id,id,first_name,last_name,term,score,grade\n"
        "100,1,Ana,Horvat,2025-01,92,5\n");
    Dataset d = load(f.str());
    EXPECT_EQ(d[0].student_id, 1);
}

TEST(LoaderTest, ExtraColumnsIgnored) {
    TempPath f(".csv");
    f.write("id,ime,prezime,email,termin,bodovi,ocjena\n"
        "7,Ana,Horvat,ana@example.com,2025-01,92,5\n");
    Dataset d = load(f.str());
    EXPECT_EQ(d[0], rec(7, "Ana", "Horvat", "2025-01", 92, 5));
}

TEST(LoaderTest, GradeTrustedAsGiven) {
    TempPath f(".csv");
    f.write(kHeader + "1,Ana,Horvat,2025-01,95,2\n");
    EXPECT_EQ(load(f.str())[0].grade, 2);
}

TEST(LoaderTest, FractionalScoreTruncated) {
    TempPath f(".csv");
    f.write(kHeader + "1,Ana,Horvat,2025-01,72.9,4.0\n");
    Dataset d = load(f.str());
    EXPECT_EQ(d[0].score, 72);
    EXPECT_EQ(d[0].grade, 4);
}

TEST(LoaderTest, TextValuesTrimmed) {
    TempPath f(".csv");
    f.write(kHeader + "1,  Ana ,\"Horvat \", 2025-01 ,92,5\n");
    EXPECT_EQ(load(f.str())[0], rec(1, "Ana", "Horvat", "2025-01", 92, 5));
}

TEST(LoaderTest, Latin1File) {
    TempPath f(".csv");
    f.write(kHeader + "1,Ana,M\xFCller,2025-01,92,5\n");
    EXPECT_EQ(load(f.str())[0].last_name, "M\xC3\xBCller");
}

TEST(LoaderTest, BomAndCrLf) {
    TempPath f(".csv");
    f.write("\xEF\xBB\xBFid,ime,prezime,termin,bodovi,ocjena\r\n1,Ana,Horvat,2025-01,92,5\r\n");
    Dataset d = load(f.str());
    EXPECT_EQ(d[0], rec(1, "Ana", "Horvat", "2025-01", 92, 5));
}

TEST(LoaderTest, UpperCaseExtensionAccepted) {
    TempPath f(".CSV");
    f.write(kHeader + kRows);
    EXPECT_EQ(load(f.str()).record_count(), 3u);
}

// ==================== Schema ====================

TEST(LoaderSchemaTest, MissingColumnNamed) {
    TempPath f(".csv");
    f.write("student_id,first_name,last_name,term,score\n1,Ana,Horvat,2025-01,92\n");
    try {
        load(f.str());
        FAIL() << "expected SchemaError";
    }
    catch (const SchemaError& e) {
        EXPECT_EQ(e.missing_columns(), (std::vector<std::string>{ "grade" }));
        std::string msg = e.what();
        EXPECT_NE(msg.find("grade"), std::string::npos);
        EXPECT_NE(msg.find("Found columns: student_id, first_name"), std::string::npos);
    }
}

TEST(LoaderSchemaTest, SeveralMissingInCanonicalOrder) {
    TempPath f(".csv");
    f.write("ocjena,ime\n5,Ana\n");
    try {
        load(f.str());
        FAIL() << "expected SchemaError";
    }
    catch (const SchemaError& e) {
        EXPECT_EQ(e.missing_columns(),
            (std::vector<std::string>{ "student_id", "last_name", "term", "score" }));
    }
}

TEST(LoaderSchemaTest, NormalizeColumnsRenamesInPlace) {
    std::vector<std::string> header = { "Ime", "x", "BODOVI", "id" };
    auto missing = normalize_columns(header);
    EXPECT_EQ(header, (std::vector<std::string>{ "first_name", "x", "score", "student_id" }));
    EXPECT_EQ(missing, (std::vector<std::string>{ "last_name", "term", "grade" }));
}

// ==================== Value checks ====================

TEST(LoaderValidationTest, NonNumericScore) {
    auto e = load_failure(kHeader + "1,Ana,Horvat,2025-01,abc,5\n");
    EXPECT_EQ(e.kind(), ValidationKind::Type);
    EXPECT_EQ(e.field(), "score");
}

TEST(LoaderValidationTest, ScoreOutOfRange) {
    auto high = load_failure(kHeader + "1,Ana,Horvat,2025-01,101,5\n");
    EXPECT_EQ(high.kind(), ValidationKind::Range);
    EXPECT_EQ(high.field(), "score");
    EXPECT_NE(std::string(high.what()).find("0-100"), std::string::npos);

    auto low = load_failure(kHeader + "1,Ana,Horvat,2025-01,-1,1\n");
    EXPECT_EQ(low.kind(), ValidationKind::Range);
    EXPECT_EQ(low.field(), "score");
}

TEST(LoaderValidationTest, GradeOutOfRange) {
    auto zero = load_failure(kHeader + "1,Ana,Horvat,2025-01,40,0\n");
    EXPECT_EQ(zero.kind(), ValidationKind::Range);
    EXPECT_EQ(zero.field(), "grade");
    EXPECT_NE(std::string(zero.what()).find("1-5"), std::string::npos);

    auto six = load_failure(kHeader + "1,Ana,Horvat,2025-01,40,6\n");
    EXPECT_EQ(six.kind(), ValidationKind::Range);
    EXPECT_EQ(six.field(), "grade");
}

TEST(LoaderValidationTest, FractionalGradeIsTypeError) {
    auto e = load_failure(kHeader + "1,Ana,Horvat,2025-01,70,3.5\n");
    EXPECT_EQ(e.kind(), ValidationKind::Type);
    EXPECT_EQ(e.field(), "grade");
}

TEST(LoaderValidationTest, BlankFirstName) {
    auto e = load_failure(kHeader + "1,,Horvat,2025-01,92,5\n");
    EXPECT_EQ(e.kind(), ValidationKind::Empty);
    EXPECT_EQ(e.field(), "first_name");
}

TEST(LoaderValidationTest, WhitespaceTermIsBlank) {
    auto e = load_failure(kHeader + "1,Ana,Horvat,   ,92,5\n");
    EXPECT_EQ(e.kind(), ValidationKind::Empty);
    EXPECT_EQ(e.field(), "term");
}

TEST(LoaderValidationTest, ChecksRunInFixedOrder) {
    // Blank name on line 2, bad score on line 3: the score is reported.
    auto score_first = load_failure(kHeader
        + "1,,Horvat,2025-01,92,5\n"
        + "2,Ivan,Perić,2025-06,lots,1\n");
    EXPECT_EQ(score_first.field(), "score");
    EXPECT_EQ(score_first.kind(), ValidationKind::Type);

    // Score out of range and grade not an integer: the grade type is reported.
    auto grade_type = load_failure(kHeader + "1,Ana,Horvat,2025-01,150,x\n");
    EXPECT_EQ(grade_type.field(), "grade");
    EXPECT_EQ(grade_type.kind(), ValidationKind::Type);

    // Score and grade both out of range: the score is reported.
    auto score_range = load_failure(kHeader + "1,Ana,Horvat,2025-01,150,9\n");
    EXPECT_EQ(score_range.field(), "score");
    EXPECT_EQ(score_range.kind(), ValidationKind::Range);
}

TEST(LoaderValidationTest, StudentIdChecks) {
    auto type = load_failure(kHeader + "A1,Ana,Horvat,2025-01,92,5\n");
    EXPECT_EQ(type.kind(), ValidationKind::Type);
    EXPECT_EQ(type.field(), "student_id");

    auto range = load_failure(kHeader + "0,Ana,Horvat,2025-01,92,5\n");
    EXPECT_EQ(range.kind(), ValidationKind::Range);
    EXPECT_EQ(range.field(), "student_id");

    auto dup = load_failure(kHeader
        + "4,Ana,Horvat,2025-01,92,5\n"
        + "4,Ivan,Perić,2025-06,45,1\n");
    EXPECT_EQ(dup.kind(), ValidationKind::Duplicate);
    EXPECT_EQ(dup.field(), "student_id");
}

// ==================== File layout ====================

TEST(LoaderFileTest, EmptyFileHasNoRows) {
    EXPECT_EQ(load_failure("").kind(), ValidationKind::NoRows);
}

TEST(LoaderFileTest, HeaderOnlyHasNoRows) {
    EXPECT_EQ(load_failure(kHeader).kind(), ValidationKind::NoRows);
}

TEST(LoaderFileTest, LongRowIsFormatError) {
    auto e = load_failure(kHeader + "1,Ana,Horvat,2025-01,92,5,extra\n");
    EXPECT_EQ(e.kind(), ValidationKind::Format);
    EXPECT_NE(std::string(e.what()).find("Line 2"), std::string::npos);
}

TEST(LoaderFileTest, ShortRowCellsAreBlank) {
    auto e = load_failure(kHeader + "1,Ana,Horvat,2025-01,92\n");
    EXPECT_EQ(e.kind(), ValidationKind::Type);
    EXPECT_EQ(e.field(), "grade");
}

TEST(LoaderFileTest, WrongExtensionIsFormatError) {
    TempPath f(".txt");
    f.write(kHeader + kRows);
    try {
        load(f.str());
        FAIL() << "expected ValidationError";
    }
    catch (const ValidationError& e) {
        EXPECT_EQ(e.kind(), ValidationKind::Format);
        EXPECT_NE(std::string(e.what()).find(".txt"), std::string::npos);
    }
}

TEST(LoaderFileTest, MissingFile) {
    const std::string path = "/nonexistent-dir/results.csv";
    try {
        load(path);
        FAIL() << "expected InputNotFoundError";
    }
    catch (const InputNotFoundError& e) {
        EXPECT_EQ(e.path(), path);
        EXPECT_EQ(std::string(e.what()), "File '" + path + "' does not exist.");
    }
}

TEST(LoaderFileTest, DirectoryIsNotAFile) {
    EXPECT_THROW(load(std::filesystem::temp_directory_path().string()), InputNotFoundError);
}

TEST(LoaderFileTest, ErrorsShareOneBase) {
    EXPECT_THROW(load("/nonexistent-dir/results.csv"), ExamDataError);
}

// ==================== can_load ====================

TEST(CanLoadTest, ValidFile) {
    TempPath f(".csv");
    f.write(kHeader + kRows);
    auto [ok, reason] = can_load(f.str());
    EXPECT_TRUE(ok);
    EXPECT_EQ(reason, "OK");
}

TEST(CanLoadTest, ReportsReasonInsteadOfThrowing) {
    auto [ok, reason] = can_load("/nonexistent-dir/results.csv");
    EXPECT_FALSE(ok);
    EXPECT_NE(reason.find("does not exist"), std::string::npos);

    TempPath f(".csv");
    f.write(kHeader + "1,Ana,Horvat,2025-01,101,5\n");
    auto [ok2, reason2] = can_load(f.str());
    EXPECT_FALSE(ok2);
    EXPECT_NE(reason2.find("0-100"), std::string::npos);
}

// ==================== dataset_from_table ====================

TEST(DatasetFromTableTest, UsesOriginAsProvenance) {
    CsvTable t = parse_csv(kHeader + kRows);
    Dataset d = dataset_from_table(t, "memory");
    EXPECT_EQ(d.record_count(), 3u);
    EXPECT_EQ(*d.source_path(), "memory");
}
