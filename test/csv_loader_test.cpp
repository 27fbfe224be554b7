/**
 * @file csv_loader_test.cpp
 * @brief End-to-end tests for parse(), load() and load_file().
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "csv_loader.h"
#include "error.h"
#include "schema.h"

using namespace typedcsv;

class CsvLoaderTest : public ::testing::Test {
protected:
    Schema units_schema() {
        return Schema::Builder()
            .field("ID").primary_key()
            .field("Name").not_null()
            .field("Level").not_null().range(1, 100)
            .build();
    }

    LoaderOptions collecting() {
        LoaderOptions opts;
        opts.throw_on_validation_error = false;
        return opts;
    }
};

TEST_F(CsvLoaderTest, UnitsScenario) {
    LoadedData data = load("ID,Name,Level\n1,Alice,10\n2,Bob,\n3,Carol,5\n", units_schema(),
                           collecting());

    ASSERT_EQ(data.store.num_rows(), 3u);
    const auto& level = data.store.column("Level");
    EXPECT_EQ(level[0], CellValue::integer(10));
    EXPECT_TRUE(level[1].is_null());
    EXPECT_EQ(level[2], CellValue::integer(5));

    ASSERT_EQ(data.report.error_count(), 1u);
    const ValidationIssue& issue = data.report.errors()[0];
    EXPECT_EQ(issue.row, 1u);
    EXPECT_EQ(issue.field, "Level");
    EXPECT_EQ(issue.to_string(), "[Row 2, Column 'Level'] Value cannot be null or empty");
}

TEST_F(CsvLoaderTest, UnitsScenarioThrowsByDefault) {
    try {
        load("ID,Name,Level\n1,Alice,10\n2,Bob,\n", units_schema());
        FAIL() << "Expected ValidationException";
    } catch (const ValidationException& e) {
        EXPECT_EQ(e.report().error_count(), 1u);
    }
}

TEST_F(CsvLoaderTest, ParseSkipsValidation) {
    LoadResult result = parse("ID,Name,Level\n1,,\n1,,\n", units_schema());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.store().num_rows(), 2u);
    EXPECT_TRUE(result.errors().empty());
}

TEST_F(CsvLoaderTest, ValidationCanBeDisabled) {
    LoaderOptions opts;
    opts.validation_enabled = false;
    LoadedData data = load("ID,Name,Level\n1,,\n1,,\n", units_schema(), opts);
    EXPECT_TRUE(data.report.is_valid());
}

TEST_F(CsvLoaderTest, SchemaSubsetKeepsEveryColumn) {
    Schema schema = Schema::Builder().field("level").build();
    LoadResult result = parse("ID,Name,Level\n1,Alice,10\n", schema);
    ASSERT_TRUE(result.ok());
    const TypedStore& store = result.store();
    EXPECT_EQ(store.num_columns(), 3u);
    EXPECT_EQ(store.row(0).get("Name").as_string(), "Alice");
}

TEST_F(CsvLoaderTest, HeaderOnly) {
    LoadResult result = parse("ID,Name\n", Schema());
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.store().empty());
    EXPECT_EQ(result.store().num_columns(), 2u);
}

TEST_F(CsvLoaderTest, MissingHeaderIsFatal) {
    for (const char* text : {"", "\n\n", "# nothing here\n"}) {
        LoadResult result = parse(text, Schema());
        ASSERT_FALSE(result.ok()) << text;
        EXPECT_EQ(result.error().code, ErrorCode::EMPTY_HEADER);
        EXPECT_EQ(result.error().message, "Header line is missing");
    }
}

TEST_F(CsvLoaderTest, UnknownHeaderIsFatal) {
    LoadResult result = parse("ID,Name\n1,a\n", units_schema());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::UNRESOLVED_FIELD);
    EXPECT_THROW(result.store(), ParseException);
    EXPECT_THROW(load("ID,Name\n1,a\n", units_schema()), ParseException);
}

TEST_F(CsvLoaderTest, UnclosedQuoteIsFatal) {
    LoadResult result = parse("ID,Name\n1,\"Alice\n2,Bob\n", Schema());
    ASSERT_FALSE(result.ok());
    const ParseError& err = result.error();
    EXPECT_EQ(err.code, ErrorCode::UNCLOSED_QUOTE);
    EXPECT_EQ(err.line, 2u);
    EXPECT_EQ(err.column, 3u);
    EXPECT_EQ(err.byte_offset, 10u);
}

TEST_F(CsvLoaderTest, QuotedFields) {
    LoadResult result = parse("ID,Name\n1,\"Smith, John\"\n2,\"say \"\"hi\"\"\"\n", Schema());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.store().row(0).get("Name").as_string(), "Smith, John");
    EXPECT_EQ(result.store().row(1).get("Name").as_string(), "say \"hi\"");
}

TEST_F(CsvLoaderTest, TrimAppliesToUnquotedFieldsOnly) {
    LoadResult result = parse("A,B\n  42 ,\" 42 \"\n", Schema());
    ASSERT_TRUE(result.ok());
    const Row& row = result.store().row(0);
    EXPECT_EQ(row.get("A"), CellValue::integer(42));
    EXPECT_EQ(row.get("B"), CellValue::string(" 42 "));
}

TEST_F(CsvLoaderTest, TrimDisabled) {
    LoaderOptions opts;
    opts.trim_fields = false;
    LoadResult result = parse("A\n 42\n", Schema(), opts);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.store().row(0).get("A"), CellValue::string(" 42"));
}

TEST_F(CsvLoaderTest, CommentsAndBlankLinesDoNotCountAsRows) {
    LoadResult result =
        parse("# export\nID,Name\n\n1,a\n   \n# gone\n2,b\n", Schema::from_names({"ID", "Name"}));
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.store().num_rows(), 2u);
    EXPECT_EQ(result.store().row(1).get("Name").as_string(), "b");
}

TEST_F(CsvLoaderTest, CommentPrefixDisabled) {
    LoaderOptions opts;
    opts.comment_prefix.clear();
    LoadResult result = parse("#ID,Name\n1,a\n", Schema(), opts);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.store().has_field("#ID"));
}

TEST_F(CsvLoaderTest, MultiCharacterCommentPrefix) {
    LoaderOptions opts;
    opts.comment_prefix = "//";
    LoadResult result = parse("ID\n// skipped\n#1\n", Schema(), opts);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.store().num_rows(), 1u);
    EXPECT_EQ(result.store().row(0).get("ID").as_string(), "#1");
}

TEST_F(CsvLoaderTest, BlankLinesKeptWhenRequested) {
    LoaderOptions opts;
    opts.ignore_empty_lines = false;
    opts.missing_field_policy = MissingFieldPolicy::SetDefault;
    LoadResult result = parse("A,B\n\n1,2\n", Schema(), opts);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.store().num_rows(), 2u);
    EXPECT_TRUE(result.store().row(0).get("A").is_null());
    EXPECT_EQ(result.warnings().size(), 1u);
}

TEST_F(CsvLoaderTest, CrlfLineEndings) {
    LoadResult result = parse("A,B\r\n1,2\r\n", Schema());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.store().row(0).get("B"), CellValue::integer(2));
}

TEST_F(CsvLoaderTest, TabSeparated) {
    LoadResult result = parse("A\tB\nx, y\t2\n", Schema(), LoaderOptions::tsv());
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.store().row(0).get("A").as_string(), "x, y");
}

TEST_F(CsvLoaderTest, TabSeparatedEmptyFieldBeforeQuote) {
    LoadResult result = parse("A\tB\tC\n1\t\t\"x\"\n", Schema(), LoaderOptions::tsv());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.store().num_rows(), 1u);
    const Row& row = result.store().row(0);
    EXPECT_EQ(row.size(), 3u);
    EXPECT_EQ(row.get("A"), CellValue::integer(1));
    EXPECT_TRUE(row.get("B").is_null());
    EXPECT_EQ(row.get("C").as_string(), "x");
    EXPECT_TRUE(result.errors().empty());
}

TEST_F(CsvLoaderTest, ByteOrderMarkIsSkipped) {
    LoadResult result = parse("\xEF\xBB\xBFID,Name\n1,a\n", Schema::from_names({"ID"}));
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.store().has_field("ID"));

    LoadResult bad = parse("\xEF\xBB\xBF" "A\n\"x\n", Schema());
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().byte_offset, 5u);
}

TEST_F(CsvLoaderTest, DuplicateHeaderIsFatal) {
    LoadResult result = parse("ID,id\n1,2\n", Schema());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::DUPLICATE_COLUMN_NAMES);
}

class MissingFieldPolicyTest : public CsvLoaderTest {
protected:
    LoadResult parse_with(const char* text, MissingFieldPolicy policy) {
        LoaderOptions opts;
        opts.missing_field_policy = policy;
        return parse(text, Schema(), opts);
    }
};

TEST_F(MissingFieldPolicyTest, ThrowOnShortRow) {
    LoadResult result = parse_with("a,b,c\n1,2,3\n4,5\n", MissingFieldPolicy::Throw);
    ASSERT_FALSE(result.ok());
    const ParseError& err = result.error();
    EXPECT_EQ(err.code, ErrorCode::INCONSISTENT_FIELD_COUNT);
    EXPECT_EQ(err.line, 3u);
    EXPECT_EQ(err.row, 1u);
    EXPECT_EQ(err.message, "Expected 3 fields but found 2");
}

TEST_F(MissingFieldPolicyTest, ThrowOnLongRow) {
    LoadResult result = parse_with("a,b\n1,2,3\n", MissingFieldPolicy::Throw);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().message, "Expected 2 fields but found 3");
}

TEST_F(MissingFieldPolicyTest, SetDefaultPadsWithNull) {
    LoadResult result = parse_with("a,b,c\n1,2\n", MissingFieldPolicy::SetDefault);
    ASSERT_TRUE(result.ok());
    const Row& row = result.store().row(0);
    EXPECT_EQ(row.size(), 3u);
    EXPECT_TRUE(row.has_field("c"));
    EXPECT_TRUE(row.get("c").is_null());

    auto warnings = result.warnings();
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].severity, ErrorSeverity::WARNING);
    EXPECT_EQ(warnings[0].row, 0u);
    EXPECT_EQ(warnings[0].message, "Expected 3 fields but found 2; missing fields set to null");
}

TEST_F(MissingFieldPolicyTest, IgnoreLeavesFieldsOut) {
    LoadResult result = parse_with("a,b,c\n1,2\n", MissingFieldPolicy::Ignore);
    ASSERT_TRUE(result.ok());
    const TypedStore& store = result.store();
    EXPECT_EQ(store.row(0).size(), 2u);
    EXPECT_FALSE(store.row(0).has_field("c"));
    EXPECT_TRUE(store.row(0).get("c").is_null());
    EXPECT_TRUE(store.column("c")[0].is_null());
    EXPECT_EQ(result.warnings()[0].message,
              "Expected 3 fields but found 2; missing fields left out");
}

TEST_F(MissingFieldPolicyTest, ExtraColumnsKept) {
    LoadResult result = parse_with("a,b\n1,2,3\n", MissingFieldPolicy::SetDefault);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.store().num_columns(), 3u);
    EXPECT_EQ(result.store().row(0).at(2), CellValue::integer(3));
    EXPECT_EQ(result.warnings()[0].message, "Expected 2 fields but found 3; extra columns kept");
}

TEST_F(MissingFieldPolicyTest, WarningsReachTheReport) {
    LoaderOptions opts;
    opts.missing_field_policy = MissingFieldPolicy::SetDefault;
    LoadedData data = load("a,b\n1\n", Schema(), opts);
    EXPECT_TRUE(data.report.is_valid());
    ASSERT_EQ(data.report.warning_count(), 1u);
    EXPECT_EQ(data.report.warnings()[0].row, 0u);
    EXPECT_TRUE(data.report.warnings()[0].field.empty());
}

class HeaderlessTest : public CsvLoaderTest {};

TEST_F(HeaderlessTest, NamedFieldsByPosition) {
    LoadResult result =
        parse("1,Alice\n2,Bob\n", Schema::from_names({"ID", "Name"}), LoaderOptions::headerless());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.store().num_rows(), 2u);
    EXPECT_EQ(result.store().row(1).get("name").as_string(), "Bob");
    EXPECT_EQ(result.store().row(0).get("ID"), CellValue::integer(1));
}

TEST_F(HeaderlessTest, OrdinalFields) {
    Schema schema = Schema::Builder().ordinal(2, "Level").range(1, 10).build();
    LoaderOptions opts = LoaderOptions::headerless();
    opts.throw_on_validation_error = false;
    LoadedData data = load("a,b,5\nc,d,50\n", schema, opts);
    EXPECT_EQ(data.store.row(0).get("Level"), CellValue::integer(5));
    ASSERT_EQ(data.report.error_count(), 1u);
    EXPECT_EQ(data.report.errors()[0].field, "Level");
}

TEST_F(HeaderlessTest, ShortRowThrows) {
    LoadResult result =
        parse("1,Alice\n2\n", Schema::from_names({"ID", "Name"}), LoaderOptions::headerless());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::MISSING_FIELD);
    EXPECT_EQ(result.error().message,
              "Row has 1 field(s) but field 'Name' is bound to a later column");
}

TEST_F(HeaderlessTest, WiderRowsAreNotMismatches) {
    LoadResult result =
        parse("1,Alice,x\n", Schema::from_names({"ID", "Name"}), LoaderOptions::headerless());
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.warnings().empty());
    EXPECT_EQ(result.store().num_columns(), 3u);
}

TEST_F(CsvLoaderTest, LoadFile) {
    LoadedData data = load_file("test/data/units.csv", units_schema(), collecting());
    EXPECT_EQ(data.store.name(), "units");
    EXPECT_EQ(data.store.num_rows(), 3u);
    EXPECT_EQ(data.report.error_count(), 1u);
}

TEST_F(CsvLoaderTest, LoadFileWithBomAndCrlf) {
    LoadedData data = load_file("test/data/units_bom.csv", Schema::from_names({"ID", "Name"}));
    ASSERT_EQ(data.store.num_rows(), 2u);
    EXPECT_EQ(data.store.row(1).get("Name").as_string(), "Bob");
}

TEST_F(CsvLoaderTest, LoadFileRosterWithComments) {
    Schema schema = Schema::Builder()
                        .field("ID").primary_key()
                        .field("Level").range(1, 100)
                        .build();
    LoadedData data = load_file("test/data/roster_comments.csv", schema, collecting());
    ASSERT_EQ(data.store.num_rows(), 3u);
    ASSERT_EQ(data.report.error_count(), 2u);
    EXPECT_EQ(data.report.errors()[0].kind, ConstraintKind::PrimaryKey);
    EXPECT_EQ(data.report.errors()[0].row, 2u);
    EXPECT_EQ(data.report.errors()[1].kind, ConstraintKind::Range);
}

TEST_F(CsvLoaderTest, LoadFileMissing) {
    try {
        load_file("test/data/does_not_exist.csv", Schema());
        FAIL() << "Expected ParseException";
    } catch (const ParseException& e) {
        EXPECT_EQ(e.error().code, ErrorCode::IO_ERROR);
    }
}

TEST_F(CsvLoaderTest, DataNameOverridesFileStem) {
    LoaderOptions opts = collecting();
    opts.data_name = "roster";
    LoadedData data = load_file("test/data/units.csv", units_schema(), opts);
    EXPECT_EQ(data.store.name(), "roster");
}

TEST(MissingFieldPolicyNameTest, Names) {
    EXPECT_STREQ(missing_field_policy_to_string(MissingFieldPolicy::Throw), "throw");
    EXPECT_STREQ(missing_field_policy_to_string(MissingFieldPolicy::SetDefault), "set_default");
    EXPECT_STREQ(missing_field_policy_to_string(MissingFieldPolicy::Ignore), "ignore");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
