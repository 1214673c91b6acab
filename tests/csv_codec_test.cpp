#include <gtest/gtest.h>

#include "test_helpers.hpp"

#include "tabstream/core/errors.hpp"
#include "tabstream/data/csv_loader.hpp"
#include "tabstream/data/csv_writer.hpp"

#include <cmath>
#include <sstream>

namespace tabstream {
namespace {

using testing::index_labels;
using testing::make_id_value_csv;
using testing::make_id_value_frame;

////////////////////////////////////////////////////////////////////////////////

TEST(TCsvRecordReaderTest, QuotedFields)
{
    std::istringstream in("a,\"b,c\",\"say \"\"hi\"\"\"\r\n");
    CsvRecordReader reader(in, ',', '"');

    std::vector<std::string> fields;
    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ((std::vector<std::string>{"a", "b,c", "say \"hi\""}), fields);
    EXPECT_FALSE(reader.next(fields));
}

TEST(TCsvRecordReaderTest, MultiLineField)
{
    std::istringstream in("x,\"line1\nline2\"\ny,z\n");
    CsvRecordReader reader(in, ',', '"');

    std::vector<std::string> fields;
    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ((std::vector<std::string>{"x", "line1\nline2"}), fields);
    EXPECT_EQ(1u, reader.record_line());

    ASSERT_TRUE(reader.next(fields));
    EXPECT_EQ((std::vector<std::string>{"y", "z"}), fields);
    EXPECT_EQ(3u, reader.record_line());
}

TEST(TCsvRecordReaderTest, UnterminatedQuote)
{
    std::istringstream in("a,b\n1,\"open\n2,3\n");
    CsvRecordReader reader(in, ',', '"');

    std::vector<std::string> fields;
    ASSERT_TRUE(reader.next(fields));
    try {
        reader.next(fields);
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& ex) {
        EXPECT_EQ(2u, ex.line());
    }
}

////////////////////////////////////////////////////////////////////////////////

TEST(TCsvDecodeTest, InfersTypes)
{
    auto df = CsvLoader::decode("id,value,name\n1,0.5,ann\n2,1.5,bob\n", {});
    EXPECT_EQ(2u, df.row_count());
    EXPECT_EQ(ColumnType::INT64, df.column_type("id"));
    EXPECT_EQ(ColumnType::FLOAT64, df.column_type("value"));
    EXPECT_EQ(ColumnType::STRING, df.column_type("name"));
    EXPECT_EQ("bob", df.get_column<std::string>("name")[1]);
}

TEST(TCsvDecodeTest, MissingIntegerBecomesFloat)
{
    auto df = CsvLoader::decode("x\n1\n\"\"\n3\n", {});
    ASSERT_EQ(ColumnType::FLOAT64, df.column_type("x"));
    auto values = df.get_column<double>("x");
    EXPECT_DOUBLE_EQ(1.0, values[0]);
    EXPECT_TRUE(std::isnan(values[1]));
}

TEST(TCsvDecodeTest, WidensPastInferenceSample)
{
    CsvOptions opts;
    opts.infer_schema_rows = 1;
    auto df = CsvLoader::decode("x\n1\n2.5\n", opts);
    EXPECT_EQ(ColumnType::FLOAT64, df.column_type("x"));

    df = CsvLoader::decode("x\n1\nabc\n", opts);
    EXPECT_EQ(ColumnType::STRING, df.column_type("x"));
}

TEST(TCsvDecodeTest, ForcedStringKeepsText)
{
    CsvOptions opts;
    opts.dtype = ColumnType::STRING;
    auto df = CsvLoader::decode("code\n007\n", opts);
    EXPECT_EQ("007", df.get_column<std::string>("code")[0]);
}

TEST(TCsvDecodeTest, ForcedTypeMismatch)
{
    CsvOptions opts;
    opts.dtype = ColumnType::INT64;
    EXPECT_THROW(CsvLoader::decode("x\nabc\n", opts), DecodeError);
}

TEST(TCsvDecodeTest, HeaderRowSkipsPreamble)
{
    CsvOptions opts;
    opts.header_row = 1;
    auto df = CsvLoader::decode("# exported\na,b\n1,2\n", opts);
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), df.column_names());
    EXPECT_EQ(1u, df.row_count());
}

TEST(TCsvDecodeTest, NoHeaderGeneratesNames)
{
    CsvOptions opts;
    opts.header_row = CsvOptions::kNoHeader;
    auto df = CsvLoader::decode("1,2\n3,4\n", opts);
    EXPECT_EQ((std::vector<std::string>{"column_0", "column_1"}), df.column_names());
    EXPECT_EQ(2u, df.row_count());
}

TEST(TCsvDecodeTest, ExplicitNamesReplaceHeader)
{
    CsvOptions opts;
    opts.names = {"p", "q"};
    auto df = CsvLoader::decode("a,b\n1,2\n", opts);
    EXPECT_EQ((std::vector<std::string>{"p", "q"}), df.column_names());
    EXPECT_EQ(1u, df.row_count());
}

TEST(TCsvDecodeTest, RaggedRowReportsLine)
{
    try {
        CsvLoader::decode("a,b\n1,2\n3\n", {});
        FAIL() << "Expected DecodeError";
    } catch (const DecodeError& ex) {
        EXPECT_EQ(3u, ex.line());
    }
}

TEST(TCsvDecodeTest, RaggedRowUnderFixedSchema)
{
    CsvOptions opts;
    opts.header_row = CsvOptions::kNoHeader;
    opts.names = {"a", "b"};
    EXPECT_THROW(CsvLoader::decode("1,2\n3,4,5\n", opts), SchemaMismatchError);
}

TEST(TCsvDecodeTest, DuplicateHeaderName)
{
    EXPECT_THROW(CsvLoader::decode("a,a\n1,2\n", {}), DecodeError);
}

TEST(TCsvDecodeTest, IndexColumn)
{
    CsvOptions opts;
    opts.index_col = "k";
    auto df = CsvLoader::decode("k,v\n10,1\n20,2\n", opts);
    EXPECT_EQ((std::vector<std::string>{"v"}), df.column_names());
    EXPECT_EQ((std::vector<int64_t>{10, 20}), index_labels(df));

    opts.index_col = "missing";
    EXPECT_THROW(CsvLoader::decode("k,v\n10,1\n", opts), ConfigurationError);
}

TEST(TCsvDecodeTest, HeaderOnly)
{
    auto df = CsvLoader::decode("a,b\n", {});
    EXPECT_EQ((std::vector<std::string>{"a", "b"}), df.column_names());
    EXPECT_EQ(0u, df.row_count());
}

TEST(TCsvDecodeTest, InvalidOptions)
{
    CsvOptions opts;
    opts.quote = ',';
    EXPECT_THROW(CsvLoader::validate(opts), ConfigurationError);

    opts = {};
    opts.header_row = -2;
    EXPECT_THROW(CsvLoader::validate(opts), ConfigurationError);

    opts = {};
    opts.names = {"a", "a"};
    EXPECT_THROW(CsvLoader::validate(opts), ConfigurationError);
}

////////////////////////////////////////////////////////////////////////////////

TEST(TCsvChunkDecoderTest, ChunksKeepRunningIndex)
{
    std::istringstream in(make_id_value_csv(5));
    CsvChunkDecoder decoder(in, {});

    auto first = decoder.next_chunk(2);
    auto second = decoder.next_chunk(2);
    auto third = decoder.next_chunk(2);
    ASSERT_TRUE(first && second && third);
    EXPECT_FALSE(decoder.next_chunk(2));

    EXPECT_EQ((std::vector<int64_t>{0, 1}), index_labels(*first));
    EXPECT_EQ((std::vector<int64_t>{2, 3}), index_labels(*second));
    EXPECT_EQ((std::vector<int64_t>{4}), index_labels(*third));
    EXPECT_EQ(5u, decoder.rows_decoded());
    EXPECT_EQ(1u, decoder.header_lines());
}

////////////////////////////////////////////////////////////////////////////////

TEST(TCsvWriterTest, Render)
{
    auto df = make_id_value_frame(2);
    EXPECT_EQ("id,value\n0,0.5\n1,1.5\n", CsvWriter::render(df, {}, true));
    EXPECT_EQ("0,0.5\n1,1.5\n", CsvWriter::render(df, {}, false));
}

TEST(TCsvWriterTest, EscapesFields)
{
    DataFrame df;
    df.add_column("s", std::make_shared<StringColumn>(
        "s", std::vector<std::string>{"a,b", "q\"t", "plain"}, ColumnType::STRING));
    df.add_column("n", std::make_shared<Float64Column>(
        "n", std::vector<double>{1.0, 2.0, 3.0}, ColumnType::FLOAT64));

    EXPECT_EQ("s,n\n\"a,b\",1.0\n\"q\"\"t\",2.0\nplain,3.0\n", CsvWriter::render(df, {}, true));
}

TEST(TCsvWriterTest, WriteIndex)
{
    auto df = make_id_value_frame(2);
    df.reset_index(5);
    CsvWriteOptions opts;
    opts.write_index = true;
    EXPECT_EQ(",id,value\n5,0,0.5\n6,1,1.5\n", CsvWriter::render(df, opts, true));
}

TEST(TCsvWriterTest, LoneEmptyFieldIsQuoted)
{
    DataFrame df;
    df.add_column("s", std::make_shared<StringColumn>(
        "s", std::vector<std::string>{"", "x"}, ColumnType::STRING));

    const auto text = CsvWriter::render(df, {}, true);
    EXPECT_EQ("s\n\"\"\nx\n", text);

    auto back = CsvLoader::decode(text, {});
    EXPECT_EQ(2u, back.row_count());
}

TEST(TCsvWriterTest, DecodeRestoresFrame)
{
    auto df = make_id_value_frame(4);
    df.add_column("name", std::make_shared<StringColumn>(
        "name", std::vector<std::string>{"a", "b,c", "multi\nline", "d"}, ColumnType::STRING));

    auto back = CsvLoader::decode(CsvWriter::render(df, {}, true), {});
    EXPECT_TRUE(df.equals(back));
}

////////////////////////////////////////////////////////////////////////////////

} // namespace
} // namespace tabstream
