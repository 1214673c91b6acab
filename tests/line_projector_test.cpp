#include <gtest/gtest.h>

#include "test_helpers.hpp"

#include "tabstream/sources/csv_file_source.hpp"
#include "tabstream/sources/table_source.hpp"
#include "tabstream/stream/line_projector.hpp"

namespace tabstream {
namespace {

using testing::TempDir;
using testing::make_id_value_csv;
using testing::make_id_value_frame;
using testing::write_text_file;

std::vector<std::string> drain(LineProjector& projector)
{
    std::vector<std::string> lines;
    std::string line;
    while (projector.next(line)) {
        lines.push_back(line);
    }
    return lines;
}

////////////////////////////////////////////////////////////////////////////////

TEST(TLineProjectorTest, HeaderOnceAcrossChunks)
{
    TableChunkSource source(make_id_value_frame(10), 4);
    LineProjector projector(source);

    auto lines = drain(projector);
    ASSERT_EQ(11u, lines.size());
    EXPECT_EQ("id,value\n", lines[0]);
    EXPECT_EQ("0,0.5\n", lines[1]);
    EXPECT_EQ("9,9.5\n", lines[10]);
    for (size_t i = 1; i < lines.size(); ++i) {
        EXPECT_NE("id,value\n", lines[i]);
    }
    EXPECT_EQ(3u, projector.chunks_rendered());
    EXPECT_EQ(11u, projector.lines_emitted());
}

TEST(TLineProjectorTest, FileSourceMatchesInput)
{
    TempDir dir;
    const auto path = dir.file("input.csv");
    const auto text = make_id_value_csv(10);
    write_text_file(path, text);

    CsvFileChunkSource source(path, {}, 4);
    LineProjector projector(source);

    std::string joined;
    for (const auto& line : drain(projector)) {
        joined += line;
    }
    EXPECT_EQ(text, joined);
}

TEST(TLineProjectorTest, WithoutHeader)
{
    TableChunkSource source(make_id_value_frame(3), 2);
    CsvWriteOptions opts;
    opts.header = false;
    LineProjector projector(source, opts);

    auto lines = drain(projector);
    EXPECT_EQ((std::vector<std::string>{"0,0.5\n", "1,1.5\n", "2,2.5\n"}), lines);
}

TEST(TLineProjectorTest, PipeAppliesToEveryLine)
{
    TableChunkSource source(make_id_value_frame(2), 1);
    LineProjector projector(source);
    projector.set_pipe([] (std::string line) {
        return "# " + line;
    });

    auto lines = drain(projector);
    EXPECT_EQ((std::vector<std::string>{"# id,value\n", "# 0,0.5\n", "# 1,1.5\n"}), lines);
}

TEST(TLineProjectorTest, ResetRepeatsHeader)
{
    TableChunkSource source(make_id_value_frame(2), 1);
    LineProjector projector(source);
    EXPECT_EQ(3u, drain(projector).size());

    projector.reset();
    auto lines = drain(projector);
    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ("id,value\n", lines[0]);
}

TEST(TLineProjectorTest, EmptySource)
{
    TableChunkSource source(DataFrame{}, 3);
    LineProjector projector(source);
    EXPECT_TRUE(drain(projector).empty());
}

////////////////////////////////////////////////////////////////////////////////

} // namespace
} // namespace tabstream
