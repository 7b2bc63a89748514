#include "DataSource.h"
#include "FairLensExceptions.h"
#include "TestHelpers.h"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

TEST(DataSourceTest, ParsesQuotedCsvWithBomAndCrlf) {
    std::istringstream in("\xEF\xBB\xBF Gender ,Score,,score\r\n"
                          "\"Doe, Jane\",0.9,\"say \"\"hi\"\"\",1\r\n"
                          "Male,NA,,+5\r\n"
                          "\r\n"
                          "Female,5%,x\r\n");
    const Dataset data = DataSource::loadCsv(in);

    EXPECT_EQ(data.columns(), (std::vector<std::string>{"gender", "score", "column_3", "score_2"}));
    ASSERT_EQ(data.rowCount(), 3u);

    EXPECT_EQ(data.value(0, 0).text, "Doe, Jane");
    EXPECT_TRUE(data.value(0, 1).isNumber());
    EXPECT_DOUBLE_EQ(data.value(0, 1).number, 0.9);
    EXPECT_EQ(data.value(0, 2).text, "say \"hi\"");

    EXPECT_TRUE(data.value(1, 1).isEmpty());
    EXPECT_TRUE(data.value(1, 2).isEmpty());
    EXPECT_TRUE(data.value(1, 3).isNumber());
    EXPECT_DOUBLE_EQ(data.value(1, 3).number, 5.0);

    EXPECT_EQ(data.value(2, 1).kind, CellKind::TEXT);
    EXPECT_TRUE(data.value(2, 3).isEmpty());
}

TEST(DataSourceTest, QuotedFieldsMaySpanLines) {
    std::istringstream in("note,approved\n\"line one\nline two\",1\n");
    const Dataset data = DataSource::loadCsv(in);
    ASSERT_EQ(data.rowCount(), 1u);
    EXPECT_EQ(data.value(0, 0).text, "line one\nline two");
}

TEST(DataSourceTest, HonoursDelimiter) {
    std::istringstream in("gender;approved\nMale;1\nFemale;0\n");
    const Dataset data = DataSource::loadCsv(in, ';');
    EXPECT_EQ(data.colCount(), 2u);
    EXPECT_EQ(data.rowCount(), 2u);
}

TEST(DataSourceTest, TypesDatesAndMissingTokens) {
    std::istringstream in("decided_on,flag\n2024-01-15,null\n2024-01-15 08:30,n/a\nnext week,NaN\n");
    const Dataset data = DataSource::loadCsv(in);
    EXPECT_TRUE(data.value(0, 0).isDate());
    EXPECT_EQ(DateUtils::formatIsoDate(data.value(0, 0).unixSeconds), "2024-01-15");
    EXPECT_TRUE(data.value(1, 0).isDate());
    EXPECT_EQ(data.value(2, 0).kind, CellKind::TEXT);
    for (size_t r = 0; r < 3; ++r) EXPECT_TRUE(data.value(r, 1).isEmpty());
}

TEST(DataSourceTest, EmptyInputIsRejected) {
    std::istringstream in("");
    EXPECT_THROW(DataSource::loadCsv(in), FairLens::DatasetException);
}

TEST(DataSourceTest, MissingFileIsIoError) {
    EXPECT_THROW(DataSource::load("/nonexistent/fairlens/input.csv"), FairLens::IOException);
}

TEST(DataSourceTest, UnknownExtensionReadsAsCsv) {
    TestHelpers::TempFile file("extension.txt");
    {
        std::ofstream out(file.path());
        out << "gender,approved\nMale,1\nFemale,0\n";
    }
    const Dataset data = DataSource::load(file.path());
    EXPECT_EQ(data.rowCount(), 2u);
    EXPECT_EQ(data.findColumnIndex("approved"), 1);
}

TEST(DataSourceTest, ParquetWithoutFileFails) {
    // Missing support and a missing file both surface as library exceptions.
    EXPECT_THROW(DataSource::load("/nonexistent/fairlens/input.parquet"), FairLens::FairLensException);
    if (!DataSource::parquetSupported()) {
        EXPECT_THROW(DataSource::loadParquet("input.parquet"), FairLens::DatasetException);
    }
}

TEST(DataSourceTest, DatasetSubsetAndPadding) {
    const Dataset data = Dataset::fromRows({"a", "b"}, {{"1"}, {"2", "x", "extra"}});
    ASSERT_EQ(data.rowCount(), 2u);
    EXPECT_TRUE(data.value(0, 1).isEmpty());
    EXPECT_EQ(data.records()[1].size(), 2u);

    const Dataset sub = data.subset({1});
    ASSERT_EQ(sub.rowCount(), 1u);
    EXPECT_EQ(sub.value(0, 1).text, "x");
    EXPECT_THROW(data.subset({5}), FairLens::DatasetException);
}
