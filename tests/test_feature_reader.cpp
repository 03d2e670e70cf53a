/**
 * @file test_feature_reader.cpp
 * @brief Unit tests for FeatureReader
 */

#include <gtest/gtest.h>

#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "io/FeatureReader.hpp"

using namespace LoOP;

namespace {

FeatureTable read_text(const std::string& text, const ReaderOptions& options = ReaderOptions()) {
    std::istringstream in(text);
    FeatureReader reader(options);
    return reader.read(in, "test.csv");
}

}  // namespace

TEST(FeatureReaderTest, HeaderWithoutLabels) {
    FeatureTable table = read_text("x,y\n1.5,2\n-3,4e1\n");

    EXPECT_EQ(table.feature_names, (std::vector<std::string>{"x", "y"}));
    ASSERT_EQ(table.num_observations(), 2);
    ASSERT_EQ(table.num_features(), 2);
    EXPECT_DOUBLE_EQ(table.values(0, 0), 1.5);
    EXPECT_DOUBLE_EQ(table.values(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(table.values(1, 0), -3.0);
    EXPECT_DOUBLE_EQ(table.values(1, 1), 40.0);
    EXPECT_FALSE(table.has_labels());
    EXPECT_TRUE(table.label_name.empty());
}

TEST(FeatureReaderTest, LabelColumnByName) {
    ReaderOptions options;
    options.label_column = "group";

    FeatureTable table = read_text("x,group,y\n1,a,2\n3,b,4\n5,a,6\n", options);

    EXPECT_EQ(table.feature_names, (std::vector<std::string>{"x", "y"}));
    EXPECT_EQ(table.label_name, "group");
    ASSERT_EQ(table.num_features(), 2);
    EXPECT_DOUBLE_EQ(table.values(2, 1), 6.0);

    ASSERT_TRUE(table.has_labels());
    EXPECT_EQ(table.labels, (std::vector<int>{0, 1, 0}));
    EXPECT_EQ(table.cluster_index.get_name(1), "b");
}

TEST(FeatureReaderTest, LabelColumnByIndexWithoutHeader) {
    ReaderOptions options;
    options.has_header = false;
    options.label_column = "0";

    FeatureTable table = read_text("7,1,2\n7,3,4\n9,5,6\n", options);

    EXPECT_EQ(table.feature_names, (std::vector<std::string>{"f0", "f1"}));
    EXPECT_EQ(table.label_name, "column_0");
    ASSERT_EQ(table.num_observations(), 3);
    EXPECT_DOUBLE_EQ(table.values(0, 0), 1.0);
    EXPECT_EQ(table.labels, (std::vector<int>{0, 0, 1}));
    EXPECT_EQ(table.cluster_index.get_name(0), "7");
}

TEST(FeatureReaderTest, LabelColumnNotFound) {
    ReaderOptions options;
    options.label_column = "cluster";
    EXPECT_THROW(read_text("x,y\n1,2\n", options), std::runtime_error);

    options.label_column = "5";
    EXPECT_THROW(read_text("x,y\n1,2\n", options), std::runtime_error);
}

TEST(FeatureReaderTest, MissingTokensBecomeNaN) {
    FeatureTable table = read_text("a,b,c,d,e\n1,,NA,NaN,null\nnan,2,3,4,5\n");

    ASSERT_EQ(table.num_observations(), 2);
    EXPECT_DOUBLE_EQ(table.values(0, 0), 1.0);
    for (int c = 1; c < 5; ++c) {
        EXPECT_TRUE(std::isnan(table.values(0, c))) << "column " << c;
    }
    EXPECT_TRUE(std::isnan(table.values(1, 0)));
    EXPECT_EQ(table.count_missing(), 5);
}

TEST(FeatureReaderTest, MissingTokenSet) {
    EXPECT_TRUE(FeatureReader::is_missing_token(""));
    EXPECT_TRUE(FeatureReader::is_missing_token("NA"));
    EXPECT_FALSE(FeatureReader::is_missing_token("0"));
    EXPECT_FALSE(FeatureReader::is_missing_token("N/A"));
}

TEST(FeatureReaderTest, NonNumericCellThrows) {
    try {
        read_text("x,y\n1,2\n3,abc\n");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("abc"), std::string::npos);
        EXPECT_NE(msg.find("test.csv:3"), std::string::npos);
    }

    EXPECT_THROW(read_text("x\n1.5x\n"), std::runtime_error);
}

TEST(FeatureReaderTest, RaggedRowThrows) {
    try {
        read_text("x,y\n1,2\n3\n");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("Expected 2 cells but found 1"), std::string::npos);
    }
}

TEST(FeatureReaderTest, BlankLinesAndWhitespace) {
    ReaderOptions options;
    options.delimiter = '\t';

    FeatureTable table = read_text("\n x \t y \r\n\n 1 \t 2\r\n   \n3\t4\r\n", options);

    EXPECT_EQ(table.feature_names, (std::vector<std::string>{"x", "y"}));
    ASSERT_EQ(table.num_observations(), 2);
    EXPECT_DOUBLE_EQ(table.values(0, 0), 1.0);
    EXPECT_DOUBLE_EQ(table.values(1, 1), 4.0);
}

TEST(FeatureReaderTest, EmptyInputThrows) {
    EXPECT_THROW(read_text(""), std::runtime_error);
    EXPECT_THROW(read_text("x,y\n"), std::runtime_error);
}

TEST(FeatureReaderTest, ReadFromFile) {
    const std::string path = "feature_reader_test.csv";
    {
        std::ofstream ofs(path);
        ofs << "x,y\n0,0\n1,1\n";
    }

    FeatureReader reader;
    FeatureTable table = reader.read(path);
    EXPECT_EQ(table.num_observations(), 2);
    EXPECT_DOUBLE_EQ(table.values(1, 0), 1.0);

    std::remove(path.c_str());
}

TEST(FeatureReaderTest, MissingFileThrows) {
    FeatureReader reader;
    EXPECT_THROW(reader.read("no_such_features.csv"), std::runtime_error);
}
