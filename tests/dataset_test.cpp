#include "dataset.hpp"
#include "errors.hpp"
#include "temp_directory.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

TEST(Dataset, SplitsInputsAndTargets)
{
    const TempDirectory directory;
    const auto path = directory.write_file("or.csv",
                                           "# x1, x2, y\n"
                                           "0, 0, 0\n"
                                           "\n"
                                           "0,1,1\n"
                                           "  1 , 0 , 1  \r\n"
                                           "1,1,1\n");

    const auto examples = load_csv(path, 2, 1);

    ASSERT_EQ(examples.size(), 4u);
    EXPECT_EQ(examples[1].input.size(), 2);
    EXPECT_EQ(examples[1].target.size(), 1);
    EXPECT_FLOAT_EQ(examples[1].input(1), 1.0f);
    EXPECT_FLOAT_EQ(examples[2].input(0), 1.0f);
    EXPECT_FLOAT_EQ(examples[2].target(0), 1.0f);
    EXPECT_FLOAT_EQ(examples[0].target(0), 0.0f);
}

TEST(Dataset, ReadsInputsWithoutTargets)
{
    const TempDirectory directory;
    const auto path =
        directory.write_file("inputs.csv", "0.5,-1.25,3e-2\n2,4,8\n");

    const auto examples = load_csv(path, 3, 0);

    ASSERT_EQ(examples.size(), 2u);
    EXPECT_EQ(examples[0].target.size(), 0);
    EXPECT_FLOAT_EQ(examples[0].input(1), -1.25f);
    EXPECT_FLOAT_EQ(examples[0].input(2), 0.03f);
    EXPECT_FLOAT_EQ(examples[1].input(2), 8.0f);
}

TEST(Dataset, WrongColumnCountThrows)
{
    const TempDirectory directory;
    const auto path = directory.write_file("bad.csv", "0,0,0\n0,1\n");

    try
    {
        static_cast<void>(load_csv(path, 2, 1));
        FAIL() << "Expected FormatError";
    }
    catch (const FormatError &e)
    {
        EXPECT_NE(std::string(e.what()).find("Line 2"), std::string::npos);
    }
}

TEST(Dataset, InvalidNumberThrows)
{
    const TempDirectory directory;
    const auto path = directory.write_file("bad.csv", "0,x,0\n");
    EXPECT_THROW(static_cast<void>(load_csv(path, 2, 1)), FormatError);

    const auto empty_cell = directory.write_file("empty.csv", "0,,0\n");
    EXPECT_THROW(static_cast<void>(load_csv(empty_cell, 2, 1)), FormatError);
}

TEST(Dataset, MissingFileThrows)
{
    const TempDirectory directory;
    EXPECT_THROW(
        static_cast<void>(load_csv(directory.path() / "none.csv", 2, 1)),
        IoError);
}

TEST(Dataset, InvalidLayoutThrows)
{
    const TempDirectory directory;
    const auto path = directory.write_file("ok.csv", "1,2\n");
    EXPECT_THROW(static_cast<void>(load_csv(path, 0, 2)),
                 std::invalid_argument);
}
