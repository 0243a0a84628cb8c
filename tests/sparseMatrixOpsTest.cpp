// File       : sparseMatrixOpsTest.cpp
// Created    : Wed Oct 14 2026 09:05:12 (+0200)
// Description: Sparse matrix diagnostics and binary export
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "fvDivergence.h"
#include "sparseMatrixOps.h"

using namespace voxelfv;

class sparseMatrixOpsTest : public ::testing::Test
{
protected:
    sparseMatrix mat_;

    fs::path dir_;

    void SetUp() override
    {
        // 1 . .
        // 2 3 .
        // 4 . 5
        const std::vector<triplet> triplets{{0, 0, 1.0},
                                            {1, 0, 2.0},
                                            {1, 1, 3.0},
                                            {2, 0, 4.0},
                                            {2, 2, 5.0}};
        mat_.resize(3, 3);
        mat_.setFromTriplets(triplets.begin(), triplets.end());
        mat_.makeCompressed();

        dir_ = fs::temp_directory_path() / "voxelfv_sparseMatrixOpsTest";
        fs::create_directories(dir_);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }
};

TEST_F(sparseMatrixOpsTest, bandwidthAndProfile)
{
    EXPECT_EQ(ops::bandwidth(mat_), 2);
    EXPECT_EQ(ops::profile(mat_), 3);
}

TEST_F(sparseMatrixOpsTest, frobeniusNorm)
{
    EXPECT_DOUBLE_EQ(ops::norm(mat_), std::sqrt(55.0));
    EXPECT_DOUBLE_EQ(ops::norm(mat_, ops::matrixNorm::Frobenius),
                     std::sqrt(55.0));
}

TEST_F(sparseMatrixOpsTest, stream)
{
    std::ostringstream os;
    ops::stream(os, mat_, 2, 2, 8, 2);

    // header line plus two rows
    EXPECT_NE(os.str().find("2.00e+00"), std::string::npos);
    EXPECT_EQ(os.str().find("4.00e+00"), std::string::npos);
}

TEST_F(sparseMatrixOpsTest, writeMatrix)
{
    const std::string basename = (dir_ / "lower").string();
    ops::writeMatrix(mat_, basename);

    ASSERT_TRUE(fs::exists(basename + "_rows.bin"));
    ASSERT_TRUE(fs::exists(basename + "_cols.bin"));
    ASSERT_TRUE(fs::exists(basename + "_vals.bin"));

    EXPECT_EQ(fs::file_size(basename + "_rows.bin"), 4 * sizeof(int32_t));
    EXPECT_EQ(fs::file_size(basename + "_cols.bin"), 5 * sizeof(int32_t));
    EXPECT_EQ(fs::file_size(basename + "_vals.bin"), 5 * sizeof(double));

    std::ifstream in(basename + "_rows.bin", std::ios::binary);
    std::vector<int32_t> rows(4);
    in.read(reinterpret_cast<char*>(rows.data()), 4 * sizeof(int32_t));
    EXPECT_EQ(rows, (std::vector<int32_t>{0, 1, 3, 5}));

    std::ifstream vin(basename + "_vals.bin", std::ios::binary);
    std::vector<double> vals(5);
    vin.read(reinterpret_cast<char*>(vals.data()), 5 * sizeof(double));
    EXPECT_EQ(vals, (std::vector<double>{1.0, 2.0, 3.0, 4.0, 5.0}));
}

TEST_F(sparseMatrixOpsTest, writeMatrixToMissingDirectoryThrows)
{
    const std::string basename = (dir_ / "missing" / "lower").string();
    EXPECT_THROW(ops::writeMatrix(mat_, basename), std::runtime_error);
}

TEST(sparseMatrixOpsOperatorTest, divergenceNorm)
{
    // 2 * nFaces entries of magnitude 1
    const grid g({3, 3}, {1.0, 1.0});
    const fvDivergence div(g);
    EXPECT_DOUBLE_EQ(ops::norm(div.mat()), std::sqrt(2.0 * g.nFaces()));
}
