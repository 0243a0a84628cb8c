// File       : tangentialReconstructionTest.cpp
// Created    : Tue Oct 13 2026 08:51:44 (+0200)
// Description: Tangential flux reconstruction at faces
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#include <gtest/gtest.h>

#include "fvTangentialFaceReconstruction.h"

using namespace voxelfv;

namespace
{

denseVector arange(const label n)
{
    return denseVector::LinSpaced(n, 0.0, static_cast<scalar>(n - 1));
}

void expectDenseRow(const sparseMatrix& mat, const label row, const Vector& vals)
{
    ASSERT_EQ(mat.cols(), static_cast<label>(vals.size()));
    for (label j = 0; j < mat.cols(); j++)
    {
        EXPECT_DOUBLE_EQ(mat.coeff(row, j), vals[j])
            << "row " << row << ", col " << j;
    }
}

void expectPattern(const sparseMatrix& mat,
                   const label row,
                   const labelVector& cols)
{
    labelVector found;
    for (sparseMatrix::InnerIterator it(mat, row); it; ++it)
    {
        found.push_back(it.col());
        EXPECT_DOUBLE_EQ(it.value(), fvTangentialFaceReconstruction::WEIGHT);
    }
    EXPECT_EQ(found, cols) << "row " << row;
}

} // namespace

TEST(tangentialReconstructionTest, directionMapping)
{
    using rec = fvTangentialFaceReconstruction;

    EXPECT_EQ(rec::tangentialDirection(0, 0), 1);
    EXPECT_EQ(rec::tangentialDirection(0, 1), 2);
    EXPECT_EQ(rec::tangentialDirection(1, 0), 0);
    EXPECT_EQ(rec::tangentialDirection(1, 1), 2);
    EXPECT_EQ(rec::tangentialDirection(2, 0), 0);
    EXPECT_EQ(rec::tangentialDirection(2, 1), 1);

    for (label normal = 0; normal < 3; normal++)
    {
        for (label i = 0; i < 2; i++)
        {
            EXPECT_EQ(
                rec::tangentialIndex(normal,
                                     rec::tangentialDirection(normal, i)),
                i);
        }
    }
}

TEST(tangentialReconstructionTest, smallGridRows)
{
    const grid g({2, 3}, {1.0, 1.0});
    const fvTangentialFaceReconstruction rec(g);

    ASSERT_EQ(rec.nTangentialDirections(), 1);
    ASSERT_EQ(rec.mat(0).rows(), 7);
    ASSERT_EQ(rec.mat(0).cols(), 7);

    expectDenseRow(rec.mat(0), 0, {0, 0, 0, 0.25, 0.25, 0, 0});
    expectDenseRow(rec.mat(0), 1, {0, 0, 0, 0.25, 0.25, 0.25, 0.25});
    expectDenseRow(rec.mat(0), 4, {0.25, 0.25, 0, 0, 0, 0, 0});
}

TEST(tangentialReconstructionTest, patterns2D)
{
    const grid g({3, 4}, {1.0, 1.0});
    const fvTangentialFaceReconstruction rec(g);

    expectPattern(rec.mat(0), 0, {8, 9});
    expectPattern(rec.mat(0), 7, {15, 16});
    expectPattern(rec.mat(0), 2, {8, 9, 11, 12});
    expectPattern(rec.mat(0), 15, {4, 5, 6, 7});
}

TEST(tangentialReconstructionTest, values2D)
{
    const grid g({3, 4}, {1.0, 1.0});
    const fvTangentialFaceReconstruction rec(g);

    const auto tangential = rec.apply(arange(g.nFaces()));
    ASSERT_EQ(tangential.size(), 1u);

    const denseVector& t = tangential[0];
    ASSERT_EQ(t.size(), 17);
    EXPECT_DOUBLE_EQ(t[0], 4.25);
    EXPECT_DOUBLE_EQ(t[1], 4.75);
    EXPECT_DOUBLE_EQ(t[4], 13.0);
    EXPECT_DOUBLE_EQ(t[8], 0.5);
    EXPECT_DOUBLE_EQ(t[12], 3.5);
    EXPECT_DOUBLE_EQ(t[16], 3.0);
}

TEST(tangentialReconstructionTest, values3D)
{
    const grid g({3, 3, 3}, {0.5, 0.25, 2.0});
    const fvTangentialFaceReconstruction rec(g);

    ASSERT_EQ(g.nFaces(), 54);
    ASSERT_EQ(rec.nTangentialDirections(), 2);

    const auto t = rec.apply(arange(g.nFaces()));

    // normal 0: components along axes 1 and 2
    EXPECT_DOUBLE_EQ(t[0][0], (18 + 19) / 4.0);
    EXPECT_DOUBLE_EQ(t[1][0], (36 + 37) / 4.0);
    EXPECT_DOUBLE_EQ(t[0][8], (24 + 25 + 27 + 28) / 4.0);
    EXPECT_DOUBLE_EQ(t[1][8], (39 + 40 + 48 + 49) / 4.0);

    // normal 1: components along axes 0 and 2
    EXPECT_DOUBLE_EQ(t[0][18], (0 + 2) / 4.0);
    EXPECT_DOUBLE_EQ(t[1][18], (36 + 39) / 4.0);
    EXPECT_DOUBLE_EQ(t[0][25], (6 + 7 + 8 + 9) / 4.0);
    EXPECT_DOUBLE_EQ(t[1][25], (37 + 40 + 46 + 49) / 4.0);

    // normal 2: components along axes 0 and 1
    EXPECT_DOUBLE_EQ(t[0][36], (0 + 6) / 4.0);
    EXPECT_DOUBLE_EQ(t[1][36], (18 + 24) / 4.0);
    EXPECT_DOUBLE_EQ(t[0][40], (2 + 3 + 8 + 9) / 4.0);
    EXPECT_DOUBLE_EQ(t[1][40], (19 + 22 + 25 + 28) / 4.0);
}

TEST(tangentialReconstructionTest, boundaryValuesAreDamped)
{
    const grid g({3, 4}, {1.0, 1.0});
    const fvTangentialFaceReconstruction rec(g);

    const auto t = rec.apply(denseVector::Ones(g.nFaces()));

    // two contributing faces at the boundary, four in the interior; the
    // weights are not renormalized
    EXPECT_DOUBLE_EQ(t[0][0], 0.5);
    EXPECT_DOUBLE_EQ(t[0][4], 1.0);
    EXPECT_DOUBLE_EQ(t[0][8], 0.5);
}

TEST(tangentialReconstructionTest, concatenated)
{
    const grid g({3, 3, 3}, {1.0, 1.0, 1.0});
    const fvTangentialFaceReconstruction rec(g);

    const denseVector flux = arange(g.nFaces());
    const auto t = rec.apply(flux);
    const denseVector stacked = rec.applyConcatenated(flux);

    ASSERT_EQ(stacked.size(), 2 * g.nFaces());
    EXPECT_TRUE(stacked.head(g.nFaces()).isApprox(t[0]));
    EXPECT_TRUE(stacked.tail(g.nFaces()).isApprox(t[1]));
}

TEST(tangentialReconstructionTest, sizeMismatchThrows)
{
    const grid g({3, 4}, {1.0, 1.0});
    const fvTangentialFaceReconstruction rec(g);

    EXPECT_THROW(rec.apply(denseVector::Ones(g.nCells())),
                 dimensionMismatchError);
    EXPECT_THROW(rec.applyConcatenated(denseVector::Ones(g.nFaces() + 1)),
                 dimensionMismatchError);
}
