// File       : discretizationTest.cpp
// Created    : Thu Oct 15 2026 08:44:19 (+0200)
// Description: End-to-end assembly driven by yaml input
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#include <fstream>

#include <gtest/gtest.h>

#include "discretization.h"

using namespace voxelfv;

class discretizationTest : public ::testing::Test
{
protected:
    fs::path dir_;

    void SetUp() override
    {
        dir_ = fs::temp_directory_path() / "voxelfv_discretizationTest";
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    YAML::Node input_(const std::string& operators) const
    {
        return YAML::Load("grid:\n"
                          "  shape: [4, 5]\n"
                          "  voxel_size: [0.5, 0.25]\n" +
                          operators +
                          "output:\n"
                          "  file_path: " +
                          dir_.string() +
                          "\n"
                          "  write_matrices: true\n"
                          "  profile: false\n");
    }
};

TEST_F(discretizationTest, assemblesAllOperators)
{
    discretization disc(input_(""));
    disc.run();

    EXPECT_EQ(disc.gridRef().nCells(), 20);

    ASSERT_TRUE(disc.hasDivergence());
    EXPECT_EQ(disc.divergenceRef().mat().rows(), 20);
    EXPECT_EQ(disc.divergenceRef().mat().cols(), 31);

    ASSERT_TRUE(disc.hasMass());
    EXPECT_EQ(disc.massRef().size(), 20);

    ASSERT_TRUE(disc.hasReconstruction());
    EXPECT_EQ(disc.reconstructionRef()
                  .tangentialReconstruction()
                  .nTangentialDirections(),
              1);

    ASSERT_TRUE(disc.hasFaceToCell());
    EXPECT_EQ(disc.faceToCellRef().mats().size(), 2u);
}

TEST_F(discretizationTest, writesMatrices)
{
    discretization disc(input_("operators:\n"
                               "  mass:\n"
                               "    mode: faces\n"));

    ::testing::internal::CaptureStdout();
    disc.run();
    const std::string log = ::testing::internal::GetCapturedStdout();
    EXPECT_NE(log.find("Operators written to `" + dir_.string() + "`"),
              std::string::npos);

    for (const std::string name : {"divergence",
                                   "mass_faces",
                                   "tangential_reconstruction_0",
                                   "face_to_cell_0",
                                   "face_to_cell_1"})
    {
        for (const std::string suffix : {"_rows.bin", "_cols.bin", "_vals.bin"})
        {
            EXPECT_TRUE(fs::exists(dir_ / (name + suffix))) << name + suffix;
        }
    }

    // 31 diagonal entries of the face mass matrix
    EXPECT_EQ(fs::file_size(dir_ / "mass_faces_vals.bin"),
              31 * sizeof(double));
    EXPECT_EQ(fs::file_size(dir_ / "mass_faces_rows.bin"),
              32 * sizeof(int32_t));
}

TEST_F(discretizationTest, disabledOperatorsAreNotAssembled)
{
    discretization disc(input_("operators:\n"
                               "  mass:\n"
                               "    enabled: false\n"
                               "  face_to_cell:\n"
                               "    enabled: false\n"));
    disc.run();

    EXPECT_TRUE(disc.hasDivergence());
    EXPECT_FALSE(disc.hasMass());
    EXPECT_FALSE(disc.hasFaceToCell());
    EXPECT_THROW(disc.massRef(), std::runtime_error);
    EXPECT_THROW(disc.faceToCellRef(), std::runtime_error);

    EXPECT_FALSE(fs::exists(dir_ / "face_to_cell_0_rows.bin"));
}

TEST_F(discretizationTest, invalidGridThrows)
{
    EXPECT_THROW(discretization(YAML::Load("grid:\n"
                                           "  shape: [4, 5]\n"
                                           "  voxel_size: [0.5]\n")),
                 invalidGridError);
}

TEST_F(discretizationTest, commandLine)
{
    fs::create_directories(dir_);
    const fs::path inputFile = dir_ / "input.yaml";
    {
        std::ofstream out(inputFile);
        out << "grid:\n"
               "  shape: [3, 3, 3]\n"
               "  voxel_size: 1.0\n"
               "output:\n"
               "  profile: false\n";
    }

    const std::string path = inputFile.string();
    const char* argv[] = {"voxelFV", "-i", path.c_str()};
    discretization disc(3, argv);
    disc.run();

    EXPECT_EQ(disc.gridRef().nFaces(), 54);
    EXPECT_EQ(disc.reconstructionRef()
                  .tangentialReconstruction()
                  .nTangentialDirections(),
              2);
}

TEST_F(discretizationTest, commandLineErrors)
{
    const char* missingFile[] = {"voxelFV", "-i", "does_not_exist.yaml"};
    EXPECT_THROW(discretization(3, missingFile), std::runtime_error);

    const char* missingValue[] = {"voxelFV", "--input"};
    EXPECT_THROW(discretization(2, missingValue), std::runtime_error);

    const char* unknownOption[] = {"voxelFV", "--bogus"};
    EXPECT_THROW(discretization(2, unknownOption), std::runtime_error);
}
