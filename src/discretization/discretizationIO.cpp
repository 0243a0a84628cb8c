// File : discretizationIO.cpp
// Created    : Fri Oct 09 2026 14:03:14 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "discretization.h"
#include "git_revision.h"
#include "sparseMatrixOps.h"

namespace voxelfv
{

// Read and register information

void discretization::parseArguments_(const int argc, const char* argv[])
{
    std::string inputFileName("input.yaml");

    for (int i = 1; i < argc; i++)
    {
        const std::string arg(argv[i]);

        if (arg == "-i" || arg == "--input")
        {
            if (i + 1 >= argc)
            {
                errorMsg("option `" + arg + "` requires a file name");
            }
            inputFileName = argv[++i];
        }
        else
        {
            printUsage(argv[0]);
            errorMsg("unrecognized option `" + arg + "`");
        }
    }

    inputFilePath_ = fs::path(inputFileName);

    if (!fs::exists(inputFilePath_))
    {
        errorMsg("input file `" + inputFilePath_.string() + "` not found");
    }
}

void discretization::create_()
{
    createControls_();
    createGrid_();
}

void discretization::createControls_()
{
    controlsPtr_ = std::make_unique<controls>();
    controlsPtr_->read(inputNode_);
}

void discretization::createGrid_()
{
    if (verbose() > 0)
    {
        std::cout << "Reading grid .." << std::endl;
    }

    gridPtr_ = std::make_unique<grid>(grid::read(inputNode_["grid"]));
}

void discretization::createDirectories_()
{
    const fs::path outputPath = controlsRef().outputPath();

    std::error_code ec;
    fs::create_directories(outputPath, ec);
    if (ec)
    {
        errorMsg("Cannot create output directory `" + outputPath.string() +
                 "`: " + ec.message());
    }
}

// Output

void discretization::report_() const
{
    gridRef().printSummary();

    const auto matrices = collectMatrices_();
    if (matrices.empty())
    {
        warningMsg("no operator enabled in the input file");
        return;
    }

    std::cout << std::endl << "Assembled operators:" << std::endl;
    for (const auto& [name, mat] : matrices)
    {
        std::cout << "  " << std::left << std::setw(30) << name << std::right
                  << " rows = " << std::setw(10) << mat->rows()
                  << " cols = " << std::setw(10) << mat->cols()
                  << " nnz = " << std::setw(10) << mat->nonZeros();

        if (verbose() > 1)
        {
            std::cout << " norm = " << std::scientific << std::setprecision(6)
                      << ops::norm(*mat) << std::defaultfloat
                      << " bandwidth = " << ops::bandwidth(*mat)
                      << " profile = " << ops::profile(*mat);
        }
        std::cout << std::endl;
    }
}

void discretization::writeMatrices_() const
{
    const fs::path outputPath = controlsRef().outputPath();

    for (const auto& [name, mat] : collectMatrices_())
    {
        const fs::path basename = outputPath / name;

        if (verbose() > 0)
        {
            std::cout << "Writing " << basename.string() << "_*.bin .."
                      << std::endl;
        }

        ops::writeMatrix(*mat, basename.string());
    }

    infoMsg("Operators written to `" + outputPath.string() + "`");
}

void discretization::dumpMatrices_() const
{
    const auto& out = controlsRef().outputRef();

    for (const auto& [name, mat] : collectMatrices_())
    {
        std::cout << std::endl << name << ":" << std::endl;
        ops::dump(*mat,
                  std::min<label>(out.dumpMaxRows_, mat->rows()),
                  std::min<label>(out.dumpMaxCols_, mat->cols()));
    }
}

// clang-format off
void discretization::printHeader(const int argc, const char* argv[]) const
{
    std::cout << "╔══════════════════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║                              voxelFV                                 ║" << std::endl;
    std::cout << "║      Finite-volume operators on structured voxel lattices            ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════════════════╝" << std::endl;
    std::cout << "Revision: " << voxelfv::git_revision << std::endl;
    std::cout << "Command line:";
    for (int i = 0; i < argc; i++) {
        std::cout << " " << argv[i];
    }
    std::cout << '\n';
    std::cout << std::endl;
}

void discretization::printFooter() const
{
    std::cout << "╔══════════════════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║                        Assembly is complete                          ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}

void discretization::printUsage(const char* exe)
{
    std::cout << "Usage: " << exe << " [-i|--input <file.yaml>]" << std::endl;
    std::cout << "  -i, --input   Analysis input file (default: input.yaml)" << std::endl;
}
// clang-format on

} // namespace voxelfv
