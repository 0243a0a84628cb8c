// File       : discretization.cpp
// Created    : Fri Oct 09 2026 08:35:54 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "discretization.h"

namespace voxelfv
{

// Constructors

discretization::discretization(const int argc, const char* argv[])
{
    // Argument parsing
    parseArguments_(argc, argv);

    printHeader(argc, argv);

    inputNode_ = YAML::LoadFile(inputFilePath_.string());

    // Create components: read/setup
    create_();
}

discretization::discretization(const YAML::Node& inputNode)
    : inputNode_(inputNode)
{
    create_();
}

// Destructor

discretization::~discretization()
{
    // operators reference the grid: release them first
    faceToCellPtr_.reset();
    reconstructionPtr_.reset();
    massPtr_.reset();
    divergencePtr_.reset();
    gridPtr_.reset();
}

// Methods

void discretization::run()
{
    assemble_();

    report_();

    if (controlsRef().writeMatrices())
    {
        createDirectories_();
        writeMatrices_();
    }

    if (controlsRef().dumpMatrices())
    {
        dumpMatrices_();
    }

    if (controlsRef().outputRef().profile_)
    {
        getProfiler().printReport("\nProfiling report");
    }

    printFooter();
}

void discretization::assemble_()
{
    const auto& operators = controlsRef().operatorsRef();
    const grid& g = gridRef();

    if (operators.divergence_.enabled_)
    {
        if (verbose() > 0)
        {
            std::cout << "Assembling divergence .." << std::endl;
        }

        getProfiler().push("assemble_divergence");
        divergencePtr_ = std::make_unique<fvDivergence>(g);
        getProfiler().pop();
    }

    if (operators.mass_.enabled_)
    {
        if (verbose() > 0)
        {
            std::cout << "Assembling mass ("
                      << toString(operators.mass_.mode_) << ") .."
                      << std::endl;
        }

        getProfiler().push("assemble_mass");
        massPtr_ = std::make_unique<fvMass>(
            g, operators.mass_.mode_, operators.mass_.lumping_);
        getProfiler().pop();
    }

    if (operators.reconstruction_.enabled_)
    {
        if (verbose() > 0)
        {
            std::cout << "Assembling face reconstruction .." << std::endl;
        }

        getProfiler().push("assemble_face_reconstruction");
        reconstructionPtr_ = std::make_unique<fvFullFaceReconstruction>(g);
        getProfiler().pop();
    }

    if (operators.faceToCell_.enabled_)
    {
        if (verbose() > 0)
        {
            std::cout << "Assembling face to cell .." << std::endl;
        }

        getProfiler().push("assemble_face_to_cell");
        faceToCellPtr_ = std::make_unique<fvFaceToCell>(g);
        getProfiler().pop();
    }
}

std::vector<std::pair<std::string, const sparseMatrix*>>
discretization::collectMatrices_() const
{
    std::vector<std::pair<std::string, const sparseMatrix*>> matrices;

    if (hasDivergence())
    {
        matrices.emplace_back("divergence", &divergencePtr_->mat());
    }

    if (hasMass())
    {
        matrices.emplace_back("mass_" + toString(massPtr_->mode()),
                              &massPtr_->mat());
    }

    if (hasReconstruction())
    {
        const auto& tangential = reconstructionPtr_->tangentialReconstruction();
        for (label i = 0; i < tangential.nTangentialDirections(); i++)
        {
            matrices.emplace_back("tangential_reconstruction_" +
                                      std::to_string(i),
                                  &tangential.mat(i));
        }
    }

    if (hasFaceToCell())
    {
        for (label d = 0; d < gridRef().dim(); d++)
        {
            matrices.emplace_back("face_to_cell_" + std::to_string(d),
                                  &faceToCellPtr_->mat(d));
        }
    }

    return matrices;
}

// Access

const fvDivergence& discretization::divergenceRef() const
{
    if (!hasDivergence())
    {
        errorMsg("divergence operator is not assembled");
    }
    return *divergencePtr_;
}

const fvMass& discretization::massRef() const
{
    if (!hasMass())
    {
        errorMsg("mass operator is not assembled");
    }
    return *massPtr_;
}

const fvFullFaceReconstruction& discretization::reconstructionRef() const
{
    if (!hasReconstruction())
    {
        errorMsg("face reconstruction is not assembled");
    }
    return *reconstructionPtr_;
}

const fvFaceToCell& discretization::faceToCellRef() const
{
    if (!hasFaceToCell())
    {
        errorMsg("face to cell operator is not assembled");
    }
    return *faceToCellPtr_;
}

} // namespace voxelfv
