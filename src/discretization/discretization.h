// File       : discretization.h
// Created    : Fri Oct 09 2026 08:58:32 (+0200)
// Description: Driver that reads an input file, builds the grid and assembles
// the finite-volume operators
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef DISCRETIZATION_H
#define DISCRETIZATION_H

// code
#include "controls.h"
#include "fvDivergence.h"
#include "fvFaceToCell.h"
#include "fvFullFaceReconstruction.h"
#include "fvMass.h"
#include "grid.h"
#include "types.h"

namespace voxelfv
{

class discretization
{
private:
    // Primary members

    // operator selection, verbosity, output settings
    std::unique_ptr<controls> controlsPtr_ = nullptr;

    // the lattice; operators keep a reference to it, hence heap allocated
    std::unique_ptr<grid> gridPtr_ = nullptr;

    std::unique_ptr<fvDivergence> divergencePtr_ = nullptr;

    std::unique_ptr<fvMass> massPtr_ = nullptr;

    std::unique_ptr<fvFullFaceReconstruction> reconstructionPtr_ = nullptr;

    std::unique_ptr<fvFaceToCell> faceToCellPtr_ = nullptr;

    // path to input file: file contains all information of the run
    fs::path inputFilePath_;

    YAML::Node inputNode_;

    // Private methods

    void parseArguments_(const int argc, const char* argv[]);

    // read settings and grid
    void create_();

    void createControls_();

    void createGrid_();

    void createDirectories_();

    // assemble all enabled operators
    void assemble_();

    void report_() const;

    void writeMatrices_() const;

    void dumpMatrices_() const;

    // matrices by export name
    std::vector<std::pair<std::string, const sparseMatrix*>>
    collectMatrices_() const;

public:
    // Constructors

    discretization(const int argc, const char* argv[]);

    // input already parsed, e.g. from a string
    explicit discretization(const YAML::Node& inputNode);

    // Destructor

    ~discretization();

    // Operations

    void run();

    void printHeader(const int argc, const char* argv[]) const;

    void printFooter() const;

    static void printUsage(const char* exe);

    // Access

    const controls& controlsRef() const
    {
        return *controlsPtr_;
    }

    Profiler& getProfiler()
    {
        return controlsPtr_->getProfiler();
    }

    const grid& gridRef() const
    {
        return *gridPtr_;
    }

    bool hasDivergence() const
    {
        return divergencePtr_ != nullptr;
    }

    const fvDivergence& divergenceRef() const;

    bool hasMass() const
    {
        return massPtr_ != nullptr;
    }

    const fvMass& massRef() const;

    bool hasReconstruction() const
    {
        return reconstructionPtr_ != nullptr;
    }

    const fvFullFaceReconstruction& reconstructionRef() const;

    bool hasFaceToCell() const
    {
        return faceToCellPtr_ != nullptr;
    }

    const fvFaceToCell& faceToCellRef() const;

    int verbose() const
    {
        return controlsPtr_->verbose();
    }
};

} // namespace voxelfv

#endif // DISCRETIZATION_H
