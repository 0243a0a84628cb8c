// File : controls.h
// Created    : Fri Oct 09 2026 13:09:25 (+0200)
// Description: Run controls for operator selection, verbosity, and output
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and
// Arts. SPDX-License-Identifier: BSD-3-Clause

#ifndef CONTROLS_H
#define CONTROLS_H

// code
#include "Profiler.h"
#include "types.h"

namespace voxelfv
{

struct operatorsDictionary
{
    struct divergenceDictionary
    {
        bool enabled_{true};
    };

    struct massDictionary
    {
        bool enabled_{true};
        massMode mode_{massMode::cells};
        bool lumping_{true};
    };

    // tangential and full face reconstruction
    struct reconstructionDictionary
    {
        bool enabled_{true};
    };

    struct faceToCellDictionary
    {
        bool enabled_{true};
    };

    divergenceDictionary divergence_;
    massDictionary mass_;
    reconstructionDictionary reconstruction_;
    faceToCellDictionary faceToCell_;
};

struct outputDictionary
{
    std::string filePath_{"output"};
    bool writeMatrices_{false};
    bool dumpMatrices_{false};
    label dumpMaxRows_{0}; // 0: all rows
    label dumpMaxCols_{0}; // 0: all columns
    bool profile_{true};
};

class controls
{
public:
    // Constructors

    controls();

    // Destructor

    ~controls();

    // IO

    void read(YAML::Node inputNode);

    // Access

    const operatorsDictionary& operatorsRef() const
    {
        return operators_;
    };

    const outputDictionary& outputRef() const
    {
        return output_;
    };

    int verbose() const
    {
        return verbose_;
    }

    Profiler& getProfiler()
    {
        return profiler_;
    }

    bool writeMatrices() const;

    bool dumpMatrices() const;

    fs::path outputPath() const;

private:
    int verbose_{0};

    operatorsDictionary operators_;

    outputDictionary output_;

    Profiler profiler_;
};

} // namespace voxelfv

#endif // CONTROLS_H
