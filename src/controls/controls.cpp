// File : controls.cpp
// Created    : Fri Oct 09 2026 11:05:35 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "controls.h"

namespace voxelfv
{

// Constructors

controls::controls() : profiler_("voxelFV")
{
}

// Destructor

controls::~controls()
{
}

bool controls::writeMatrices() const
{
    return output_.writeMatrices_;
}

bool controls::dumpMatrices() const
{
    return output_.dumpMatrices_;
}

fs::path controls::outputPath() const
{
    return fs::path(output_.filePath_);
}

} // namespace voxelfv
