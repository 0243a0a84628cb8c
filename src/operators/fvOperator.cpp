// File       : fvOperator.cpp
// Created    : Mon Oct 12 2026 10:31:09 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "fvOperator.h"

namespace voxelfv
{

void fvOperator::checkSize_(const denseVector& v,
                            const label n,
                            const std::string& what) const
{
    if (v.size() != n)
    {
        throw dimensionMismatchError(
            name() + ": input has " + std::to_string(v.size()) +
            " entries but the grid has " + std::to_string(n) + " " + what);
    }
}

} // namespace voxelfv
