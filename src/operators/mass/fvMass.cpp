// File       : fvMass.cpp
// Created    : Mon Oct 12 2026 11:06:45 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "fvMass.h"

namespace voxelfv
{

fvMass::fvMass(const grid& g, const massMode mode, const bool lumping)
    : fvOperator(g), mode_(mode), lumping_(lumping)
{
    switch (mode_)
    {
        case massMode::cells:
            {
                // diagonal regardless of lumping
                assembleDiagonal_(g.nCells(), g.cellVolume());
            }
            return;

        case massMode::faces:
            {
                if (!lumping_)
                {
                    throw unsupportedModeError(
                        "fvMass: face mode is only available with lumping");
                }

                // every face carries the full voxel volume
                assembleDiagonal_(g.nFaces(), g.cellVolume());
            }
            return;
    }

    throw unsupportedModeError("fvMass: unknown mass mode");
}

denseVector fvMass::apply(const denseVector& v) const
{
    switch (mode_)
    {
        case massMode::cells:
            checkCellVector_(v);
            break;

        case massMode::faces:
            checkFaceVector_(v);
            break;
    }

    return mat_ * v;
}

void fvMass::assembleDiagonal_(const label n, const scalar value)
{
    std::vector<triplet> triplets;
    triplets.reserve(n);

    for (label i = 0; i < n; i++)
    {
        triplets.emplace_back(i, i, value);
    }

    mat_.resize(n, n);
    mat_.setFromTriplets(triplets.begin(), triplets.end());
    mat_.makeCompressed();
}

} // namespace voxelfv
