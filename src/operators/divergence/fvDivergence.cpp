// File       : fvDivergence.cpp
// Created    : Mon Oct 12 2026 10:48:33 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "fvDivergence.h"

namespace voxelfv
{

fvDivergence::fvDivergence(const grid& g) : fvOperator(g)
{
    assemble_();
}

denseVector fvDivergence::apply(const denseVector& flux) const
{
    checkFaceVector_(flux);
    return mat_ * flux;
}

void fvDivergence::assemble_()
{
    const grid& g = gridRef();

    std::vector<triplet> triplets;
    triplets.reserve(2 * g.nFaces());

    for (label d = 0; d < g.dim(); d++)
    {
        const scalar area = g.faceArea(d);
        const label first = g.faceOffset(d);
        const label last = first + g.nFaces(d);

        for (label iFace = first; iFace < last; iFace++)
        {
            const auto [lower, upper] = g.faceCells(iFace);
            triplets.emplace_back(lower, iFace, area);
            triplets.emplace_back(upper, iFace, -area);
        }
    }

    mat_.resize(g.nCells(), g.nFaces());
    mat_.setFromTriplets(triplets.begin(), triplets.end());
    mat_.makeCompressed();
}

} // namespace voxelfv
