// File       : fvFaceToCell.cpp
// Created    : Tue Oct 13 2026 13:29:56 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "fvFaceToCell.h"

namespace voxelfv
{

fvFaceToCell::fvFaceToCell(const grid& g) : fvOperator(g)
{
    assemble_();
}

denseMatrix fvFaceToCell::apply(const denseVector& flux) const
{
    checkFaceVector_(flux);

    const grid& g = gridRef();

    denseMatrix cellFlux(g.nCells(), g.dim());
    for (label d = 0; d < g.dim(); d++)
    {
        cellFlux.col(d) = mats_[d] * flux;
    }
    return cellFlux;
}

void fvFaceToCell::assemble_()
{
    const grid& g = gridRef();

    mats_.resize(g.dim());
    for (label d = 0; d < g.dim(); d++)
    {
        std::vector<triplet> triplets;
        triplets.reserve(2 * g.nFaces(d));

        // each face contributes to both of its cells
        const label first = g.faceOffset(d);
        const label last = first + g.nFaces(d);
        for (label iFace = first; iFace < last; iFace++)
        {
            for (const label iCell : g.faceCells(iFace))
            {
                triplets.emplace_back(iCell, iFace, WEIGHT);
            }
        }

        mats_[d].resize(g.nCells(), g.nFaces());
        mats_[d].setFromTriplets(triplets.begin(), triplets.end());
        mats_[d].makeCompressed();
    }
}

denseMatrix faceToCell(const grid& g, const denseVector& flux)
{
    return fvFaceToCell(g).apply(flux);
}

} // namespace voxelfv
