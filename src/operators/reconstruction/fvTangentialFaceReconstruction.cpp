// File       : fvTangentialFaceReconstruction.cpp
// Created    : Tue Oct 13 2026 08:52:10 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "fvTangentialFaceReconstruction.h"

namespace voxelfv
{

fvTangentialFaceReconstruction::fvTangentialFaceReconstruction(const grid& g)
    : fvOperator(g)
{
    assemble_();
}

std::vector<denseVector>
fvTangentialFaceReconstruction::apply(const denseVector& flux) const
{
    checkFaceVector_(flux);

    std::vector<denseVector> tangentialFlux;
    tangentialFlux.reserve(mats_.size());
    for (const auto& mat : mats_)
    {
        tangentialFlux.emplace_back(mat * flux);
    }
    return tangentialFlux;
}

denseVector
fvTangentialFaceReconstruction::applyConcatenated(const denseVector& flux) const
{
    const label nFaces = gridRef().nFaces();
    const std::vector<denseVector> tangentialFlux = apply(flux);

    const label nTangential = static_cast<label>(tangentialFlux.size());

    denseVector stacked(nFaces * nTangential);
    for (label i = 0; i < nTangential; i++)
    {
        stacked.segment(i * nFaces, nFaces) = tangentialFlux[i];
    }
    return stacked;
}

void fvTangentialFaceReconstruction::assemble_()
{
    const grid& g = gridRef();
    const label nTangential = g.dim() - 1;

    // every face collects at most 4 neighbours per tangential direction
    std::vector<std::vector<triplet>> triplets(nTangential);
    for (auto& t : triplets)
    {
        t.reserve(4 * g.nFaces());
    }

    for (label d = 0; d < g.dim(); d++)
    {
        const label first = g.faceOffset(d);
        const label last = first + g.nFaces(d);

        for (label iFace = first; iFace < last; iFace++)
        {
            const std::array<label, 2> cells = g.faceCells(iFace);

            for (label i = 0; i < nTangential; i++)
            {
                const label e = tangentialDirection(d, i);

                for (const label iCell : cells)
                {
                    for (const label jFace : g.facesOf(iCell, e))
                    {
                        triplets[i].emplace_back(iFace, jFace, WEIGHT);
                    }
                }
            }
        }
    }

    mats_.resize(nTangential);
    for (label i = 0; i < nTangential; i++)
    {
        mats_[i].resize(g.nFaces(), g.nFaces());
        mats_[i].setFromTriplets(triplets[i].begin(), triplets[i].end());
        mats_[i].makeCompressed();
    }
}

} // namespace voxelfv
