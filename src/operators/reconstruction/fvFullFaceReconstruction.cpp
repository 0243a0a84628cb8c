// File       : fvFullFaceReconstruction.cpp
// Created    : Tue Oct 13 2026 10:17:38 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "fvFullFaceReconstruction.h"

namespace voxelfv
{

fvFullFaceReconstruction::fvFullFaceReconstruction(const grid& g)
    : fvOperator(g), tangentialReconstruction_(g)
{
}

denseMatrix fvFullFaceReconstruction::apply(const denseVector& flux) const
{
    checkFaceVector_(flux);

    const grid& g = gridRef();
    const std::vector<denseVector> tangentialFlux =
        tangentialReconstruction_.apply(flux);

    denseMatrix fullFlux(g.nFaces(), g.dim());

    for (label d = 0; d < g.dim(); d++)
    {
        const label first = g.faceOffset(d);
        const label last = first + g.nFaces(d);

        for (label iFace = first; iFace < last; iFace++)
        {
            for (label k = 0; k < g.dim(); k++)
            {
                fullFlux(iFace, k) =
                    (k == d)
                        ? flux[iFace]
                        : tangentialFlux[fvTangentialFaceReconstruction::
                                             tangentialIndex(d, k)][iFace];
            }
        }
    }

    return fullFlux;
}

} // namespace voxelfv
