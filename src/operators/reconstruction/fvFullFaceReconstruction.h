// File       : fvFullFaceReconstruction.h
// Created    : Tue Oct 13 2026 10:17:38 (+0200)
// Description: Full flux vector at faces from normal face fluxes
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef FVFULLFACERECONSTRUCTION_H
#define FVFULLFACERECONSTRUCTION_H

// code
#include "fvTangentialFaceReconstruction.h"

namespace voxelfv
{

// Reconstructed flux of shape (nFaces x dim): the normal component of a face
// is passed through, the others come from the tangential reconstruction.
class fvFullFaceReconstruction : public fvOperator
{
public:
    fvFullFaceReconstruction(const grid& g);

    std::string name() const override
    {
        return "fvFullFaceReconstruction";
    }

    const fvTangentialFaceReconstruction& tangentialReconstruction() const
    {
        return tangentialReconstruction_;
    }

    denseMatrix apply(const denseVector& flux) const;

private:
    const fvTangentialFaceReconstruction tangentialReconstruction_;
};

} // namespace voxelfv

#endif // FVFULLFACERECONSTRUCTION_H
