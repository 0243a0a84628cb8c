// File       : fvTangentialFaceReconstruction.h
// Created    : Tue Oct 13 2026 08:52:10 (+0200)
// Description: Face-to-face reconstruction of the tangential flux components
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef FVTANGENTIALFACERECONSTRUCTION_H
#define FVTANGENTIALFACERECONSTRUCTION_H

// code
#include "fvOperator.h"

namespace voxelfv
{

/**
 * @brief Tangential flux components at faces from normal face fluxes
 *
 * @rst
 * Holds ``dim - 1`` matrices of shape (nFaces x nFaces).  Row ``f`` of matrix
 * ``i`` reconstructs the component of the flux along the ``i``-th axis that
 * is not the normal axis of ``f`` (axes in increasing order).  The stencil
 * collects the faces of that axis which bound the two cells of ``f``, each
 * with weight 1/4.  Faces missing at the domain boundary contribute nothing
 * and the weights are not rescaled, hence boundary values are damped.
 * @endrst
 */
class fvTangentialFaceReconstruction : public fvOperator
{
public:
    static constexpr scalar WEIGHT = 0.25;

    fvTangentialFaceReconstruction(const grid& g);

    std::string name() const override
    {
        return "fvTangentialFaceReconstruction";
    }

    const std::vector<sparseMatrix>& mats() const
    {
        return mats_;
    }

    const sparseMatrix& mat(label i) const
    {
        assert(0 <= i && i < static_cast<label>(mats_.size()));
        return mats_[i];
    }

    label nTangentialDirections() const
    {
        return static_cast<label>(mats_.size());
    }

    // i-th axis different from `normal`
    static label tangentialDirection(const label normal, const label i)
    {
        return i < normal ? i : i + 1;
    }

    // inverse of tangentialDirection
    static label tangentialIndex(const label normal, const label direction)
    {
        assert(normal != direction);
        return direction < normal ? direction : direction - 1;
    }

    // one vector of length nFaces per tangential direction
    std::vector<denseVector> apply(const denseVector& flux) const;

    // tangential results stacked into one vector of length
    // (dim - 1) * nFaces
    denseVector applyConcatenated(const denseVector& flux) const;

private:
    std::vector<sparseMatrix> mats_;

    void assemble_();
};

} // namespace voxelfv

#endif // FVTANGENTIALFACERECONSTRUCTION_H
