// File       : fvDivergence.h
// Created    : Mon Oct 12 2026 10:48:33 (+0200)
// Description: Discrete divergence as signed, area-weighted cell-face
// incidence matrix
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef FVDIVERGENCE_H
#define FVDIVERGENCE_H

// code
#include "fvOperator.h"

namespace voxelfv
{

/**
 * @brief Divergence operator of shape (nCells, nFaces)
 *
 * @rst
 * For a face of group ``d`` with lower cell ``L`` and upper cell ``U`` the
 * entries are ``D(L, f) = +A_d`` and ``D(U, f) = -A_d`` with ``A_d`` the face
 * area.  ``D * flux`` is the net outward flux of each cell; no division by
 * the cell volume is applied.
 * @endrst
 */
class fvDivergence : public fvOperator
{
public:
    fvDivergence(const grid& g);

    std::string name() const override
    {
        return "fvDivergence";
    }

    const sparseMatrix& mat() const
    {
        return mat_;
    }

    // net outward flux per cell
    denseVector apply(const denseVector& flux) const;

private:
    sparseMatrix mat_;

    void assemble_();
};

} // namespace voxelfv

#endif // FVDIVERGENCE_H
