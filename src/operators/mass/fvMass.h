// File       : fvMass.h
// Created    : Mon Oct 12 2026 11:06:45 (+0200)
// Description: Diagonal cell and lumped face mass matrices
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef FVMASS_H
#define FVMASS_H

// code
#include "fvOperator.h"

namespace voxelfv
{

/**
 * @brief Diagonal mass matrix
 *
 * @rst
 * ``massMode::cells``: (nCells x nCells) with the cell volume on the
 * diagonal.  ``massMode::faces`` with lumping: (nFaces x nFaces) with the
 * full cell volume on the diagonal for every face, independent of its
 * orientation.  Face mode without lumping is not available.
 * @endrst
 */
class fvMass : public fvOperator
{
public:
    fvMass(const grid& g,
           const massMode mode = massMode::cells,
           const bool lumping = true);

    std::string name() const override
    {
        return "fvMass";
    }

    massMode mode() const
    {
        return mode_;
    }

    bool lumping() const
    {
        return lumping_;
    }

    const sparseMatrix& mat() const
    {
        return mat_;
    }

    // number of degrees of freedom, i.e. cells or faces depending on mode
    label size() const
    {
        return static_cast<label>(mat_.rows());
    }

    denseVector apply(const denseVector& v) const;

private:
    const massMode mode_;

    const bool lumping_;

    sparseMatrix mat_;

    void assembleDiagonal_(const label n, const scalar value);
};

} // namespace voxelfv

#endif // FVMASS_H
