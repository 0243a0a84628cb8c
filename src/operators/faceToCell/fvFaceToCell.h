// File       : fvFaceToCell.h
// Created    : Tue Oct 13 2026 13:29:56 (+0200)
// Description: Cell-centred flux vectors from normal face fluxes
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef FVFACETOCELL_H
#define FVFACETOCELL_H

// code
#include "fvOperator.h"

namespace voxelfv
{

/**
 * @brief Face-to-cell reconstruction
 *
 * @rst
 * Component ``d`` of the cell vector is half the sum of the fluxes through
 * the (up to two) faces bounding the cell along axis ``d``.  A cell at the
 * boundary of axis ``d`` therefore receives half of its single face value.
 * The result has shape (nCells x dim) with rows in cell id order, i.e. it is
 * the flattened (shape..., dim) field.
 * @endrst
 */
class fvFaceToCell : public fvOperator
{
public:
    static constexpr scalar WEIGHT = 0.5;

    fvFaceToCell(const grid& g);

    std::string name() const override
    {
        return "fvFaceToCell";
    }

    // (nCells x nFaces) averaging matrix of component `direction`
    const sparseMatrix& mat(label direction) const
    {
        assert(0 <= direction && direction < static_cast<label>(mats_.size()));
        return mats_[direction];
    }

    const std::vector<sparseMatrix>& mats() const
    {
        return mats_;
    }

    denseMatrix apply(const denseVector& flux) const;

private:
    std::vector<sparseMatrix> mats_;

    void assemble_();
};

// one-shot convenience wrapper around fvFaceToCell
denseMatrix faceToCell(const grid& g, const denseVector& flux);

} // namespace voxelfv

#endif // FVFACETOCELL_H
