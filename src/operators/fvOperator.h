// File       : fvOperator.h
// Created    : Mon Oct 12 2026 10:31:09 (+0200)
// Description: Common base of the finite-volume operators built on a grid
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef FVOPERATOR_H
#define FVOPERATOR_H

// code
#include "grid.h"

namespace voxelfv
{

class fvOperator
{
public:
    fvOperator() = delete;

    fvOperator(const grid& g) : gridPtr_(&g)
    {
    }

    virtual ~fvOperator()
    {
        gridPtr_ = nullptr;
    }

    const grid& gridRef() const
    {
        return *gridPtr_;
    }

    virtual std::string name() const = 0;

protected:
    const grid* gridPtr_; // never owned by this class

    // throws dimensionMismatchError if `v` does not hold `n` entries
    void checkSize_(const denseVector& v,
                    const label n,
                    const std::string& what) const;

    void checkFaceVector_(const denseVector& v) const
    {
        checkSize_(v, gridPtr_->nFaces(), "faces");
    }

    void checkCellVector_(const denseVector& v) const
    {
        checkSize_(v, gridPtr_->nCells(), "cells");
    }
};

} // namespace voxelfv

#endif // FVOPERATOR_H
