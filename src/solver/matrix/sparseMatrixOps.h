// File       : sparseMatrixOps.h
// Created    : Fri Oct 09 2026 08:04:52 (+0200)
// Description: Export, inspection and properties of assembled sparse matrices
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef SPARSEMATRIXOPS_H
#define SPARSEMATRIXOPS_H

// code
#include "types.h"

namespace voxelfv
{

namespace ops
{

enum class matrixNorm
{
    Frobenius,
};

// IO

// Writes the matrix in CSR form to <basename>_rows.bin (int32 row offsets),
// <basename>_cols.bin (int32 column indices) and <basename>_vals.bin (float64
// values)
void writeMatrix(const sparseMatrix& mat, const std::string& basename);

// dense print of the leading block, 0 means all rows/columns
std::ostream& stream(std::ostream& os,
                     const sparseMatrix& mat,
                     label maxRows = 0,
                     label maxCols = 0,
                     const label width = 20,
                     const label precision = 14);

void dump(const sparseMatrix& mat,
          label maxRow = 0,
          label maxCol = 0,
          label width = 8,
          label precision = 14);

// matrix properties

label bandwidth(const sparseMatrix& mat); // matrix maximum lower bandwidth

label profile(const sparseMatrix& mat); // matrix profile/envelope

scalar norm(const sparseMatrix& mat,
            const matrixNorm type = matrixNorm::Frobenius);

} // namespace ops

} // namespace voxelfv

#endif // SPARSEMATRIXOPS_H
