// File       : sparseMatrixOps.cpp
// Created    : Fri Oct 09 2026 09:14:40 (+0200)
// Description: Sparse matrix export and property implementation details
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "sparseMatrixOps.h"

// std
#include <fstream>

namespace voxelfv
{

namespace ops
{

namespace
{

template <typename T>
void dumpBinary_(const std::string& fname, const T* values, const size_t n)
{
    std::ofstream out(fname, std::ios::binary);
    if (!out)
    {
        errorMsg("Cannot open `" + fname + "` for writing");
    }
    out.write(reinterpret_cast<const char*>(values), n * sizeof(T));
    if (!out)
    {
        errorMsg("Failed writing `" + fname + "`");
    }
}

} // namespace

void writeMatrix(const sparseMatrix& mat, const std::string& basename)
{
    assert(mat.isCompressed());

    static_assert(sizeof(label) == sizeof(int32_t));

    const label nRows = static_cast<label>(mat.outerSize());
    const label nnz = static_cast<label>(mat.nonZeros());

    dumpBinary_(basename + "_rows.bin", mat.outerIndexPtr(), nRows + 1);
    dumpBinary_(basename + "_cols.bin", mat.innerIndexPtr(), nnz);
    dumpBinary_(basename + "_vals.bin", mat.valuePtr(), nnz);
}

std::ostream& stream(std::ostream& os,
                     const sparseMatrix& mat,
                     label maxRows,
                     label maxCols,
                     const label width,
                     const label precision)
{
    std::ios og_fmt(nullptr);
    og_fmt.copyfmt(os);
    os << std::scientific << std::setprecision(precision);

    maxRows = (maxRows == 0) ? static_cast<label>(mat.rows()) : maxRows;
    maxCols = (maxCols == 0) ? static_cast<label>(mat.cols()) : maxCols;

    os << "  " << std::setw(width) << " ";
    for (label j = 0; j < maxCols; j++)
    {
        os << std::setw(width) << j << " ";
    }
    os << "\n\n";
    for (label i = 0; i < maxRows; i++)
    {
        os << std::setw(width) << i << "  ";
        for (label j = 0; j < maxCols; j++)
        {
            os << std::setw(width) << mat.coeff(i, j) << " ";
        }
        os << '\n';
    }

    os.copyfmt(og_fmt);
    return os;
}

void dump(const sparseMatrix& mat,
          label maxRow,
          label maxCol,
          label width,
          label precision)
{
    stream(std::cout, mat, maxRow, maxCol, width, precision);
}

label bandwidth(const sparseMatrix& mat)
{
    label beta_max = 0;
    for (label i = 0; i < mat.outerSize(); i++)
    {
        // column indices of a compressed row are sorted, the search keeps
        // this independent of that property
        label j_min = std::numeric_limits<label>::max();
        for (sparseMatrix::InnerIterator it(mat, i); it; ++it)
        {
            j_min = it.col() < j_min ? it.col() : j_min;
        }
        const label beta = i - j_min;
        beta_max = beta > beta_max ? beta : beta_max;
    }
    return beta_max;
}

label profile(const sparseMatrix& mat)
{
    label envelope = 0;
    for (label i = 0; i < mat.outerSize(); i++)
    {
        label j_min = i;
        for (sparseMatrix::InnerIterator it(mat, i); it; ++it)
        {
            j_min = it.col() < j_min ? it.col() : j_min;
        }
        envelope += i - j_min;
    }
    return envelope;
}

scalar norm(const sparseMatrix& mat, const matrixNorm type)
{
    switch (type)
    {
        case matrixNorm::Frobenius:
            return mat.norm();
    }

    errorMsg("Requested matrix norm is not implemented");
    return 0;
}

} // namespace ops

} // namespace voxelfv
