// File       : grid.cpp
// Created    : Mon Oct 12 2026 09:40:17 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "grid.h"

namespace voxelfv
{

// Constructors

grid::grid(const labelVector& shape, const Vector& voxelSize)
    : dim_(static_cast<label>(shape.size())), shape_(shape),
      voxelSize_(voxelSize)
{
    validate_();
    setup_();
}

// Index algebra

label grid::cellID(std::span<const label> coords) const
{
    assert(static_cast<label>(coords.size()) == dim_);

    label id = 0;
    for (label k = 0; k < dim_; k++)
    {
        assert(0 <= coords[k] && coords[k] < shape_[k]);
        id += coords[k] * cellStride_[k];
    }
    return id;
}

labelVector grid::cellCoordinates(label cellID) const
{
    assert(validCell(cellID));

    labelVector coords(dim_);
    for (label k = 0; k < dim_; k++)
    {
        coords[k] = cellID % shape_[k];
        cellID /= shape_[k];
    }
    return coords;
}

label grid::faceID(label direction, std::span<const label> coords) const
{
    assert(0 <= direction && direction < dim_);
    assert(static_cast<label>(coords.size()) == dim_);

    const auto& stride = faceStride_[direction];

    label id = faceOffset_[direction];
    for (label k = 0; k < dim_; k++)
    {
        assert(0 <= coords[k]);
        assert(coords[k] < (k == direction ? shape_[k] - 1 : shape_[k]));
        id += coords[k] * stride[k];
    }
    return id;
}

labelVector grid::faceCoordinates(label faceID) const
{
    const label direction = faceDirection(faceID);

    label localID = faceID - faceOffset_[direction];

    labelVector coords(dim_);
    for (label k = 0; k < dim_; k++)
    {
        const label extent = (k == direction) ? shape_[k] - 1 : shape_[k];
        coords[k] = localID % extent;
        localID /= extent;
    }
    return coords;
}

label grid::faceDirection(label faceID) const
{
    assert(validFace(faceID));

    label direction = 0;
    while (faceID >= faceOffset_[direction] + faceCount_[direction])
    {
        direction++;
    }
    return direction;
}

std::array<label, 2> grid::faceCells(label faceID) const
{
    const label direction = faceDirection(faceID);

    // the gap coordinate g of a face coincides with the lower cell coordinate
    const labelVector coords = faceCoordinates(faceID);
    const label lower = cellID(coords);

    return {lower, lower + cellStride_[direction]};
}

label grid::cellFace(label cellID, label direction, faceSide side) const
{
    assert(0 <= direction && direction < dim_);

    labelVector coords = cellCoordinates(cellID);
    const label c = coords[direction];

    switch (side)
    {
        case faceSide::lower:
            {
                if (c == 0)
                {
                    return NO_FACE;
                }
                coords[direction] = c - 1;
            }
            break;

        case faceSide::upper:
            {
                if (c == shape_[direction] - 1)
                {
                    return NO_FACE;
                }
                coords[direction] = c;
            }
            break;
    }

    return faceID(direction, coords);
}

labelVector grid::facesOf(label cellID, label direction) const
{
    labelVector faces;
    faces.reserve(2);

    for (const faceSide side : {faceSide::lower, faceSide::upper})
    {
        const label face = cellFace(cellID, direction, side);
        if (face != NO_FACE)
        {
            faces.push_back(face);
        }
    }
    return faces;
}

// Private

void grid::validate_() const
{
    if (dim_ != 2 && dim_ != 3)
    {
        throw invalidGridError("Grid dimension must be 2 or 3, got " +
                               std::to_string(dim_));
    }

    if (voxelSize_.size() != shape_.size())
    {
        throw invalidGridError(
            "Grid shape and voxel size must have the same length: shape has " +
            std::to_string(shape_.size()) + " entries, voxel size has " +
            std::to_string(voxelSize_.size()));
    }

    for (label k = 0; k < dim_; k++)
    {
        if (shape_[k] <= 0)
        {
            throw invalidGridError("Non-positive number of cells along axis " +
                                   std::to_string(k));
        }

        if (!(voxelSize_[k] > 0))
        {
            throw invalidGridError("Non-positive voxel size along axis " +
                                   std::to_string(k));
        }
    }
}

void grid::setup_()
{
    // counts are accumulated in 64 bit and must fit a label, including the
    // 4 * nFaces entries of a tangential reconstruction matrix
    constexpr std::int64_t maxLabel = std::numeric_limits<label>::max();

    // cells
    std::int64_t nCells = 1;
    cellVolume_ = 1.0;
    for (label k = 0; k < dim_; k++)
    {
        cellStride_[k] = static_cast<label>(nCells);
        nCells *= shape_[k];
        cellVolume_ *= voxelSize_[k];

        if (nCells > maxLabel)
        {
            throw invalidGridError("Grid " + toTupleString(shape_) +
                                   " has more cells than can be indexed (" +
                                   std::to_string(maxLabel) + ")");
        }
    }
    nCells_ = static_cast<label>(nCells);

    // faces, group by group
    std::int64_t nFaces = 0;
    for (label d = 0; d < dim_; d++)
    {
        std::int64_t count = 1;
        faceArea_[d] = 1.0;
        for (label k = 0; k < dim_; k++)
        {
            faceStride_[d][k] = static_cast<label>(count);
            count *= (k == d) ? shape_[k] - 1 : shape_[k];

            if (k != d)
            {
                faceArea_[d] *= voxelSize_[k];
            }
        }

        faceCount_[d] = static_cast<label>(count);
        faceOffset_[d] = static_cast<label>(nFaces);
        nFaces += count;

        if (4 * nFaces > maxLabel)
        {
            throw invalidGridError("Grid " + toTupleString(shape_) +
                                   " has too many faces to assemble the "
                                   "face operators (at most " +
                                   std::to_string(maxLabel / 4) + ")");
        }
    }
    nFaces_ = static_cast<label>(nFaces);
}

} // namespace voxelfv
