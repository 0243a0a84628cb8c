// File       : grid.h
// Created    : Mon Oct 12 2026 09:40:17 (+0200)
// Description: Index and geometry model of a uniform structured voxel lattice
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef GRID_H
#define GRID_H

// code
#include "types.h"

namespace voxelfv
{

/**
 * @brief Structured lattice of 2 or 3 dimensions
 *
 * @rst
 * Cells are flattened with axis 0 varying fastest.  Only interior faces,
 * i.e. faces shared by two cells, are represented.  Faces normal to axis
 * ``d`` form group ``d``; a face in group ``d`` is addressed by the cell
 * coordinates with coordinate ``d`` replaced by the gap ``g`` between the
 * cells ``g`` and ``g+1``.  Groups are concatenated in axis order.
 * @endrst
 */
class grid
{
public:
    static constexpr label NO_FACE = -1;

    // Constructors

    grid() = delete;

    grid(const labelVector& shape, const Vector& voxelSize);

    // Access

    label dim() const
    {
        return dim_;
    }

    const labelVector& shape() const
    {
        return shape_;
    }

    label shape(label direction) const
    {
        assert(0 <= direction && direction < dim_);
        return shape_[direction];
    }

    const Vector& voxelSize() const
    {
        return voxelSize_;
    }

    label nCells() const
    {
        return nCells_;
    }

    label nFaces() const
    {
        return nFaces_;
    }

    // number of interior faces normal to `direction`
    label nFaces(label direction) const
    {
        assert(0 <= direction && direction < dim_);
        return faceCount_[direction];
    }

    // global id of the first face normal to `direction`
    label faceOffset(label direction) const
    {
        assert(0 <= direction && direction < dim_);
        return faceOffset_[direction];
    }

    scalar cellVolume() const
    {
        return cellVolume_;
    }

    // cross-sectional area (a length in 2D) of a face normal to `direction`
    scalar faceArea(label direction) const
    {
        assert(0 <= direction && direction < dim_);
        return faceArea_[direction];
    }

    label cellStride(label direction) const
    {
        assert(0 <= direction && direction < dim_);
        return cellStride_[direction];
    }

    // Index algebra

    label cellID(std::span<const label> coords) const;

    labelVector cellCoordinates(label cellID) const;

    label faceID(label direction, std::span<const label> coords) const;

    labelVector faceCoordinates(label faceID) const;

    label faceDirection(label faceID) const;

    // lower and upper cell sharing the face
    std::array<label, 2> faceCells(label faceID) const;

    // face bounding the cell on the given side along `direction`, NO_FACE if
    // the cell touches the domain boundary there
    label cellFace(label cellID, label direction, faceSide side) const;

    // interior faces bounding the cell along `direction`, in increasing order
    labelVector facesOf(label cellID, label direction) const;

    // Checks

    bool validCell(label cellID) const
    {
        return 0 <= cellID && cellID < nCells_;
    }

    bool validFace(label faceID) const
    {
        return 0 <= faceID && faceID < nFaces_;
    }

    // IO

    static grid read(const YAML::Node& gridNode);

    void printSummary(std::ostream& os = std::cout) const;

private:
    label dim_;

    labelVector shape_;

    Vector voxelSize_;

    label nCells_{0};

    label nFaces_{0};

    scalar cellVolume_{0};

    std::array<scalar, MAX_DIM> faceArea_{0};

    std::array<label, MAX_DIM> faceCount_{0};

    std::array<label, MAX_DIM> faceOffset_{0};

    std::array<label, MAX_DIM> cellStride_{0};

    // faceStride_[d][k]: stride of coordinate k inside face group d
    std::array<std::array<label, MAX_DIM>, MAX_DIM> faceStride_{};

    void validate_() const;

    void setup_();
};

} // namespace voxelfv

#endif // GRID_H
