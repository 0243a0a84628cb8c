// File       : gridIO.cpp
// Created    : Mon Oct 12 2026 10:02:51 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "grid.h"

namespace voxelfv
{

// IO

grid grid::read(const YAML::Node& gridNode)
{
    if (!gridNode["shape"])
    {
        throw invalidGridError("grid block requires a `shape` entry");
    }

    if (!gridNode["voxel_size"])
    {
        throw invalidGridError("grid block requires a `voxel_size` entry");
    }

    const labelVector shape = gridNode["shape"].template as<labelVector>();

    // a scalar voxel size applies to every axis
    Vector voxelSize;
    if (gridNode["voxel_size"].IsScalar())
    {
        voxelSize.assign(shape.size(),
                         gridNode["voxel_size"].template as<scalar>());
    }
    else
    {
        voxelSize = gridNode["voxel_size"].template as<Vector>();
    }

    return grid(shape, voxelSize);
}

void grid::printSummary(std::ostream& os) const
{
    os << "Grid summary:" << std::endl;
    os << "  dimension        : " << dim_ << std::endl;
    os << "  shape            : " << toTupleString(shape_) << std::endl;
    os << "  voxel size       : (";
    for (label k = 0; k < dim_; k++)
    {
        os << voxelSize_[k] << (k + 1 < dim_ ? ", " : ")");
    }
    os << std::endl;
    os << "  number of cells  : " << nCells_ << std::endl;
    os << "  number of faces  : " << nFaces_ << std::endl;
    for (label d = 0; d < dim_; d++)
    {
        os << "    normal to axis " << d << ": " << faceCount_[d]
           << " (offset " << faceOffset_[d] << ", area " << faceArea_[d]
           << ")" << std::endl;
    }
    os << "  cell volume      : " << cellVolume_ << std::endl;
}

} // namespace voxelfv
