// File       : types.h
// Created    : Fri Oct 09 2026 11:02:05 (+0200)
// Description: Fundamental type aliases, enumerations, and constants for the
// discretization kernel
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and
// Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef TYPES_H
#define TYPES_H

// basic c++
#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <numeric> // std::iota
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// External
#include "yaml-cpp/yaml.h"
#include <Eigen/Core>
#include <Eigen/SparseCore>

// code
#include "errors.h"
#include "macros.h"

namespace fs = std::filesystem;

namespace voxelfv
{

typedef double scalar;
typedef int label;
using Vector = std::vector<scalar>;
using labelVector = std::vector<label>;

// the lattice is at most three-dimensional
constexpr label MAX_DIM = 3;

// dense vectors/arrays used for flux and reconstruction data
using denseVector = Eigen::Matrix<scalar, Eigen::Dynamic, 1>;
using denseMatrix =
    Eigen::Matrix<scalar, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// compressed sparse row matrices, assembled from triplets
using sparseMatrix = Eigen::SparseMatrix<scalar, Eigen::RowMajor, label>;
using triplet = Eigen::Triplet<scalar, label>;

constexpr scalar SMALL = std::numeric_limits<scalar>::epsilon();

// Mass operator mode
enum class massMode
{
    cells,
    faces
};

massMode convertMassModeFromString(std::string s);

std::string toString(massMode mode);

// Direction of a face relative to a cell along one axis
enum class faceSide
{
    lower,
    upper
};

} // namespace voxelfv

#endif // TYPES_H
