// File       : errors.h
// Created    : Mon Oct 12 2026 09:14:02 (+0200)
// Description: Exception types raised by grid and operator construction
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

namespace voxelfv
{

// malformed shape, voxel size or dimension
class invalidGridError : public std::runtime_error
{
public:
    explicit invalidGridError(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

// mass operator mode/lumping combination that is not implemented
class unsupportedModeError : public std::runtime_error
{
public:
    explicit unsupportedModeError(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

// input array length does not match the number of cells or faces
class dimensionMismatchError : public std::runtime_error
{
public:
    explicit dimensionMismatchError(const std::string& msg)
        : std::runtime_error(msg)
    {
    }
};

} // namespace voxelfv

#endif // ERRORS_H
