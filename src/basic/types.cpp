// File : types.cpp
// Created    : Fri Oct 09 2026 10:34:07 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "types.h"

namespace voxelfv
{

// Mass operator mode
std::unordered_map<std::string, massMode> massModeMap{
    {"cells", massMode::cells},
    {"cell", massMode::cells},
    {"faces", massMode::faces},
    {"face", massMode::faces}};

massMode convertMassModeFromString(std::string s)
{
    ::voxelfv::tolower(s);
    std::replace(s.begin(), s.end(), '-', '_'); // replace hyphen with
    // underscore
    const auto it = massModeMap.find(s); // check that `s` exists
    if (it == massModeMap.end())
    {
        throw unsupportedModeError("No mass mode found for `" + s + "`");
    }
    return it->second;
}

std::string toString(massMode mode)
{
    switch (mode)
    {
        case massMode::cells:
            return "cells";

        case massMode::faces:
            return "faces";
    }

    throw unsupportedModeError("Unknown mass mode");
}

} // namespace voxelfv
