// File       : macros.cpp
// Created    : Fri Oct 09 2026 10:18:26 (+0200)
// Description:
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

// code
#include "macros.h"

// std
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace voxelfv
{

void tolower(std::string& s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
}

void errorMsg(std::string msg)
{
    throw std::runtime_error(msg);
}

void warningMsg(std::string msg)
{
    std::cout << "Warning:" << std::endl;
    std::cout << msg << std::endl;
}

void infoMsg(std::string msg)
{
    std::cout << std::endl;
    std::cout << msg << std::endl;
}

} // namespace voxelfv
