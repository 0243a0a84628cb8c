// File       : main.cpp
// Created    : Fri Oct 09 2026 12:35:52 (+0200)
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#include <exception>
#include <iostream>

// code libraries
#include "discretization.h"
#include "macros.h"

int main(int argc, char* argv[])
{
    using Disc = ::voxelfv::discretization;

    try
    {
        // create and run the assembly
        Disc disc(argc, const_cast<const char**>(argv));
        disc.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
