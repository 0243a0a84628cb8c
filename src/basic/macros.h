// File : macros.h
// Created    : Fri Oct 09 2026 14:26:04 (+0200)
// Description: Stream helpers and message utilities shared by all components
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences
// and Arts. SPDX-License-Identifier: BSD-3-Clause

#ifndef MACROS_H
#define MACROS_H

// std
#include <iostream>
#include <span>
#include <string>
#include <vector>

namespace voxelfv
{

// print out std::vector
template <class T>
std::ostream& operator<<(std::ostream& os, const std::vector<T>& data)
{
    os << data.size() << std::endl << "(\n";
    for (size_t i = 0; i < data.size(); i++)
    {
        os << data[i] << std::endl;
    }
    os << ")\n";

    return os;
}

// print out std::span
template <class T>
std::ostream& operator<<(std::ostream& os, const std::span<T>& data)
{
    os << data.size() << std::endl << "(\n";
    for (size_t i = 0; i < data.size(); i++)
    {
        os << data[i] << std::endl;
    }
    os << ")\n";

    return os;
}

// print a tuple-like list inline, e.g. (4, 5)
template <class T>
std::string toTupleString(const std::vector<T>& data)
{
    std::string s = "(";
    for (size_t i = 0; i < data.size(); i++)
    {
        s += std::to_string(data[i]);
        if (i + 1 < data.size())
        {
            s += ", ";
        }
    }
    s += ")";

    return s;
}

// IO

void tolower(std::string& s);

void errorMsg(std::string msg);

void warningMsg(std::string msg);

void infoMsg(std::string msg);

} // namespace voxelfv

#endif // MACROS_H
