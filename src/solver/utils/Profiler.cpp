// File       : Profiler.cpp
// Created    : Fri Oct 09 2026 08:36:37 (+0200)
// Description: Profiling agent implementation
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#include "Profiler.h"
#include <cassert>
#include <cstdio>

namespace voxelfv
{

Profiler::Profiler(const std::string& name) : name_(name)
{
}

std::vector<Profiler::AgentSummary>
Profiler::getAgentSummaries(const double thresh_time) const
{
    std::vector<AgentSummary> summary;
    summary.reserve(agents_.size());
    for (const auto& it : agents_)
    {
        const Agent& agent = *it.second;
        assert(!agent.isActive());
        if (agent.getTotalActiveTime() >= thresh_time)
        {
            summary.push_back(AgentSummary(
                it.first, agent.getSampleCount(), agent.getTotalActiveTime()));
        }
    }
    return summary;
}

void Profiler::printReport(const std::string title,
                           const double thresh_time) const
{
    const std::vector<AgentSummary> summary = getAgentSummaries(thresh_time);
    double total_time = 0;
    for (auto& section : summary)
    {
        total_time += section.time;
    }

    if (summary.size() > 0)
    {
        printf("%s", title.c_str());
        printf(" [%-48s]:   perc  avg_time/sample[s]  total_time[s]\n",
               "Name of profiled section");
    }
    for (auto& section : summary)
    {
        printf(" [%-48s]: %5.1f%%           %.3e      %.3e  (%lu samples)\n",
               section.name.c_str(),
               100.0 * section.time / total_time,
               section.getSampleAverageTime(),
               section.time,
               section.samples);
    }
    if (summary.size() > 0)
    {
        printf("\n");
    }
}

} // namespace voxelfv
