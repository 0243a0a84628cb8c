// File       : Profiler.h
// Created    : Fri Oct 09 2026 16:06:23 (+0200)
// Description: Profiling agent
// Copyright (c) 2026 CCFNUM, Lucerne University of Applied Sciences and Arts.
// SPDX-License-Identifier: BSD-3-Clause

#ifndef PROFILER_H
#define PROFILER_H

#include <cassert>
#include <chrono>
#include <map>
#include <memory>
#include <stack>
#include <string>
#include <vector>

namespace voxelfv
{

/**
 * @brief Runtime profiler
 *
 * @rst
 * Used to collect runtime samples for a code section that is enclosed
 * by the ``push()`` and ``pop()`` methods.  Used for profiling.
 * @endrst
 * */
class Profiler
{
public:
    class Timer
    {
        using Clock = std::chrono::steady_clock;

    public:
        /** @brief Default constructor
         *
         * Starts the timer */
        Timer() : start_(Clock::now())
        {
        }

        /**
         * @brief Restart the timer
         */
        void start()
        {
            start_ = Clock::now();
        }

        /**
         * @brief Get the currently elapsed seconds
         * @return Elapsed seconds since construction or start
         */
        double stop() const
        {
            return std::chrono::duration<double>(Clock::now() - start_).count();
        }

    private:
        Clock::time_point start_;
    };

    class Agent
    {
    public:
        Agent() : n_samples_(0), total_time_(0), active_(false)
        {
        }

        void start()
        {
            assert(!active_);
            timer_.start();
            active_ = true;
        }

        void stop()
        {
            assert(active_);
            total_time_ += timer_.stop();
            ++n_samples_;
            active_ = false;
        }

        unsigned long int getSampleCount() const
        {
            return n_samples_;
        }

        double getTotalActiveTime() const
        {
            return total_time_;
        }

        bool isActive() const
        {
            return active_;
        }

    private:
        unsigned long int n_samples_; // number of samples the agent collected
        double total_time_;           // total time the agent was active
        bool active_;                 // agent is active
        Timer timer_;                 // steady clock
    };

    struct AgentSummary
    {
        std::string name;          // name of agent
        unsigned long int samples; // sample count
        double time;               // total time active

        AgentSummary(const std::string& n,
                     const unsigned long int s,
                     const double t)
            : name(n), samples(s), time(t)
        {
        }

        double getSampleAverageTime() const
        {
            return time / samples;
        }
    };

    /**
     * @brief Main constructor
     *
     * @param name Name of the profiler
     */
    Profiler(const std::string& name = "Default");

    virtual ~Profiler() = default;

    Profiler(const Profiler& c) = delete;
    Profiler& operator=(const Profiler& c) = delete;

    /**
     * @brief Activate a profiling agent
     *
     * @param name Name of the agent
     *
     * If another agent is already active the agent is stopped and resumed once
     * this active agent stops.
     */
    void push(const std::string& name)
    {
        if (stopped_agents_.size() > 0)
        {
            getAgent(stopped_agents_.top()).stop();
        }
        stopped_agents_.push(name);
        getAgent(name).start();
    }

    /** @brief Deactivate the currently active profiling agent */
    void pop()
    {
        getAgent(stopped_agents_.top()).stop();
        stopped_agents_.pop();
        if (stopped_agents_.size() > 0)
        {
            getAgent(stopped_agents_.top()).start();
        }
    }

    /**
     * @brief Get profiling agent by name
     *
     * @param name Name of the agent
     *
     * @return Reference to agent (creates new agent if it does not exist)
     */
    Agent& getAgent(const std::string& name)
    {
        auto it = agents_.find(name);
        if (it != agents_.end())
        {
            return *it->second;
        }
        auto& new_agent = agents_[name];
        new_agent = std::make_unique<Agent>();
        return *new_agent;
    }

    /**
     * @brief Clear all agents
     */
    void clear()
    {
        agents_.clear();
    }

    /**
     * @brief Get list of agent summaries
     *
     * @param thresh_time Threshold time for agents to be considered
     *
     * @return Vector of agent summaries
     */
    std::vector<AgentSummary>
    getAgentSummaries(const double thresh_time = 1.0e-4) const;

    /**
     * @brief Print agent profiling report to standard output
     *
     * @param title Title for profiling report
     * @param thresh_time Threshold time for agents to be considered
     */
    void printReport(const std::string title = "",
                     const double thresh_time = 1.0e-4) const;

    const std::string& name() const
    {
        return name_;
    }

private:
    const std::string name_;
    std::stack<std::string> stopped_agents_;
    std::map<std::string, std::unique_ptr<Agent>> agents_;
};

} // namespace voxelfv

#endif /* PROFILER_H */
