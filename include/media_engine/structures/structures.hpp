#pragma once

/// @file structures.hpp
/// @brief Main include for media_structures module
///
/// This header includes all media_structures components:
/// - BlockingQueue<T>: Unbounded FIFO queue with timed pop
/// - PriorityBlockingQueue<T, Precedes>: Priority queue with timed pop
///
/// @example Basic usage:
/// @code
/// #include <media_engine/structures/structures.hpp>
///
/// using namespace media_structures;
///
/// struct Job { int priority; };
/// struct HigherFirst {
///     bool operator()(const Job& a, const Job& b) const { return a.priority > b.priority; }
/// };
///
/// PriorityBlockingQueue<Job, HigherFirst> jobs;
/// jobs.push({1});
/// jobs.push({5});
///
/// // Worker thread
/// if (auto job = jobs.pop_for(std::chrono::milliseconds(100))) {
///     // job->priority == 5
/// }
/// @endcode

#include "fwd.hpp"
#include "blocking_queue.hpp"
#include "priority_queue.hpp"

namespace media_structures {

/// Version information
struct Version {
    static constexpr int MAJOR = 1;
    static constexpr int MINOR = 0;
    static constexpr int PATCH = 0;
};

} // namespace media_structures
