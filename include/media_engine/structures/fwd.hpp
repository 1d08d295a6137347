#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for media_structures types

#include <functional>

namespace media_structures {

// =============================================================================
// Forward Declarations
// =============================================================================

/// Unbounded FIFO queue with timed blocking pop
template<typename T>
class BlockingQueue;

/// Priority queue with timed blocking pop
template<typename T, typename Precedes>
class PriorityBlockingQueue;

} // namespace media_structures
