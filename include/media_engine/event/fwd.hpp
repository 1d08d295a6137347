#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for media_event

#include <cstdint>

namespace media_event {

// Priority
enum class Priority : std::uint8_t;

// IDs
struct SubscriberId;

// Core types
class EventEnvelope;
class EventBus;

} // namespace media_event
