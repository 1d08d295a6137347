#pragma once

/// @file event.hpp
/// @brief Main include header for media_event
///
/// media_event provides the notification bus the asset pipeline publishes
/// progress on:
/// - Pending queue backed by media_structures::BlockingQueue
/// - Priority-based delivery
/// - Handlers run on the thread that calls process()
///
/// ## Quick Start
///
/// ```cpp
/// media_event::EventBus bus;
///
/// // Subscribe to events
/// auto sub_id = bus.subscribe<MyEvent>([](const MyEvent& e) {
///     // Handle event
/// });
///
/// // Publish events (any thread)
/// bus.publish(MyEvent{...});
///
/// // Deliver all pending events (main thread)
/// bus.process();
///
/// // Unsubscribe
/// bus.unsubscribe(sub_id);
/// ```

#include "fwd.hpp"
#include "event_bus.hpp"

namespace media_event {

/// Prelude - commonly used types
namespace prelude {
    using media_event::Priority;
    using media_event::SubscriberId;
    using media_event::EventEnvelope;
    using media_event::EventBus;
} // namespace prelude

} // namespace media_event
