#pragma once

#include <cstddef>
#include <vector>

#include "noeul/input/event.hpp"


namespace noeul {

    class IEventSource;


    struct EventHandlerCreateInfo {
        // Null means the SDL event queue
        IEventSource* source_ = nullptr;
        // Null means the SDL modifier state
        key::IKeyboardState* keyboard_ = nullptr;
        // Disabled when the handler is created
        std::vector<EventType> disabled_types_;
        // Upper bound of raw records one dispatch_pending call dequeues
        size_t max_dispatch_ = 1024;
    };

}  // namespace noeul
