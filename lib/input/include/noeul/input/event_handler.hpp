#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <SDL3/SDL_events.h>

#include "noeul/input/create_info.hpp"
#include "noeul/input/event.hpp"
#include "noeul/input/listener.hpp"


namespace noeul {

    enum class EventState {
        query,    // Only report the current state
        ignore,   // Drop silently
        disable,  // Same as ignore for SDL3
        enable,
    };


    // Raw SDL discriminants covered by `type`, inclusive
    struct RawTypeRange {
        uint32_t first_;
        uint32_t last_;
    };

    RawTypeRange to_raw_range(EventType type);
    std::optional<uint32_t> to_raw_type(WindowEventId id);
    WindowEventId to_window_event_id(uint32_t raw_type);


    /**
     * Converts one raw SDL record into an Event.
     *
     * Returns nullopt for record types that have no EventType. The modifier
     * mask of key events is read from `keyboard` at call time rather than
     * copied from the record.
     */
    std::optional<Event> translate_event(
        const SDL_Event& raw, const key::IKeyboardState& keyboard
    );


    class IEventHandler {

    public:
        virtual ~IEventHandler() = default;

        virtual std::optional<Event> translate(const SDL_Event& raw) const = 0;

        // Dequeues at most one record. Nullopt if the queue was empty or the
        // record could not be translated.
        virtual std::optional<Event> poll() = 0;
        // Blocks until a record arrives, forever if `timeout_ms` is nullopt.
        // Nullopt on timeout or if the record could not be translated.
        virtual std::optional<Event> wait(std::optional<int32_t> timeout_ms
        ) = 0;

        // Enqueues a record carrying only the discriminant. Pushing `window`
        // enqueues a `shown` sub-event.
        virtual bool push(EventType type) = 0;
        virtual bool push(WindowEventId id) = 0;

        virtual void flush(EventType type) = 0;
        // Returns the state in effect before this call
        virtual EventState set_state(EventType type, EventState state) = 0;
        virtual bool has_pending(EventType type) = 0;
        virtual bool has_quit_pending() = 0;

        // Drains the queue into `listener`, skipping untranslatable records.
        // Returns the number of events delivered.
        virtual size_t dispatch_pending(IEventListener& listener) = 0;

        std::optional<Event> wait() { return this->wait(std::nullopt); }
    };


    std::unique_ptr<IEventHandler> create_event_handler(
        EventHandlerCreateInfo&& create_info
    );

}  // namespace noeul
