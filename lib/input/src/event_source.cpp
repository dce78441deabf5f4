#include "noeul/input/event_source.hpp"

#include <stdexcept>

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_init.h>

#include "noeul/lightweight/include_spdlog.hpp"


// SdlEventSource
namespace noeul {

    std::optional<SDL_Event> SdlEventSource::try_dequeue() {
        SDL_Event e;
        if (SDL_PollEvent(&e))
            return e;
        return std::nullopt;
    }

    std::optional<SDL_Event> SdlEventSource::blocking_dequeue(
        std::optional<int32_t> timeout_ms
    ) {
        SDL_Event e;

        if (!timeout_ms.has_value()) {
            if (SDL_WaitEvent(&e))
                return e;
            SPDLOG_ERROR("SDL_WaitEvent failed: {}", SDL_GetError());
            return std::nullopt;
        }

        if (SDL_WaitEventTimeout(&e, *timeout_ms))
            return e;
        return std::nullopt;
    }

    bool SdlEventSource::enqueue(SDL_Event& e) {
        // False is returned both for errors and for filtered events
        if (!SDL_PushEvent(&e)) {
            SPDLOG_DEBUG(
                "Event {:#x} was not queued: {}", e.type, SDL_GetError()
            );
            return false;
        }
        return true;
    }

    void SdlEventSource::flush(uint32_t first, uint32_t last) {
        SDL_FlushEvents(first, last);
    }

    bool SdlEventSource::has_pending(uint32_t first, uint32_t last) {
        return SDL_HasEvents(first, last);
    }

    bool SdlEventSource::has_quit_pending() {
        SDL_PumpEvents();
        return SDL_HasEvent(SDL_EVENT_QUIT);
    }

    bool SdlEventSource::is_enabled(uint32_t type) {
        return SDL_EventEnabled(type);
    }

    void SdlEventSource::set_enabled(uint32_t type, bool enabled) {
        SDL_SetEventEnabled(type, enabled);
    }

}  // namespace noeul


// SdlEventSubsystem
namespace noeul {

    SdlEventSubsystem::SdlEventSubsystem() {
        if (!SDL_InitSubSystem(SDL_INIT_EVENTS)) {
            const auto msg = fmt::format(
                "Failed to initialize SDL events subsystem: {}", SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }
    }

    SdlEventSubsystem::~SdlEventSubsystem() {
        SDL_QuitSubSystem(SDL_INIT_EVENTS);
    }

}  // namespace noeul
