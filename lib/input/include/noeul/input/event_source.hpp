#pragma once

#include <cstdint>
#include <optional>

#include <SDL3/SDL_events.h>


namespace noeul {

    // The process-wide queue of raw SDL events. Discriminants are raw
    // SDL_EventType values; ranges are inclusive.
    class IEventSource {

    public:
        virtual ~IEventSource() = default;

        // Non-blocking
        virtual std::optional<SDL_Event> try_dequeue() = 0;
        // Blocks until a record arrives, or until `timeout_ms` elapses
        virtual std::optional<SDL_Event> blocking_dequeue(
            std::optional<int32_t> timeout_ms
        ) = 0;
        virtual bool enqueue(SDL_Event& e) = 0;

        virtual void flush(uint32_t first, uint32_t last) = 0;
        virtual bool has_pending(uint32_t first, uint32_t last) = 0;
        virtual bool has_quit_pending() = 0;

        virtual bool is_enabled(uint32_t type) = 0;
        virtual void set_enabled(uint32_t type, bool enabled) = 0;
    };


    class SdlEventSource : public IEventSource {

    public:
        std::optional<SDL_Event> try_dequeue() override;
        std::optional<SDL_Event> blocking_dequeue(
            std::optional<int32_t> timeout_ms
        ) override;
        bool enqueue(SDL_Event& e) override;

        void flush(uint32_t first, uint32_t last) override;
        bool has_pending(uint32_t first, uint32_t last) override;
        bool has_quit_pending() override;

        bool is_enabled(uint32_t type) override;
        void set_enabled(uint32_t type, bool enabled) override;
    };


    // Keeps the SDL events subsystem initialized while alive.
    // Throws std::runtime_error if SDL refuses.
    class SdlEventSubsystem {

    public:
        SdlEventSubsystem();
        ~SdlEventSubsystem();

        SdlEventSubsystem(const SdlEventSubsystem&) = delete;
        SdlEventSubsystem& operator=(const SdlEventSubsystem&) = delete;
    };

}  // namespace noeul
