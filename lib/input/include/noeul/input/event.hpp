#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>

#include "noeul/input/keyboard.hpp"
#include "noeul/input/mouse.hpp"
#include "noeul/lightweight/konsts.hpp"


namespace noeul {

    enum class EventType {
        quit,               // Time to close the window
        window,             // Something happened to a window
        key_down,           // A key is pressed
        key_up,             // A key is released
        mouse_motion,       // The mouse has moved
        mouse_button_down,  // A mouse button is pressed
        mouse_button_up,    // A mouse button is released
        mouse_wheel,        // The mouse wheel has scrolled
        text_edit,          // Keyboard text editing (composition)
        text_input,         // Keyboard text input
    };


    enum class WindowEventId : uint8_t {
        none,          // Not one of the sub-events below
        shown,         // Window has been shown
        hidden,        // Window has been hidden
        exposed,       // Window has been exposed and should be redrawn
        moved,         // Window has been moved to data1, data2
        resized,       // Window has been resized to data1 x data2
        size_changed,  // Pixel size changed, data1 x data2
        minimized,
        maximized,
        restored,      // Restored to normal size and position
        enter,         // Window has gained mouse focus
        leave,         // Window has lost mouse focus
        focus_gained,  // Window has gained keyboard focus
        focus_lost,    // Window has lost keyboard focus
        close,         // The window manager requests the window be closed
    };


    using TextBuffer = std::array<char, TEXT_SIZE>;


    struct KeyboardEvent {
        key::State state = key::State::released;
        key::Code code = key::Code::unknown;
        key::ScanCode scancode = key::ScanCode::unknown;
        key::Mod mod = key::Mod::none;
        // True if this is an auto-repeat, not an initial press
        bool repeat = false;
    };

    struct WindowEvent {
        WindowEventId id = WindowEventId::none;
        int32_t data1 = 0;
        int32_t data2 = 0;
    };

    struct MouseButtonEvent {
        mouse::Button button = mouse::Button::left;
        uint8_t clicks = 0;
        int16_t x = 0;
        int16_t y = 0;
    };

    struct MouseMotionEvent {
        mouse::State state = mouse::State::released;
        int16_t x = 0;
        int16_t y = 0;
        int16_t rel_x = 0;
        int16_t rel_y = 0;
    };

    struct MouseWheelEvent {
        int16_t x = 0;
        int16_t y = 0;
        int16_t delta_x = 0;
        int16_t delta_y = 0;
    };

    struct TextEditEvent {
        TextBuffer text{};
        int16_t start = 0;    // Cursor start in the editing text
        uint16_t length = 0;  // Length of the selected editing text

        std::string_view str() const;
    };

    struct TextInputEvent {
        TextBuffer text{};

        std::string_view str() const;
    };


    // Copies at most TEXT_SIZE - 1 bytes and always null-terminates.
    // A null `src` yields an empty buffer.
    TextBuffer make_text_buffer(const char* src);


    class Event {

    public:
        using Payload = std::variant<
            std::monostate,
            KeyboardEvent,
            WindowEvent,
            MouseButtonEvent,
            MouseMotionEvent,
            MouseWheelEvent,
            TextEditEvent,
            TextInputEvent>;

    public:
        static Event make_quit();
        static Event make_window(
            uint32_t timestamp, uint32_t window_id, const WindowEvent& e
        );
        // Kind is key_down if `down`, key_up otherwise
        static Event make_key(
            bool down,
            uint32_t timestamp,
            uint32_t window_id,
            const KeyboardEvent& e
        );
        static Event make_mouse_button(
            bool up,
            uint32_t timestamp,
            uint32_t window_id,
            const MouseButtonEvent& e
        );
        static Event make_mouse_motion(
            uint32_t timestamp, uint32_t window_id, const MouseMotionEvent& e
        );
        static Event make_mouse_wheel(
            uint32_t timestamp, uint32_t window_id, const MouseWheelEvent& e
        );
        static Event make_text_edit(
            uint32_t timestamp, uint32_t window_id, const TextEditEvent& e
        );
        static Event make_text_input(
            uint32_t timestamp, uint32_t window_id, const TextInputEvent& e
        );

        EventType type() const { return type_; }
        // Milliseconds since SDL initialization, 0 for quit
        uint32_t timestamp() const { return timestamp_; }
        uint32_t window_id() const { return window_id_; }

        bool is_key() const;
        bool is_mouse_button() const;

        // These throw std::bad_variant_access if the payload does not match
        const KeyboardEvent& keyboard() const;
        const WindowEvent& window() const;
        const MouseButtonEvent& mouse_button() const;
        const MouseMotionEvent& mouse_motion() const;
        const MouseWheelEvent& mouse_wheel() const;
        const TextEditEvent& text_edit() const;
        const TextInputEvent& text_input() const;

        const Payload& payload() const { return payload_; }

    private:
        Event(EventType type, uint32_t ts, uint32_t wid, Payload&& payload)
            : payload_(std::move(payload))
            , timestamp_(ts)
            , window_id_(wid)
            , type_(type) {}

        Payload payload_;
        uint32_t timestamp_ = 0;
        uint32_t window_id_ = 0;
        EventType type_ = EventType::quit;
    };


    const char* to_str(EventType type);
    const char* to_str(WindowEventId id);

}  // namespace noeul
