#include "noeul/input/event.hpp"

#include <algorithm>
#include <cstring>


namespace {

    size_t bounded_strlen(const char* str, size_t max_len) {
        const auto end = std::find(str, str + max_len, '\0');
        return static_cast<size_t>(end - str);
    }

    std::string_view buffer_view(const noeul::TextBuffer& buf) {
        const auto len = ::bounded_strlen(buf.data(), buf.size());
        return std::string_view{ buf.data(), len };
    }

}  // namespace


namespace noeul {

    std::string_view TextEditEvent::str() const { return ::buffer_view(text); }

    std::string_view TextInputEvent::str() const {
        return ::buffer_view(text);
    }

    TextBuffer make_text_buffer(const char* src) {
        TextBuffer out{};
        if (nullptr == src)
            return out;

        const auto len = ::bounded_strlen(src, out.size() - 1);
        std::memcpy(out.data(), src, len);
        out[len] = '\0';
        return out;
    }

}  // namespace noeul


// Event
namespace noeul {

    Event Event::make_quit() {
        return Event{ EventType::quit, 0, 0, Payload{ std::monostate{} } };
    }

    Event Event::make_window(
        uint32_t timestamp, uint32_t window_id, const WindowEvent& e
    ) {
        return Event{ EventType::window, timestamp, window_id, Payload{ e } };
    }

    Event Event::make_key(
        bool down, uint32_t timestamp, uint32_t window_id, const KeyboardEvent& e
    ) {
        const auto type = down ? EventType::key_down : EventType::key_up;
        return Event{ type, timestamp, window_id, Payload{ e } };
    }

    Event Event::make_mouse_button(
        bool up,
        uint32_t timestamp,
        uint32_t window_id,
        const MouseButtonEvent& e
    ) {
        const auto type = up ? EventType::mouse_button_up
                             : EventType::mouse_button_down;
        return Event{ type, timestamp, window_id, Payload{ e } };
    }

    Event Event::make_mouse_motion(
        uint32_t timestamp, uint32_t window_id, const MouseMotionEvent& e
    ) {
        return Event{
            EventType::mouse_motion, timestamp, window_id, Payload{ e }
        };
    }

    Event Event::make_mouse_wheel(
        uint32_t timestamp, uint32_t window_id, const MouseWheelEvent& e
    ) {
        return Event{
            EventType::mouse_wheel, timestamp, window_id, Payload{ e }
        };
    }

    Event Event::make_text_edit(
        uint32_t timestamp, uint32_t window_id, const TextEditEvent& e
    ) {
        return Event{ EventType::text_edit, timestamp, window_id, Payload{ e } };
    }

    Event Event::make_text_input(
        uint32_t timestamp, uint32_t window_id, const TextInputEvent& e
    ) {
        return Event{
            EventType::text_input, timestamp, window_id, Payload{ e }
        };
    }

    bool Event::is_key() const {
        return type_ == EventType::key_down || type_ == EventType::key_up;
    }

    bool Event::is_mouse_button() const {
        return type_ == EventType::mouse_button_down ||
               type_ == EventType::mouse_button_up;
    }

    const KeyboardEvent& Event::keyboard() const {
        return std::get<KeyboardEvent>(payload_);
    }

    const WindowEvent& Event::window() const {
        return std::get<WindowEvent>(payload_);
    }

    const MouseButtonEvent& Event::mouse_button() const {
        return std::get<MouseButtonEvent>(payload_);
    }

    const MouseMotionEvent& Event::mouse_motion() const {
        return std::get<MouseMotionEvent>(payload_);
    }

    const MouseWheelEvent& Event::mouse_wheel() const {
        return std::get<MouseWheelEvent>(payload_);
    }

    const TextEditEvent& Event::text_edit() const {
        return std::get<TextEditEvent>(payload_);
    }

    const TextInputEvent& Event::text_input() const {
        return std::get<TextInputEvent>(payload_);
    }

}  // namespace noeul


namespace noeul {

    const char* to_str(EventType type) {
        switch (type) {
            case EventType::quit:
                return "quit";
            case EventType::window:
                return "window";
            case EventType::key_down:
                return "key_down";
            case EventType::key_up:
                return "key_up";
            case EventType::mouse_motion:
                return "mouse_motion";
            case EventType::mouse_button_down:
                return "mouse_button_down";
            case EventType::mouse_button_up:
                return "mouse_button_up";
            case EventType::mouse_wheel:
                return "mouse_wheel";
            case EventType::text_edit:
                return "text_edit";
            case EventType::text_input:
                return "text_input";
        }
        return "unknown";
    }

    const char* to_str(WindowEventId id) {
        switch (id) {
            case WindowEventId::none:
                return "none";
            case WindowEventId::shown:
                return "shown";
            case WindowEventId::hidden:
                return "hidden";
            case WindowEventId::exposed:
                return "exposed";
            case WindowEventId::moved:
                return "moved";
            case WindowEventId::resized:
                return "resized";
            case WindowEventId::size_changed:
                return "size_changed";
            case WindowEventId::minimized:
                return "minimized";
            case WindowEventId::maximized:
                return "maximized";
            case WindowEventId::restored:
                return "restored";
            case WindowEventId::enter:
                return "enter";
            case WindowEventId::leave:
                return "leave";
            case WindowEventId::focus_gained:
                return "focus_gained";
            case WindowEventId::focus_lost:
                return "focus_lost";
            case WindowEventId::close:
                return "close";
        }
        return "unknown";
    }

}  // namespace noeul
