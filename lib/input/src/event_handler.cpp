#include "noeul/input/event_handler.hpp"

#include <SDL3/SDL_timer.h>

#include "noeul/input/event_fmt.hpp"
#include "noeul/input/event_source.hpp"
#include "noeul/lightweight/include_spdlog.hpp"
#include "noeul/math/mamath.hpp"


namespace {

    uint32_t to_millisec(Uint64 ns) {
        return static_cast<uint32_t>(SDL_NS_TO_MS(ns));
    }

    bool is_window_type(uint32_t raw_type) {
        return raw_type >= SDL_EVENT_WINDOW_FIRST &&
               raw_type <= SDL_EVENT_WINDOW_LAST;
    }

}  // namespace


namespace noeul {

    RawTypeRange to_raw_range(EventType type) {
        switch (type) {
            case EventType::quit:
                return { SDL_EVENT_QUIT, SDL_EVENT_QUIT };
            case EventType::window:
                return { SDL_EVENT_WINDOW_FIRST, SDL_EVENT_WINDOW_LAST };
            case EventType::key_down:
                return { SDL_EVENT_KEY_DOWN, SDL_EVENT_KEY_DOWN };
            case EventType::key_up:
                return { SDL_EVENT_KEY_UP, SDL_EVENT_KEY_UP };
            case EventType::mouse_motion:
                return { SDL_EVENT_MOUSE_MOTION, SDL_EVENT_MOUSE_MOTION };
            case EventType::mouse_button_down:
                return { SDL_EVENT_MOUSE_BUTTON_DOWN,
                         SDL_EVENT_MOUSE_BUTTON_DOWN };
            case EventType::mouse_button_up:
                return { SDL_EVENT_MOUSE_BUTTON_UP, SDL_EVENT_MOUSE_BUTTON_UP };
            case EventType::mouse_wheel:
                return { SDL_EVENT_MOUSE_WHEEL, SDL_EVENT_MOUSE_WHEEL };
            case EventType::text_edit:
                return { SDL_EVENT_TEXT_EDITING, SDL_EVENT_TEXT_EDITING };
            case EventType::text_input:
                return { SDL_EVENT_TEXT_INPUT, SDL_EVENT_TEXT_INPUT };
        }

        NOEUL_ABORT("Unknown event type: {}", static_cast<int>(type));
    }

    std::optional<uint32_t> to_raw_type(WindowEventId id) {
        switch (id) {
            case WindowEventId::shown:
                return SDL_EVENT_WINDOW_SHOWN;
            case WindowEventId::hidden:
                return SDL_EVENT_WINDOW_HIDDEN;
            case WindowEventId::exposed:
                return SDL_EVENT_WINDOW_EXPOSED;
            case WindowEventId::moved:
                return SDL_EVENT_WINDOW_MOVED;
            case WindowEventId::resized:
                return SDL_EVENT_WINDOW_RESIZED;
            case WindowEventId::size_changed:
                return SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED;
            case WindowEventId::minimized:
                return SDL_EVENT_WINDOW_MINIMIZED;
            case WindowEventId::maximized:
                return SDL_EVENT_WINDOW_MAXIMIZED;
            case WindowEventId::restored:
                return SDL_EVENT_WINDOW_RESTORED;
            case WindowEventId::enter:
                return SDL_EVENT_WINDOW_MOUSE_ENTER;
            case WindowEventId::leave:
                return SDL_EVENT_WINDOW_MOUSE_LEAVE;
            case WindowEventId::focus_gained:
                return SDL_EVENT_WINDOW_FOCUS_GAINED;
            case WindowEventId::focus_lost:
                return SDL_EVENT_WINDOW_FOCUS_LOST;
            case WindowEventId::close:
                return SDL_EVENT_WINDOW_CLOSE_REQUESTED;
            case WindowEventId::none:
                break;
        }
        return std::nullopt;
    }

    WindowEventId to_window_event_id(uint32_t raw_type) {
        switch (raw_type) {
            case SDL_EVENT_WINDOW_SHOWN:
                return WindowEventId::shown;
            case SDL_EVENT_WINDOW_HIDDEN:
                return WindowEventId::hidden;
            case SDL_EVENT_WINDOW_EXPOSED:
                return WindowEventId::exposed;
            case SDL_EVENT_WINDOW_MOVED:
                return WindowEventId::moved;
            case SDL_EVENT_WINDOW_RESIZED:
                return WindowEventId::resized;
            case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                return WindowEventId::size_changed;
            case SDL_EVENT_WINDOW_MINIMIZED:
                return WindowEventId::minimized;
            case SDL_EVENT_WINDOW_MAXIMIZED:
                return WindowEventId::maximized;
            case SDL_EVENT_WINDOW_RESTORED:
                return WindowEventId::restored;
            case SDL_EVENT_WINDOW_MOUSE_ENTER:
                return WindowEventId::enter;
            case SDL_EVENT_WINDOW_MOUSE_LEAVE:
                return WindowEventId::leave;
            case SDL_EVENT_WINDOW_FOCUS_GAINED:
                return WindowEventId::focus_gained;
            case SDL_EVENT_WINDOW_FOCUS_LOST:
                return WindowEventId::focus_lost;
            case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                return WindowEventId::close;
            default:
                return WindowEventId::none;
        }
    }

    std::optional<Event> translate_event(
        const SDL_Event& raw, const key::IKeyboardState& keyboard
    ) {
        if (::is_window_type(raw.type)) {
            WindowEvent w;
            w.id = to_window_event_id(raw.type);
            w.data1 = raw.window.data1;
            w.data2 = raw.window.data2;
            return Event::make_window(
                ::to_millisec(raw.window.timestamp), raw.window.windowID, w
            );
        }

        switch (raw.type) {
            case SDL_EVENT_KEY_DOWN:
            case SDL_EVENT_KEY_UP: {
                KeyboardEvent k;
                k.state = raw.key.down ? key::State::pressed
                                       : key::State::released;
                k.code = static_cast<key::Code>(raw.key.key);
                k.scancode = static_cast<key::ScanCode>(raw.key.scancode);
                k.mod = keyboard.current_modifiers();
                k.repeat = raw.key.repeat;
                return Event::make_key(
                    raw.type == SDL_EVENT_KEY_DOWN,
                    ::to_millisec(raw.key.timestamp),
                    raw.key.windowID,
                    k
                );
            }
            case SDL_EVENT_QUIT:
                return Event::make_quit();
            case SDL_EVENT_MOUSE_BUTTON_DOWN:
            case SDL_EVENT_MOUSE_BUTTON_UP: {
                MouseButtonEvent m;
                m.button = static_cast<mouse::Button>(raw.button.button);
                m.clicks = raw.button.clicks;
                m.x = narrow_coord(raw.button.x);
                m.y = narrow_coord(raw.button.y);
                return Event::make_mouse_button(
                    raw.type == SDL_EVENT_MOUSE_BUTTON_UP,
                    ::to_millisec(raw.button.timestamp),
                    raw.button.windowID,
                    m
                );
            }
            case SDL_EVENT_MOUSE_MOTION: {
                MouseMotionEvent m;
                // Read through the button record, not the motion state flags
                m.state = raw.button.down ? mouse::State::pressed
                                          : mouse::State::released;
                m.x = narrow_coord(raw.motion.x);
                m.y = narrow_coord(raw.motion.y);
                m.rel_x = narrow_coord(raw.motion.xrel);
                m.rel_y = narrow_coord(raw.motion.yrel);
                return Event::make_mouse_motion(
                    ::to_millisec(raw.motion.timestamp), raw.motion.windowID, m
                );
            }
            case SDL_EVENT_MOUSE_WHEEL: {
                const auto sign = (raw.wheel.direction ==
                                   SDL_MOUSEWHEEL_FLIPPED)
                                      ? -1.0
                                      : 1.0;
                MouseWheelEvent m;
                m.x = narrow_coord(raw.wheel.mouse_x);
                m.y = narrow_coord(raw.wheel.mouse_y);
                m.delta_x = narrow_coord(sign * raw.wheel.x);
                m.delta_y = narrow_coord(sign * raw.wheel.y);
                return Event::make_mouse_wheel(
                    ::to_millisec(raw.wheel.timestamp), raw.wheel.windowID, m
                );
            }
            case SDL_EVENT_TEXT_EDITING: {
                TextEditEvent t;
                t.text = make_text_buffer(raw.edit.text);
                t.start = wrap_to_i16(raw.edit.start);
                t.length = wrap_to_u16(raw.edit.length);
                return Event::make_text_edit(
                    ::to_millisec(raw.edit.timestamp), raw.edit.windowID, t
                );
            }
            case SDL_EVENT_TEXT_INPUT: {
                TextInputEvent t;
                t.text = make_text_buffer(raw.text.text);
                return Event::make_text_input(
                    ::to_millisec(raw.text.timestamp), raw.text.windowID, t
                );
            }
            default:
                SPDLOG_TRACE("Untranslated event type: {:#x}", raw.type);
                return std::nullopt;
        }
    }

}  // namespace noeul


namespace {

    class EventHandler : public noeul::IEventHandler {

    public:
        explicit EventHandler(noeul::EventHandlerCreateInfo&& cinfo)
            : max_dispatch_(cinfo.max_dispatch_) {
            if (cinfo.source_) {
                source_ = cinfo.source_;
            } else {
                owned_source_ = std::make_unique<noeul::SdlEventSource>();
                source_ = owned_source_.get();
            }

            if (cinfo.keyboard_) {
                keyboard_ = cinfo.keyboard_;
            } else {
                using noeul::key::SdlKeyboardState;
                owned_keyboard_ = std::make_unique<SdlKeyboardState>();
                keyboard_ = owned_keyboard_.get();
            }

            for (const auto type : cinfo.disabled_types_) {
                this->set_state(type, noeul::EventState::disable);
                SPDLOG_DEBUG("Event type disabled: {}", type);
            }
        }

        std::optional<noeul::Event> translate(const SDL_Event& raw
        ) const override {
            return noeul::translate_event(raw, *keyboard_);
        }

        std::optional<noeul::Event> poll() override {
            const auto raw = source_->try_dequeue();
            if (!raw.has_value())
                return std::nullopt;

            return this->translate(*raw);
        }

        std::optional<noeul::Event> wait(std::optional<int32_t> timeout_ms
        ) override {
            const auto raw = source_->blocking_dequeue(timeout_ms);
            if (!raw.has_value())
                return std::nullopt;

            return this->translate(*raw);
        }

        bool push(noeul::EventType type) override {
            SDL_Event e;
            SDL_zero(e);
            e.type = noeul::to_raw_range(type).first_;
            return this->enqueue(e);
        }

        bool push(noeul::WindowEventId id) override {
            const auto raw_type = noeul::to_raw_type(id);
            if (!raw_type.has_value()) {
                SPDLOG_WARN("Window sub-event {} cannot be pushed", id);
                return false;
            }

            SDL_Event e;
            SDL_zero(e);
            e.type = *raw_type;
            return this->enqueue(e);
        }

        void flush(noeul::EventType type) override {
            const auto range = noeul::to_raw_range(type);
            source_->flush(range.first_, range.last_);
        }

        noeul::EventState set_state(
            noeul::EventType type, noeul::EventState state
        ) override {
            using noeul::EventState;

            const auto range = noeul::to_raw_range(type);

            // A range counts as enabled only if every member is
            bool prev_enabled = true;
            for (auto t = range.first_; t <= range.last_; ++t) {
                if (!source_->is_enabled(t)) {
                    prev_enabled = false;
                    break;
                }
            }

            if (state != EventState::query) {
                const auto enable = (state == EventState::enable);
                for (auto t = range.first_; t <= range.last_; ++t)
                    source_->set_enabled(t, enable);
            }

            return prev_enabled ? EventState::enable : EventState::disable;
        }

        bool has_pending(noeul::EventType type) override {
            const auto range = noeul::to_raw_range(type);
            return source_->has_pending(range.first_, range.last_);
        }

        bool has_quit_pending() override { return source_->has_quit_pending(); }

        size_t dispatch_pending(noeul::IEventListener& listener) override {
            size_t delivered = 0;

            for (size_t i = 0; i < max_dispatch_; ++i) {
                const auto raw = source_->try_dequeue();
                if (!raw.has_value())
                    break;

                const auto e = this->translate(*raw);
                if (!e.has_value())
                    continue;

                noeul::dispatch_event(*e, listener);
                ++delivered;
            }

            return delivered;
        }

    private:
        bool enqueue(SDL_Event& e) {
            if (!source_->enqueue(e)) {
                SPDLOG_WARN("Failed to push event {:#x}", e.type);
                return false;
            }
            return true;
        }

        std::unique_ptr<noeul::IEventSource> owned_source_;
        std::unique_ptr<noeul::key::IKeyboardState> owned_keyboard_;
        noeul::IEventSource* source_ = nullptr;
        noeul::key::IKeyboardState* keyboard_ = nullptr;
        size_t max_dispatch_ = 0;
    };

}  // namespace


namespace noeul {

    std::unique_ptr<IEventHandler> create_event_handler(
        EventHandlerCreateInfo&& create_info
    ) {
        return std::make_unique<::EventHandler>(std::move(create_info));
    }

}  // namespace noeul
