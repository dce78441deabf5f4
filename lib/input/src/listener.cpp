#include "noeul/input/listener.hpp"


namespace noeul {

    bool dispatch_event(const Event& e, IEventListener& listener) {
        switch (e.type()) {
            case EventType::quit:
                return listener.on_quit(e);
            case EventType::window:
                return listener.on_window(e);
            case EventType::key_down:
            case EventType::key_up:
                return listener.on_key(e);
            case EventType::mouse_motion:
                return listener.on_mouse_motion(e);
            case EventType::mouse_button_down:
            case EventType::mouse_button_up:
                return listener.on_mouse_button(e);
            case EventType::mouse_wheel:
                return listener.on_mouse_wheel(e);
            case EventType::text_edit:
                return listener.on_text_edit(e);
            case EventType::text_input:
                return listener.on_text_input(e);
        }
        return false;
    }

}  // namespace noeul


// EventListenerMgr
namespace noeul {

    IEventListener* EventListenerMgr::get_ptr(Item_t& item) {
        switch (item.index()) {
            case 0:
                return std::get<0>(item);
            case 1:
                return std::get<1>(item).get();
        }
        return nullptr;
    }

    bool EventListenerMgr::on_quit(const Event& e) {
        return this->visit_chain([&](IEventListener& l) {
            return l.on_quit(e);
        });
    }

    bool EventListenerMgr::on_window(const Event& e) {
        return this->visit_chain([&](IEventListener& l) {
            return l.on_window(e);
        });
    }

    bool EventListenerMgr::on_key(const Event& e) {
        return this->visit_chain([&](IEventListener& l) {
            return l.on_key(e);
        });
    }

    bool EventListenerMgr::on_mouse_button(const Event& e) {
        return this->visit_chain([&](IEventListener& l) {
            return l.on_mouse_button(e);
        });
    }

    bool EventListenerMgr::on_mouse_motion(const Event& e) {
        return this->visit_chain([&](IEventListener& l) {
            return l.on_mouse_motion(e);
        });
    }

    bool EventListenerMgr::on_mouse_wheel(const Event& e) {
        return this->visit_chain([&](IEventListener& l) {
            return l.on_mouse_wheel(e);
        });
    }

    bool EventListenerMgr::on_text_edit(const Event& e) {
        return this->visit_chain([&](IEventListener& l) {
            return l.on_text_edit(e);
        });
    }

    bool EventListenerMgr::on_text_input(const Event& e) {
        return this->visit_chain([&](IEventListener& l) {
            return l.on_text_input(e);
        });
    }

}  // namespace noeul


// key::StateTracker
namespace noeul::key {

    bool StateTracker::on_key(const Event& e) {
        const auto& k = e.keyboard();
        this->notify(
            k.scancode, e.type() == EventType::key_down, e.timestamp()
        );
        return false;
    }

    void StateTracker::notify(
        ScanCode scancode, bool pressed, uint32_t timestamp
    ) {
        auto& state = this->get_state(scancode);
        state.timepoint = Clock_t::now();
        state.timestamp = timestamp;
        state.pressed = pressed;
    }

    bool StateTracker::is_pressed(ScanCode scancode) const {
        if (auto state = this->try_get_state(scancode))
            return state->pressed;
        return false;
    }

    std::optional<uint32_t> StateTracker::get_timestamp(
        ScanCode scancode
    ) const {
        if (auto state = this->try_get_state(scancode))
            return state->timestamp;
        return std::nullopt;
    }

    std::optional<StateTracker::Clock_t::time_point>
    StateTracker::get_timepoint(ScanCode scancode) const {
        if (auto state = this->try_get_state(scancode))
            return state->timepoint;
        return std::nullopt;
    }

    StateTracker::KeyState& StateTracker::get_state(ScanCode key) {
        auto it = states_.find(key);
        if (it != states_.end()) {
            return it->second;
        }

        return states_.insert({ key, KeyState() }).first->second;
    }

    const StateTracker::KeyState* StateTracker::try_get_state(
        ScanCode key
    ) const {
        auto it = states_.find(key);
        if (it != states_.end()) {
            return &it->second;
        }

        return nullptr;
    }

}  // namespace noeul::key
