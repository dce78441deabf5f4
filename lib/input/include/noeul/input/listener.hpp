#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "noeul/input/event.hpp"


namespace noeul {

    // Handlers return true if they consumed the event.
    class IEventListener {

    public:
        virtual ~IEventListener() = default;
        virtual bool on_quit(const Event& e) { return false; }
        virtual bool on_window(const Event& e) { return false; }
        virtual bool on_key(const Event& e) { return false; }
        virtual bool on_mouse_button(const Event& e) { return false; }
        virtual bool on_mouse_motion(const Event& e) { return false; }
        virtual bool on_mouse_wheel(const Event& e) { return false; }
        virtual bool on_text_edit(const Event& e) { return false; }
        virtual bool on_text_input(const Event& e) { return false; }
    };


    // Routes `e` to the handler matching its type
    bool dispatch_event(const Event& e, IEventListener& listener);


    class EventListenerMgr : public IEventListener {

    public:
        bool on_quit(const Event& e) override;
        bool on_window(const Event& e) override;
        bool on_key(const Event& e) override;
        bool on_mouse_button(const Event& e) override;
        bool on_mouse_motion(const Event& e) override;
        bool on_mouse_wheel(const Event& e) override;
        bool on_text_edit(const Event& e) override;
        bool on_text_input(const Event& e) override;

        // Borrowed, must outlive this manager
        void add(IEventListener* listener) { items_.emplace_back(listener); }

        void add(std::unique_ptr<IEventListener>&& listener) {
            items_.emplace_back(std::move(listener));
        }

        size_t size() const { return items_.size(); }

    private:
        using Item_t =
            std::variant<IEventListener*, std::unique_ptr<IEventListener>>;

        static IEventListener* get_ptr(Item_t& item);

        // Stops at the first listener that consumes
        template <typename TFunc>
        bool visit_chain(TFunc&& func) {
            for (auto& x : items_) {
                auto listener = get_ptr(x);
                if (listener && func(*listener))
                    return true;
            }
            return false;
        }

        std::vector<Item_t> items_;
    };

}  // namespace noeul


namespace noeul::key {

    // Remembers which keys are held, fed by key events
    class StateTracker : public IEventListener {

    public:
        using Clock_t = std::chrono::steady_clock;

        struct KeyState {
            Clock_t::time_point timepoint = Clock_t::now();
            uint32_t timestamp = 0;
            bool pressed = false;
        };

    public:
        // Never consumes so listeners behind it in a chain still see keys
        bool on_key(const Event& e) override;

        void notify(ScanCode scancode, bool pressed, uint32_t timestamp);

        bool is_pressed(ScanCode scancode) const;
        // SDL timestamp of the last transition of `scancode`
        std::optional<uint32_t> get_timestamp(ScanCode scancode) const;
        std::optional<Clock_t::time_point> get_timepoint(
            ScanCode scancode
        ) const;

        void clear() { states_.clear(); }

    private:
        KeyState& get_state(ScanCode key);
        const KeyState* try_get_state(ScanCode key) const;

        std::map<ScanCode, KeyState> states_;
    };

}  // namespace noeul::key
