#include "noeul/input/event_handler.hpp"

#include <cmath>
#include <string>

#include <gtest/gtest.h>

#include "noeul/math/mamath.hpp"


namespace {

    class FakeKeyboard : public noeul::key::IKeyboardState {

    public:
        noeul::key::Mod current_modifiers() const override { return mod_; }

        noeul::key::Mod mod_ = noeul::key::Mod::none;
    };


    SDL_Event make_raw(uint32_t type) {
        SDL_Event e;
        SDL_zero(e);
        e.type = type;
        return e;
    }


    class EventTranslate : public testing::Test {

    protected:
        std::optional<noeul::Event> translate(const SDL_Event& raw) const {
            return noeul::translate_event(raw, keyboard_);
        }

        FakeKeyboard keyboard_;
    };


    TEST_F(EventTranslate, RecognizedTypes) {
        using noeul::EventType;

        const std::pair<uint32_t, EventType> cases[] = {
            { SDL_EVENT_QUIT, EventType::quit },
            { SDL_EVENT_WINDOW_SHOWN, EventType::window },
            { SDL_EVENT_WINDOW_CLOSE_REQUESTED, EventType::window },
            { SDL_EVENT_KEY_DOWN, EventType::key_down },
            { SDL_EVENT_KEY_UP, EventType::key_up },
            { SDL_EVENT_MOUSE_MOTION, EventType::mouse_motion },
            { SDL_EVENT_MOUSE_BUTTON_DOWN, EventType::mouse_button_down },
            { SDL_EVENT_MOUSE_BUTTON_UP, EventType::mouse_button_up },
            { SDL_EVENT_MOUSE_WHEEL, EventType::mouse_wheel },
            { SDL_EVENT_TEXT_EDITING, EventType::text_edit },
            { SDL_EVENT_TEXT_INPUT, EventType::text_input },
        };

        for (auto& [raw_type, expected] : cases) {
            const auto e = this->translate(::make_raw(raw_type));
            ASSERT_TRUE(e.has_value()) << raw_type;
            EXPECT_EQ(e->type(), expected) << raw_type;
        }
    }

    TEST_F(EventTranslate, UnrecognizedTypes) {
        const uint32_t cases[] = {
            SDL_EVENT_FIRST,
            SDL_EVENT_TERMINATING,
            SDL_EVENT_CLIPBOARD_UPDATE,
            SDL_EVENT_JOYSTICK_AXIS_MOTION,
            SDL_EVENT_GAMEPAD_BUTTON_DOWN,
            SDL_EVENT_FINGER_DOWN,
            SDL_EVENT_DROP_FILE,
            SDL_EVENT_USER,
            SDL_EVENT_LAST,
        };

        for (auto raw_type : cases) {
            EXPECT_FALSE(this->translate(::make_raw(raw_type)).has_value())
                << raw_type;
        }
    }

    TEST_F(EventTranslate, KeyKindFollowsRawType) {
        auto raw = ::make_raw(SDL_EVENT_KEY_UP);
        raw.key.down = true;
        raw.key.key = SDLK_A;
        raw.key.scancode = SDL_SCANCODE_A;
        raw.key.repeat = true;
        raw.key.timestamp = SDL_MS_TO_NS(1234);
        raw.key.windowID = 7;

        const auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->type(), noeul::EventType::key_up);
        EXPECT_TRUE(e->is_key());
        EXPECT_EQ(e->timestamp(), 1234);
        EXPECT_EQ(e->window_id(), 7);

        const auto& k = e->keyboard();
        EXPECT_EQ(k.state, noeul::key::State::pressed);
        EXPECT_EQ(k.code, noeul::key::Code::a);
        EXPECT_EQ(k.scancode, noeul::key::ScanCode::a);
        EXPECT_TRUE(k.repeat);
    }

    TEST_F(EventTranslate, KeyModifiersReadFromKeyboardState) {
        using noeul::key::Mod;

        auto raw = ::make_raw(SDL_EVENT_KEY_DOWN);
        raw.key.mod = SDL_KMOD_NONE;
        keyboard_.mod_ = Mod::lshift | Mod::rctrl;

        const auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->keyboard().mod, Mod::lshift | Mod::rctrl);
        EXPECT_TRUE(noeul::key::has_mod(e->keyboard().mod, Mod::shift));
        EXPECT_EQ(e->keyboard().state, noeul::key::State::released);
    }

    TEST_F(EventTranslate, MouseButtonKindFollowsRawType) {
        auto raw = ::make_raw(SDL_EVENT_MOUSE_BUTTON_DOWN);
        raw.button.down = false;
        raw.button.button = SDL_BUTTON_RIGHT;
        raw.button.clicks = 2;
        raw.button.x = 12.7f;
        raw.button.y = -3.9f;

        auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->type(), noeul::EventType::mouse_button_down);
        EXPECT_EQ(e->mouse_button().button, noeul::mouse::Button::right);
        EXPECT_EQ(e->mouse_button().clicks, 2);
        EXPECT_EQ(e->mouse_button().x, 12);
        EXPECT_EQ(e->mouse_button().y, -3);

        raw.type = SDL_EVENT_MOUSE_BUTTON_UP;
        raw.button.down = true;
        e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->type(), noeul::EventType::mouse_button_up);
        EXPECT_TRUE(e->is_mouse_button());
    }

    TEST_F(EventTranslate, MotionStateReadsButtonRecord) {
        auto raw = ::make_raw(SDL_EVENT_MOUSE_MOTION);
        raw.motion.x = 100;
        raw.motion.y = 200;
        raw.motion.xrel = -5;
        raw.motion.yrel = 6;
        raw.button.down = true;

        auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        const auto& m = e->mouse_motion();
        EXPECT_EQ(m.state, noeul::mouse::State::pressed);
        EXPECT_EQ(m.x, 100);
        EXPECT_EQ(m.y, 200);
        EXPECT_EQ(m.rel_x, -5);
        EXPECT_EQ(m.rel_y, 6);

        // Left button held, but the byte the button record reads is clear
        raw.motion.state = SDL_BUTTON_LMASK;
        e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->mouse_motion().state, noeul::mouse::State::released);
    }

    TEST_F(EventTranslate, CoordinateNarrowing) {
        auto raw = ::make_raw(SDL_EVENT_MOUSE_BUTTON_DOWN);
        raw.button.x = 40000;
        raw.button.y = -40000;

        const auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->mouse_button().x, -25536);
        EXPECT_EQ(e->mouse_button().y, 25536);

        EXPECT_EQ(noeul::narrow_coord(65536.0), 0);
        EXPECT_EQ(noeul::narrow_coord(32767.9), 32767);
        EXPECT_EQ(noeul::narrow_coord(32768.0), -32768);
        EXPECT_EQ(noeul::narrow_coord(1e12), -1);
        EXPECT_EQ(noeul::narrow_coord(std::nan("")), 0);
    }

    TEST_F(EventTranslate, WheelUsesPositionAndDelta) {
        auto raw = ::make_raw(SDL_EVENT_MOUSE_WHEEL);
        raw.wheel.mouse_x = 300;
        raw.wheel.mouse_y = 400;
        raw.wheel.x = 1;
        raw.wheel.y = -2;
        raw.wheel.direction = SDL_MOUSEWHEEL_NORMAL;

        auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->mouse_wheel().x, 300);
        EXPECT_EQ(e->mouse_wheel().y, 400);
        EXPECT_EQ(e->mouse_wheel().delta_x, 1);
        EXPECT_EQ(e->mouse_wheel().delta_y, -2);

        raw.wheel.direction = SDL_MOUSEWHEEL_FLIPPED;
        e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->mouse_wheel().x, 300);
        EXPECT_EQ(e->mouse_wheel().delta_x, -1);
        EXPECT_EQ(e->mouse_wheel().delta_y, 2);
    }

    TEST_F(EventTranslate, WindowSubEvents) {
        auto raw = ::make_raw(SDL_EVENT_WINDOW_RESIZED);
        raw.window.windowID = 3;
        raw.window.data1 = 640;
        raw.window.data2 = 480;

        auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->window_id(), 3);
        EXPECT_EQ(e->window().id, noeul::WindowEventId::resized);
        EXPECT_EQ(e->window().data1, 640);
        EXPECT_EQ(e->window().data2, 480);

        e = this->translate(::make_raw(SDL_EVENT_WINDOW_OCCLUDED));
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->type(), noeul::EventType::window);
        EXPECT_EQ(e->window().id, noeul::WindowEventId::none);
    }

    TEST_F(EventTranslate, WindowIdMapping) {
        using noeul::WindowEventId;

        for (int i = 1; i <= static_cast<int>(WindowEventId::close); ++i) {
            const auto id = static_cast<WindowEventId>(i);
            const auto raw_type = noeul::to_raw_type(id);
            ASSERT_TRUE(raw_type.has_value()) << noeul::to_str(id);
            EXPECT_EQ(noeul::to_window_event_id(*raw_type), id);
        }

        EXPECT_FALSE(noeul::to_raw_type(WindowEventId::none).has_value());
    }

    TEST_F(EventTranslate, TextTruncated) {
        const std::string long_text(40, 'x');
        auto raw = ::make_raw(SDL_EVENT_TEXT_INPUT);
        raw.text.text = long_text.c_str();

        const auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        const auto str = e->text_input().str();
        EXPECT_EQ(str.size(), static_cast<size_t>(noeul::TEXT_SIZE - 1));
        EXPECT_EQ(str, long_text.substr(0, noeul::TEXT_SIZE - 1));
        EXPECT_EQ(e->text_input().text.back(), '\0');
    }

    TEST_F(EventTranslate, TextEditFields) {
        auto raw = ::make_raw(SDL_EVENT_TEXT_EDITING);
        raw.edit.text = "hangul";
        raw.edit.start = 2;
        raw.edit.length = 3;

        auto e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->text_edit().str(), "hangul");
        EXPECT_EQ(e->text_edit().start, 2);
        EXPECT_EQ(e->text_edit().length, 3);

        raw.edit.text = nullptr;
        e = this->translate(raw);
        ASSERT_TRUE(e.has_value());
        EXPECT_TRUE(e->text_edit().str().empty());
    }

    TEST_F(EventTranslate, PayloadMismatchThrows) {
        const auto e = this->translate(::make_raw(SDL_EVENT_QUIT));
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->timestamp(), 0);
        EXPECT_THROW(e->keyboard(), std::bad_variant_access);
        EXPECT_THROW(e->window(), std::bad_variant_access);
    }

}  // namespace


int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
