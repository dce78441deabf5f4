#pragma once

#include <cstdint>

#include <SDL3/SDL_keyboard.h>
#include <SDL3/SDL_keycode.h>
#include <SDL3/SDL_scancode.h>


namespace noeul::key {

    enum class State : uint8_t { released, pressed };


    // Values are SDL keycodes. Keys not named here still round-trip through
    // static_cast.
    enum class Code : uint32_t {
        unknown = SDLK_UNKNOWN,

        enter = SDLK_RETURN,
        escape = SDLK_ESCAPE,
        backspace = SDLK_BACKSPACE,
        tab = SDLK_TAB,
        space = SDLK_SPACE,

        num0 = SDLK_0,
        num1 = SDLK_1,
        num2 = SDLK_2,
        num3 = SDLK_3,
        num4 = SDLK_4,
        num5 = SDLK_5,
        num6 = SDLK_6,
        num7 = SDLK_7,
        num8 = SDLK_8,
        num9 = SDLK_9,

        a = SDLK_A,
        b = SDLK_B,
        c = SDLK_C,
        d = SDLK_D,
        e = SDLK_E,
        f = SDLK_F,
        g = SDLK_G,
        h = SDLK_H,
        i = SDLK_I,
        j = SDLK_J,
        k = SDLK_K,
        l = SDLK_L,
        m = SDLK_M,
        n = SDLK_N,
        o = SDLK_O,
        p = SDLK_P,
        q = SDLK_Q,
        r = SDLK_R,
        s = SDLK_S,
        t = SDLK_T,
        u = SDLK_U,
        v = SDLK_V,
        w = SDLK_W,
        x = SDLK_X,
        y = SDLK_Y,
        z = SDLK_Z,

        f1 = SDLK_F1,
        f2 = SDLK_F2,
        f3 = SDLK_F3,
        f4 = SDLK_F4,
        f5 = SDLK_F5,
        f6 = SDLK_F6,
        f7 = SDLK_F7,
        f8 = SDLK_F8,
        f9 = SDLK_F9,
        f10 = SDLK_F10,
        f11 = SDLK_F11,
        f12 = SDLK_F12,

        insert = SDLK_INSERT,
        del = SDLK_DELETE,
        home = SDLK_HOME,
        end = SDLK_END,
        page_up = SDLK_PAGEUP,
        page_down = SDLK_PAGEDOWN,

        right = SDLK_RIGHT,
        left = SDLK_LEFT,
        down = SDLK_DOWN,
        up = SDLK_UP,

        lctrl = SDLK_LCTRL,
        lshift = SDLK_LSHIFT,
        lalt = SDLK_LALT,
        lgui = SDLK_LGUI,
        rctrl = SDLK_RCTRL,
        rshift = SDLK_RSHIFT,
        ralt = SDLK_RALT,
        rgui = SDLK_RGUI,
    };


    // Values are SDL scancodes, i.e. physical key positions.
    enum class ScanCode : uint32_t {
        unknown = SDL_SCANCODE_UNKNOWN,

        a = SDL_SCANCODE_A,
        b = SDL_SCANCODE_B,
        c = SDL_SCANCODE_C,
        d = SDL_SCANCODE_D,
        e = SDL_SCANCODE_E,
        f = SDL_SCANCODE_F,
        g = SDL_SCANCODE_G,
        h = SDL_SCANCODE_H,
        i = SDL_SCANCODE_I,
        j = SDL_SCANCODE_J,
        k = SDL_SCANCODE_K,
        l = SDL_SCANCODE_L,
        m = SDL_SCANCODE_M,
        n = SDL_SCANCODE_N,
        o = SDL_SCANCODE_O,
        p = SDL_SCANCODE_P,
        q = SDL_SCANCODE_Q,
        r = SDL_SCANCODE_R,
        s = SDL_SCANCODE_S,
        t = SDL_SCANCODE_T,
        u = SDL_SCANCODE_U,
        v = SDL_SCANCODE_V,
        w = SDL_SCANCODE_W,
        x = SDL_SCANCODE_X,
        y = SDL_SCANCODE_Y,
        z = SDL_SCANCODE_Z,

        num1 = SDL_SCANCODE_1,
        num2 = SDL_SCANCODE_2,
        num3 = SDL_SCANCODE_3,
        num4 = SDL_SCANCODE_4,
        num5 = SDL_SCANCODE_5,
        num6 = SDL_SCANCODE_6,
        num7 = SDL_SCANCODE_7,
        num8 = SDL_SCANCODE_8,
        num9 = SDL_SCANCODE_9,
        num0 = SDL_SCANCODE_0,

        enter = SDL_SCANCODE_RETURN,
        escape = SDL_SCANCODE_ESCAPE,
        backspace = SDL_SCANCODE_BACKSPACE,
        tab = SDL_SCANCODE_TAB,
        space = SDL_SCANCODE_SPACE,

        f1 = SDL_SCANCODE_F1,
        f2 = SDL_SCANCODE_F2,
        f3 = SDL_SCANCODE_F3,
        f4 = SDL_SCANCODE_F4,
        f5 = SDL_SCANCODE_F5,
        f6 = SDL_SCANCODE_F6,
        f7 = SDL_SCANCODE_F7,
        f8 = SDL_SCANCODE_F8,
        f9 = SDL_SCANCODE_F9,
        f10 = SDL_SCANCODE_F10,
        f11 = SDL_SCANCODE_F11,
        f12 = SDL_SCANCODE_F12,

        right = SDL_SCANCODE_RIGHT,
        left = SDL_SCANCODE_LEFT,
        down = SDL_SCANCODE_DOWN,
        up = SDL_SCANCODE_UP,

        lctrl = SDL_SCANCODE_LCTRL,
        lshift = SDL_SCANCODE_LSHIFT,
        lalt = SDL_SCANCODE_LALT,
        lgui = SDL_SCANCODE_LGUI,
        rctrl = SDL_SCANCODE_RCTRL,
        rshift = SDL_SCANCODE_RSHIFT,
        ralt = SDL_SCANCODE_RALT,
        rgui = SDL_SCANCODE_RGUI,
    };


    // Bit flags, values are SDL_Keymod bits
    enum class Mod : uint16_t {
        none = SDL_KMOD_NONE,
        lshift = SDL_KMOD_LSHIFT,
        rshift = SDL_KMOD_RSHIFT,
        lctrl = SDL_KMOD_LCTRL,
        rctrl = SDL_KMOD_RCTRL,
        lalt = SDL_KMOD_LALT,
        ralt = SDL_KMOD_RALT,
        lgui = SDL_KMOD_LGUI,
        rgui = SDL_KMOD_RGUI,
        num = SDL_KMOD_NUM,
        caps = SDL_KMOD_CAPS,
        mode = SDL_KMOD_MODE,
        scroll = SDL_KMOD_SCROLL,

        shift = SDL_KMOD_SHIFT,
        ctrl = SDL_KMOD_CTRL,
        alt = SDL_KMOD_ALT,
        gui = SDL_KMOD_GUI,
    };

    constexpr Mod operator|(Mod a, Mod b) {
        return static_cast<Mod>(
            static_cast<uint16_t>(a) | static_cast<uint16_t>(b)
        );
    }

    constexpr Mod operator&(Mod a, Mod b) {
        return static_cast<Mod>(
            static_cast<uint16_t>(a) & static_cast<uint16_t>(b)
        );
    }

    // True if any bit of `flag` is set in `mask`
    constexpr bool has_mod(Mod mask, Mod flag) {
        return (mask & flag) != Mod::none;
    }


    Mod get_modifier();
    void set_modifier(Mod mod);

    bool is_pressed(ScanCode scancode);
    Code to_code(ScanCode scancode, Mod mod = Mod::none);
    const char* get_name(Code code);

    bool start_text_input(SDL_Window* window);
    bool stop_text_input(SDL_Window* window);


    // Source of the modifier mask attached to translated key events
    class IKeyboardState {

    public:
        virtual ~IKeyboardState() = default;
        virtual Mod current_modifiers() const = 0;
    };


    class SdlKeyboardState : public IKeyboardState {

    public:
        Mod current_modifiers() const override;
    };

}  // namespace noeul::key
