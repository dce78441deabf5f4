#include "noeul/input/keyboard.hpp"

#include <SDL3/SDL_error.h>

#include "noeul/lightweight/include_spdlog.hpp"


namespace noeul::key {

    Mod get_modifier() { return static_cast<Mod>(SDL_GetModState()); }

    void set_modifier(Mod mod) {
        SDL_SetModState(static_cast<SDL_Keymod>(mod));
    }

    bool is_pressed(ScanCode scancode) {
        int count = 0;
        const auto states = SDL_GetKeyboardState(&count);
        if (nullptr == states)
            return false;

        const auto index = static_cast<int>(scancode);
        if (index < 0 || index >= count)
            return false;

        return states[index];
    }

    Code to_code(ScanCode scancode, Mod mod) {
        const auto keycode = SDL_GetKeyFromScancode(
            static_cast<SDL_Scancode>(scancode),
            static_cast<SDL_Keymod>(mod),
            false
        );
        return static_cast<Code>(keycode);
    }

    const char* get_name(Code code) {
        return SDL_GetKeyName(static_cast<SDL_Keycode>(code));
    }

    bool start_text_input(SDL_Window* window) {
        if (!SDL_StartTextInput(window)) {
            SPDLOG_WARN("Failed to start text input: {}", SDL_GetError());
            return false;
        }
        return true;
    }

    bool stop_text_input(SDL_Window* window) {
        if (!SDL_StopTextInput(window)) {
            SPDLOG_WARN("Failed to stop text input: {}", SDL_GetError());
            return false;
        }
        return true;
    }

}  // namespace noeul::key


// SdlKeyboardState
namespace noeul::key {

    Mod SdlKeyboardState::current_modifiers() const {
        return key::get_modifier();
    }

}  // namespace noeul::key
