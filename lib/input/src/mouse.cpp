#include "noeul/input/mouse.hpp"

#include <SDL3/SDL_error.h>

#include "noeul/lightweight/include_spdlog.hpp"


namespace noeul::mouse {

    glm::vec2 get_position() {
        glm::vec2 out{ 0 };
        SDL_GetMouseState(&out.x, &out.y);
        return out;
    }

    glm::vec2 get_global_position() {
        glm::vec2 out{ 0 };
        SDL_GetGlobalMouseState(&out.x, &out.y);
        return out;
    }

    bool is_pressed(Button button) {
        const auto flags = SDL_GetMouseState(nullptr, nullptr);
        return 0 != (flags & SDL_BUTTON_MASK(static_cast<int>(button)));
    }

    bool set_relative_mode(SDL_Window* window, bool enable) {
        NOEUL_ASSERT(nullptr != window);

        if (enable == SDL_GetWindowRelativeMouseMode(window))
            return true;

        if (!SDL_SetWindowRelativeMouseMode(window, enable)) {
            SPDLOG_ERROR(
                "Failed to set relative mouse mode: {}", SDL_GetError()
            );
            return false;
        }

        return true;
    }

    bool is_relative_mode(SDL_Window* window) {
        NOEUL_ASSERT(nullptr != window);
        return SDL_GetWindowRelativeMouseMode(window);
    }

    void warp(SDL_Window* window, float x, float y) {
        SDL_WarpMouseInWindow(window, x, y);
    }

    bool show_cursor(bool show) {
        const auto result = show ? SDL_ShowCursor() : SDL_HideCursor();
        NOEUL_VERIFYM(result, "Failed to toggle cursor: {}", SDL_GetError());
        return result;
    }

}  // namespace noeul::mouse
