#pragma once

#include <cstdint>

#include <SDL3/SDL_mouse.h>
#include <glm/vec2.hpp>


namespace noeul::mouse {

    enum class State : uint8_t { released, pressed };

    enum class Button : uint8_t {
        left = SDL_BUTTON_LEFT,
        middle = SDL_BUTTON_MIDDLE,
        right = SDL_BUTTON_RIGHT,
        x1 = SDL_BUTTON_X1,
        x2 = SDL_BUTTON_X2,
    };


    // Position relative to the focused window
    glm::vec2 get_position();
    glm::vec2 get_global_position();

    bool is_pressed(Button button);

    bool set_relative_mode(SDL_Window* window, bool enable);
    bool is_relative_mode(SDL_Window* window);

    void warp(SDL_Window* window, float x, float y);

    bool show_cursor(bool show);

}  // namespace noeul::mouse
