#pragma once

#include <cstdint>

#include <SDL3/SDL_pixels.h>


namespace noeul {

    struct Color {
        constexpr Color() = default;
        constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
            : r_(r), g_(g), b_(b), a_(a) {}

        SDL_Color to_sdl() const { return SDL_Color{ r_, g_, b_, a_ }; }

        bool operator==(const Color& rhs) const {
            return r_ == rhs.r_ && g_ == rhs.g_ && b_ == rhs.b_ &&
                   a_ == rhs.a_;
        }
        bool operator!=(const Color& rhs) const { return !(*this == rhs); }

        uint8_t r_ = 0;
        uint8_t g_ = 0;
        uint8_t b_ = 0;
        uint8_t a_ = 255;
    };


    namespace colors {

        constexpr Color black{ 0, 0, 0 };
        constexpr Color white{ 255, 255, 255 };
        constexpr Color red{ 255, 0, 0 };
        constexpr Color green{ 0, 255, 0 };
        constexpr Color blue{ 0, 0, 255 };

    }  // namespace colors

}  // namespace noeul
