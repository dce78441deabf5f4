#pragma once

#include <cstdint>

#include <SDL3/SDL_rect.h>


namespace noeul {

    struct Rect {
        constexpr Rect() = default;
        constexpr Rect(int16_t x, int16_t y, uint16_t w, uint16_t h)
            : x_(x), y_(y), w_(w), h_(h) {}

        static Rect from_sdl(const SDL_Rect& r) {
            return Rect{ static_cast<int16_t>(r.x),
                         static_cast<int16_t>(r.y),
                         static_cast<uint16_t>(r.w),
                         static_cast<uint16_t>(r.h) };
        }

        SDL_Rect to_sdl() const { return SDL_Rect{ x_, y_, w_, h_ }; }

        SDL_FRect to_sdl_f() const {
            return SDL_FRect{ static_cast<float>(x_),
                              static_cast<float>(y_),
                              static_cast<float>(w_),
                              static_cast<float>(h_) };
        }

        bool is_empty() const { return w_ == 0 || h_ == 0; }

        bool contains(int x, int y) const {
            return x >= x_ && y >= y_ && x < x_ + w_ && y < y_ + h_;
        }

        bool operator==(const Rect& rhs) const {
            return x_ == rhs.x_ && y_ == rhs.y_ && w_ == rhs.w_ &&
                   h_ == rhs.h_;
        }

        int16_t x_ = 0;
        int16_t y_ = 0;
        uint16_t w_ = 0;
        uint16_t h_ = 0;
    };

}  // namespace noeul
