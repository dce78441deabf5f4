#pragma once

#include <memory>
#include <optional>

#include <SDL3/SDL_render.h>

#include "noeul/graphics/surface.hpp"


namespace noeul {

    // Must not outlive the Renderer that created it. SDL destroys a
    // renderer's textures along with it.
    class Texture {

    public:
        Texture() = default;
        // Takes ownership of `raw`
        explicit Texture(SDL_Texture* raw) : texture_(raw) {}

        bool is_valid() const { return texture_ != nullptr; }
        uint16_t width() const;
        uint16_t height() const;

        bool set_blend_mode(Surface::BlendMode mode);
        bool set_color_mod(uint8_t r, uint8_t g, uint8_t b);
        bool set_alpha_mod(uint8_t alpha);

        SDL_Texture* get() const { return texture_.get(); }

    private:
        struct Deleter {
            void operator()(SDL_Texture* ptr) const { SDL_DestroyTexture(ptr); }
        };

        std::unique_ptr<SDL_Texture, Deleter> texture_;
    };


    class Renderer {

    public:
        // Throws std::runtime_error if SDL cannot create a renderer
        explicit Renderer(SDL_Window* window);
        // Draws into `target`. If any copy of `target` frees or replaces
        // its pixels (free, load_bmp, adapt_to) the renderer becomes
        // invalid and every call on it fails.
        explicit Renderer(const Surface& target);

        bool is_valid() const;

        bool present();
        bool clear();

        bool set_draw_color(const Color& color);
        Color get_draw_color() const;

        bool set_blend_mode(Surface::BlendMode mode);
        Surface::BlendMode get_blend_mode() const;

        // Null resets the viewport to the whole target
        bool set_viewport(const Rect* rect);
        Rect get_viewport() const;

        bool draw_point(float x, float y);
        bool draw_line(float x1, float y1, float x2, float y2);
        bool draw_rect(const Rect& rect);
        bool fill_rect(const Rect& rect);

        Texture create_texture(const Surface& surface);
        Texture create_target_texture(
            uint16_t width,
            uint16_t height,
            SDL_PixelFormat format = Surface::DEFAULT_FORMAT
        );
        // Null `src` copies the whole texture. Null `dst` fills the target.
        bool copy(
            const Texture& texture,
            const Rect* src = nullptr,
            const Rect* dst = nullptr
        );

        // Null restores the default target
        bool set_target(const Texture* texture);

        // Null `area` reads the whole viewport. Invalid surface on failure.
        Surface read_pixels(const Rect* area = nullptr);

        SDL_Renderer* get() const { return renderer_.get(); }

    private:
        struct Deleter {
            void operator()(SDL_Renderer* ptr) const {
                SDL_DestroyRenderer(ptr);
            }
        };

        // Outlives `renderer_`
        Surface software_target_;
        SDL_Surface* software_surface_ = nullptr;
        std::unique_ptr<SDL_Renderer, Deleter> renderer_;
    };

}  // namespace noeul
