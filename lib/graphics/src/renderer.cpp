#include "noeul/graphics/renderer.hpp"

#include <stdexcept>

#include "noeul/lightweight/include_spdlog.hpp"


// Texture
namespace noeul {

    uint16_t Texture::width() const {
        return texture_ ? static_cast<uint16_t>(texture_->w) : 0;
    }

    uint16_t Texture::height() const {
        return texture_ ? static_cast<uint16_t>(texture_->h) : 0;
    }

    bool Texture::set_blend_mode(Surface::BlendMode mode) {
        if (!texture_)
            return false;
        return SDL_SetTextureBlendMode(
            texture_.get(), static_cast<SDL_BlendMode>(mode)
        );
    }

    bool Texture::set_color_mod(uint8_t r, uint8_t g, uint8_t b) {
        if (!texture_)
            return false;
        return SDL_SetTextureColorMod(texture_.get(), r, g, b);
    }

    bool Texture::set_alpha_mod(uint8_t alpha) {
        if (!texture_)
            return false;
        return SDL_SetTextureAlphaMod(texture_.get(), alpha);
    }

}  // namespace noeul


// Renderer
namespace noeul {

    Renderer::Renderer(SDL_Window* window) {
        NOEUL_ASSERT(window);

        renderer_.reset(SDL_CreateRenderer(window, nullptr));
        if (!renderer_) {
            const auto msg = fmt::format(
                "Failed to create renderer: {}", SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }
    }

    Renderer::Renderer(const Surface& target) : software_target_(target) {
        if (!target.is_valid())
            throw std::runtime_error("Software renderer needs a valid surface");

        software_surface_ = target.get();
        renderer_.reset(SDL_CreateSoftwareRenderer(software_surface_));
        if (!renderer_) {
            const auto msg = fmt::format(
                "Failed to create software renderer: {}", SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }
    }

    bool Renderer::is_valid() const {
        if (!renderer_)
            return false;
        if (software_surface_)
            return software_target_.get() == software_surface_;
        return true;
    }

    bool Renderer::present() {
        if (!this->is_valid())
            return false;
        return SDL_RenderPresent(renderer_.get());
    }

    bool Renderer::clear() {
        if (!this->is_valid())
            return false;
        return SDL_RenderClear(renderer_.get());
    }

    bool Renderer::set_draw_color(const Color& color) {
        if (!this->is_valid())
            return false;
        return SDL_SetRenderDrawColor(
            renderer_.get(), color.r_, color.g_, color.b_, color.a_
        );
    }

    Color Renderer::get_draw_color() const {
        Color out;
        if (!this->is_valid())
            return out;
        NOEUL_VERIFY_SDL(SDL_GetRenderDrawColor(
            renderer_.get(), &out.r_, &out.g_, &out.b_, &out.a_
        ));
        return out;
    }

    bool Renderer::set_blend_mode(Surface::BlendMode mode) {
        if (!this->is_valid())
            return false;
        return SDL_SetRenderDrawBlendMode(
            renderer_.get(), static_cast<SDL_BlendMode>(mode)
        );
    }

    Surface::BlendMode Renderer::get_blend_mode() const {
        SDL_BlendMode mode = SDL_BLENDMODE_NONE;
        if (this->is_valid())
            NOEUL_VERIFY_SDL(
                SDL_GetRenderDrawBlendMode(renderer_.get(), &mode)
            );
        return static_cast<Surface::BlendMode>(mode);
    }

    bool Renderer::set_viewport(const Rect* rect) {
        if (!this->is_valid())
            return false;
        if (!rect)
            return SDL_SetRenderViewport(renderer_.get(), nullptr);

        const auto r = rect->to_sdl();
        return SDL_SetRenderViewport(renderer_.get(), &r);
    }

    Rect Renderer::get_viewport() const {
        SDL_Rect out{ 0, 0, 0, 0 };
        if (this->is_valid())
            NOEUL_VERIFY_SDL(SDL_GetRenderViewport(renderer_.get(), &out));
        return Rect::from_sdl(out);
    }

    bool Renderer::draw_point(float x, float y) {
        if (!this->is_valid())
            return false;
        return SDL_RenderPoint(renderer_.get(), x, y);
    }

    bool Renderer::draw_line(float x1, float y1, float x2, float y2) {
        if (!this->is_valid())
            return false;
        return SDL_RenderLine(renderer_.get(), x1, y1, x2, y2);
    }

    bool Renderer::draw_rect(const Rect& rect) {
        if (!this->is_valid())
            return false;
        const auto r = rect.to_sdl_f();
        return SDL_RenderRect(renderer_.get(), &r);
    }

    bool Renderer::fill_rect(const Rect& rect) {
        if (!this->is_valid())
            return false;
        const auto r = rect.to_sdl_f();
        return SDL_RenderFillRect(renderer_.get(), &r);
    }

    Texture Renderer::create_texture(const Surface& surface) {
        if (!this->is_valid()) {
            SPDLOG_WARN("Texture requested from an invalid renderer");
            return Texture{};
        }
        if (!surface.is_valid()) {
            SPDLOG_WARN("Texture requested from an invalid surface");
            return Texture{};
        }

        auto raw = SDL_CreateTextureFromSurface(renderer_.get(), surface.get());
        if (!raw)
            SPDLOG_WARN("Failed to create texture: {}", SDL_GetError());
        return Texture{ raw };
    }

    Texture Renderer::create_target_texture(
        uint16_t width, uint16_t height, SDL_PixelFormat format
    ) {
        if (!this->is_valid()) {
            SPDLOG_WARN("Texture requested from an invalid renderer");
            return Texture{};
        }

        auto raw = SDL_CreateTexture(
            renderer_.get(), format, SDL_TEXTUREACCESS_TARGET, width, height
        );
        if (!raw)
            SPDLOG_WARN("Failed to create target texture: {}", SDL_GetError());
        return Texture{ raw };
    }

    bool Renderer::copy(
        const Texture& texture, const Rect* src, const Rect* dst
    ) {
        if (!this->is_valid() || !texture.is_valid())
            return false;

        SDL_FRect s, d;
        if (src)
            s = src->to_sdl_f();
        if (dst)
            d = dst->to_sdl_f();

        return SDL_RenderTexture(
            renderer_.get(),
            texture.get(),
            src ? &s : nullptr,
            dst ? &d : nullptr
        );
    }

    bool Renderer::set_target(const Texture* texture) {
        if (!this->is_valid())
            return false;
        return SDL_SetRenderTarget(
            renderer_.get(), texture ? texture->get() : nullptr
        );
    }

    Surface Renderer::read_pixels(const Rect* area) {
        if (!this->is_valid()) {
            SPDLOG_WARN("Pixels requested from an invalid renderer");
            return Surface{};
        }

        SDL_Surface* raw = nullptr;
        if (area) {
            const auto r = area->to_sdl();
            raw = SDL_RenderReadPixels(renderer_.get(), &r);
        } else {
            raw = SDL_RenderReadPixels(renderer_.get(), nullptr);
        }

        if (!raw) {
            SPDLOG_WARN("Failed to read pixels: {}", SDL_GetError());
            return Surface{};
        }
        return Surface::adopt(raw);
    }

}  // namespace noeul
