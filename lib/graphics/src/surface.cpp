#include "noeul/graphics/surface.hpp"

#include <cstring>
#include <stdexcept>

#include "noeul/lightweight/include_spdlog.hpp"


namespace {

    SDL_Surface* create_or_throw(
        uint16_t width, uint16_t height, SDL_PixelFormat format
    ) {
        auto raw = SDL_CreateSurface(width, height, format);
        if (!raw) {
            const auto msg = fmt::format(
                "Failed to create surface {}x{}: {}",
                width,
                height,
                SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }
        return raw;
    }

    // Holds an SDL lock while the raw pixels are touched, if SDL needs one.
    // RLE encoded surfaces get their pixels back only while locked.
    class PixelLock {

    public:
        explicit PixelLock(SDL_Surface* surface) : surface_(surface) {
            if (SDL_MUSTLOCK(surface_)) {
                if (!SDL_LockSurface(surface_)) {
                    const auto msg = fmt::format(
                        "Failed to lock surface: {}", SDL_GetError()
                    );
                    SPDLOG_ERROR("{}", msg);
                    throw std::runtime_error(msg);
                }
                locked_ = true;
            }

            if (!surface_->pixels) {
                this->release();
                throw std::runtime_error("Surface has no pixel memory");
            }
        }

        ~PixelLock() { this->release(); }

        PixelLock(const PixelLock&) = delete;
        PixelLock& operator=(const PixelLock&) = delete;

    private:
        void release() {
            if (locked_)
                SDL_UnlockSurface(surface_);
            locked_ = false;
        }

        SDL_Surface* surface_;
        bool locked_ = false;
    };


    uint32_t& pixel_ref(SDL_Surface& s, uint16_t x, uint16_t y) {
        auto row = static_cast<uint8_t*>(s.pixels) + y * s.pitch;
        return reinterpret_cast<uint32_t*>(row)[x];
    }

}  // namespace


// Surface::Handle
namespace noeul {

    void Surface::Handle::reset(SDL_Surface* ptr) {
        this->terminate();
        ptr_ = ptr;
    }

    void Surface::Handle::terminate() {
        if (ptr_) {
            SDL_DestroySurface(ptr_);
            ptr_ = nullptr;
        }
    }

}  // namespace noeul


// Surface
namespace noeul {

    Surface::Surface(SDL_Surface* raw)
        : target_(std::make_shared<Handle>(raw)) {}

    Surface::Surface(const std::filesystem::path& bmp_path) {
        this->load_bmp(bmp_path);
    }

    Surface Surface::make(
        uint16_t width, uint16_t height, SDL_PixelFormat format
    ) {
        return Surface{ ::create_or_throw(width, height, format) };
    }

    Surface Surface::make_from(
        void* pixels,
        uint16_t width,
        uint16_t height,
        int pitch,
        SDL_PixelFormat format
    ) {
        auto raw = SDL_CreateSurfaceFrom(width, height, format, pixels, pitch);
        if (!raw) {
            const auto msg = fmt::format(
                "Failed to wrap pixel memory: {}", SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }
        return Surface{ raw };
    }

    Surface Surface::adopt(SDL_Surface* raw) {
        if (!raw)
            throw std::runtime_error("Cannot adopt a null surface");
        return Surface{ raw };
    }

    void Surface::load_bmp(const std::filesystem::path& path) {
        auto raw = SDL_LoadBMP(path.u8string().c_str());
        if (!raw) {
            const auto msg = fmt::format(
                "Failed to load image '{}': {}", path.u8string(), SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }

        if (target_)
            target_->reset(raw);
        else
            target_ = std::make_shared<Handle>(raw);
        filename_ = path.u8string();
    }

    void Surface::save_bmp(const std::filesystem::path& path) const {
        if (!this->is_valid())
            throw std::runtime_error("Cannot save an invalid surface");

        if (!SDL_SaveBMP(this->get(), path.u8string().c_str())) {
            const auto msg = fmt::format(
                "Failed to save image '{}': {}", path.u8string(), SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }
    }

    void Surface::free() {
        if (target_)
            target_->terminate();
    }

    long Surface::use_count() const { return target_.use_count(); }

    bool Surface::is_valid() const { return target_ && target_->ptr_; }

    bool Surface::fill(const Color& color, const Rect* area) {
        if (!this->is_valid())
            return false;

        const auto mapped = this->map_color(color);
        if (area) {
            const auto rect = area->to_sdl();
            return SDL_FillSurfaceRect(this->get(), &rect, mapped);
        }
        return SDL_FillSurfaceRect(this->get(), nullptr, mapped);
    }

    bool Surface::fill_areas(
        const Color& color, const std::vector<Rect>& areas
    ) {
        if (!this->is_valid())
            return false;
        if (areas.empty())
            return true;

        std::vector<SDL_Rect> rects;
        rects.reserve(areas.size());
        for (auto& x : areas) rects.push_back(x.to_sdl());

        return SDL_FillSurfaceRects(
            this->get(),
            rects.data(),
            static_cast<int>(rects.size()),
            this->map_color(color)
        );
    }

    bool Surface::set_rle(bool enable) {
        if (!this->is_valid())
            return false;
        return SDL_SetSurfaceRLE(this->get(), enable);
    }

    bool Surface::lock() {
        if (!this->is_valid())
            return false;
        return SDL_LockSurface(this->get());
    }

    void Surface::unlock() {
        if (this->is_valid())
            SDL_UnlockSurface(this->get());
    }

    bool Surface::is_locked() const {
        if (!this->is_valid())
            return false;
        return (this->get()->flags & SDL_SURFACE_LOCKED) != 0;
    }

    bool Surface::must_lock() const {
        if (!this->is_valid())
            return false;
        return SDL_MUSTLOCK(this->get());
    }

    void Surface::adapt_to(SDL_PixelFormat format) {
        if (!this->is_valid())
            throw std::runtime_error("Cannot convert an invalid surface");
        if (this->format() == format)
            return;

        auto converted = SDL_ConvertSurface(this->get(), format);
        if (!converted) {
            const auto msg = fmt::format(
                "Failed to convert surface to {}: {}",
                SDL_GetPixelFormatName(format),
                SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }
        target_->reset(converted);
    }

    void Surface::adapt_to(const Surface& other) {
        if (!other.is_valid())
            throw std::runtime_error("Cannot convert to an invalid surface");
        this->adapt_to(other.format());
    }

    bool Surface::set_color_key(const Color& color) {
        if (!this->is_valid())
            return false;
        return SDL_SetSurfaceColorKey(
            this->get(), true, this->map_color(color)
        );
    }

    bool Surface::clear_color_key() {
        if (!this->is_valid())
            return false;
        return SDL_SetSurfaceColorKey(this->get(), false, 0);
    }

    std::optional<Color> Surface::get_color_key() const {
        if (!this->is_valid())
            return std::nullopt;

        uint32_t key = 0;
        if (!SDL_GetSurfaceColorKey(this->get(), &key))
            return std::nullopt;

        Color out;
        SDL_GetRGBA(
            key,
            SDL_GetPixelFormatDetails(this->format()),
            SDL_GetSurfacePalette(this->get()),
            &out.r_,
            &out.g_,
            &out.b_,
            &out.a_
        );
        return out;
    }

    bool Surface::set_alpha_mod(uint8_t alpha) {
        if (!this->is_valid())
            return false;
        return SDL_SetSurfaceAlphaMod(this->get(), alpha);
    }

    uint8_t Surface::get_alpha_mod() const {
        uint8_t alpha = 0;
        if (this->is_valid())
            NOEUL_VERIFY_SDL(SDL_GetSurfaceAlphaMod(this->get(), &alpha));
        return alpha;
    }

    bool Surface::set_blend_mode(BlendMode mode) {
        if (!this->is_valid())
            return false;
        return SDL_SetSurfaceBlendMode(
            this->get(), static_cast<SDL_BlendMode>(mode)
        );
    }

    Surface::BlendMode Surface::get_blend_mode() const {
        SDL_BlendMode mode = SDL_BLENDMODE_NONE;
        if (this->is_valid())
            NOEUL_VERIFY_SDL(SDL_GetSurfaceBlendMode(this->get(), &mode));
        return static_cast<BlendMode>(mode);
    }

    Rect Surface::get_clip_rect() const {
        SDL_Rect out{ 0, 0, 0, 0 };
        if (this->is_valid())
            NOEUL_VERIFY_SDL(SDL_GetSurfaceClipRect(this->get(), &out));
        return Rect::from_sdl(out);
    }

    bool Surface::set_clip_rect(const Rect& clip) {
        if (!this->is_valid())
            return false;
        const auto rect = clip.to_sdl();
        return SDL_SetSurfaceClipRect(this->get(), &rect);
    }

    uint16_t Surface::width() const {
        return this->is_valid() ? static_cast<uint16_t>(this->get()->w) : 0;
    }

    uint16_t Surface::height() const {
        return this->is_valid() ? static_cast<uint16_t>(this->get()->h) : 0;
    }

    int Surface::pitch() const {
        return this->is_valid() ? this->get()->pitch : 0;
    }

    uint8_t Surface::bits() const {
        if (!this->is_valid())
            return 0;
        return SDL_BITSPERPIXEL(this->format());
    }

    uint8_t Surface::bytes() const {
        if (!this->is_valid())
            return 0;
        return SDL_BYTESPERPIXEL(this->format());
    }

    SDL_PixelFormat Surface::format() const {
        if (!this->is_valid())
            return SDL_PIXELFORMAT_UNKNOWN;
        return this->get()->format;
    }

    void* Surface::pixels() {
        return this->is_valid() ? this->get()->pixels : nullptr;
    }

    const void* Surface::pixels() const {
        return this->is_valid() ? this->get()->pixels : nullptr;
    }

    uint32_t Surface::map_color(const Color& color) const {
        if (!this->is_valid())
            return 0;
        return SDL_MapSurfaceRGBA(
            this->get(), color.r_, color.g_, color.b_, color.a_
        );
    }

    bool Surface::is_mask(Mask mask, const Color& color) const {
        return this->is_mask(mask, this->map_color(color));
    }

    bool Surface::is_mask(Mask mask, uint32_t mapped) const {
        if (!this->is_valid())
            return false;

        const auto details = SDL_GetPixelFormatDetails(this->format());
        if (!details)
            return false;

        switch (mask) {
            case Mask::red:
                return details->Rmask == mapped;
            case Mask::green:
                return details->Gmask == mapped;
            case Mask::blue:
                return details->Bmask == mapped;
            case Mask::alpha:
                return details->Amask == mapped;
        }
        return false;
    }

    uint32_t Surface::get_pixel_at(uint16_t x, uint16_t y) const {
        if (!this->is_valid())
            throw std::runtime_error("Pixel access on an invalid surface");
        if (this->bytes() != 4)
            throw std::runtime_error("Pixel access needs a 32 bit format");
        if (x >= this->width() || y >= this->height())
            throw std::out_of_range(fmt::format(
                "Pixel ({}, {}) outside of {}x{} surface",
                x,
                y,
                this->width(),
                this->height()
            ));

        ::PixelLock lock{ this->get() };
        return ::pixel_ref(*this->get(), x, y);
    }

    void Surface::put_pixel_at(uint16_t x, uint16_t y, uint32_t pixel) {
        if (!this->is_valid())
            throw std::runtime_error("Pixel access on an invalid surface");
        if (this->bytes() != 4)
            throw std::runtime_error("Pixel access needs a 32 bit format");
        if (x >= this->width() || y >= this->height())
            throw std::out_of_range(fmt::format(
                "Pixel ({}, {}) outside of {}x{} surface",
                x,
                y,
                this->width(),
                this->height()
            ));

        ::PixelLock lock{ this->get() };
        ::pixel_ref(*this->get(), x, y) = pixel;
    }

    Color Surface::get_color_at(uint16_t x, uint16_t y) const {
        const auto pixel = this->get_pixel_at(x, y);

        Color out;
        SDL_GetRGBA(
            pixel,
            SDL_GetPixelFormatDetails(this->format()),
            SDL_GetSurfacePalette(this->get()),
            &out.r_,
            &out.g_,
            &out.b_,
            &out.a_
        );
        return out;
    }

    bool Surface::blit(
        const Surface& src, const Rect* src_rect, const Rect* dst_pos
    ) {
        if (!this->is_valid() || !src.is_valid())
            return false;

        SDL_Rect s, d;
        if (src_rect)
            s = src_rect->to_sdl();
        if (dst_pos)
            d = dst_pos->to_sdl();

        return SDL_BlitSurface(
            src.get(),
            src_rect ? &s : nullptr,
            this->get(),
            dst_pos ? &d : nullptr
        );
    }

    bool Surface::blit_scaled(
        const Surface& src, const Rect* src_rect, const Rect* dst_rect
    ) {
        if (!this->is_valid() || !src.is_valid())
            return false;

        SDL_Rect s, d;
        if (src_rect)
            s = src_rect->to_sdl();
        if (dst_rect)
            d = dst_rect->to_sdl();

        return SDL_BlitSurfaceScaled(
            src.get(),
            src_rect ? &s : nullptr,
            this->get(),
            dst_rect ? &d : nullptr,
            SDL_SCALEMODE_NEAREST
        );
    }

    Surface Surface::sub_surface(const Rect& area) const {
        if (!this->is_valid())
            throw std::runtime_error("Cannot cut an invalid surface");

        auto out = Surface::make(area.w_, area.h_, this->format());
        const auto rect = area.to_sdl();
        if (!SDL_BlitSurface(this->get(), &rect, out.get(), nullptr)) {
            const auto msg = fmt::format(
                "Failed to copy sub surface: {}", SDL_GetError()
            );
            SPDLOG_ERROR("{}", msg);
            throw std::runtime_error(msg);
        }
        return out;
    }

    Surface Surface::flip(Flip mode) const {
        if (!this->is_valid())
            throw std::runtime_error("Cannot flip an invalid surface");
        if (this->bits() < 8)
            throw std::runtime_error(fmt::format(
                "Cannot flip {}, needs at least 8 bits per pixel",
                SDL_GetPixelFormatName(this->format())
            ));

        const auto w = this->width();
        const auto h = this->height();
        const auto row_size = static_cast<size_t>(w) * this->bytes();
        const auto bpp = this->bytes();
        auto out = Surface::make(w, h, this->format());

        ::PixelLock src_lock{ this->get() };
        ::PixelLock dst_lock{ out.get() };
        auto src = static_cast<const uint8_t*>(this->get()->pixels);
        auto dst = static_cast<uint8_t*>(out.get()->pixels);
        const auto src_pitch = this->pitch();
        const auto dst_pitch = out.pitch();

        const bool flip_v = mode == Flip::vertical || mode == Flip::both;
        const bool flip_h = mode == Flip::horizontal || mode == Flip::both;

        for (uint16_t y = 0; y < h; ++y) {
            const auto src_y = flip_v ? h - 1 - y : y;
            auto src_row = src + src_y * src_pitch;
            auto dst_row = dst + y * dst_pitch;

            if (!flip_h) {
                std::memcpy(dst_row, src_row, row_size);
                continue;
            }

            for (uint16_t x = 0; x < w; ++x) {
                std::memcpy(
                    dst_row + x * bpp, src_row + (w - 1 - x) * bpp, bpp
                );
            }
        }

        return out;
    }

    SDL_Surface* Surface::get() const {
        return target_ ? target_->ptr_ : nullptr;
    }

}  // namespace noeul
