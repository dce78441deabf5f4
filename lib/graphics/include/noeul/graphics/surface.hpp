#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <SDL3/SDL_surface.h>

#include "noeul/graphics/color.hpp"
#include "noeul/graphics/rect.hpp"


namespace noeul {

    /**
     * Reference counted handle to an SDL_Surface.
     *
     * Copies share the same pixels. The surface is destroyed when the last
     * copy goes away, or for every copy at once by free().
     */
    class Surface {

    public:
        enum class BlendMode : uint32_t {
            none = SDL_BLENDMODE_NONE,    // No blending
            blend = SDL_BLENDMODE_BLEND,  // dst = (src * A) + (dst * (1-A))
            add = SDL_BLENDMODE_ADD,      // dst = (src * A) + dst
            mod = SDL_BLENDMODE_MOD,      // dst = src * dst
        };

        enum class Mask : uint8_t { red = 1, green = 2, blue = 4, alpha = 8 };

        enum class Flip : uint8_t { vertical = 1, horizontal = 2, both = 3 };

        static constexpr SDL_PixelFormat DEFAULT_FORMAT =
            SDL_PIXELFORMAT_RGBA32;

    public:
        Surface() = default;
        // Throws std::runtime_error if the file cannot be loaded
        explicit Surface(const std::filesystem::path& bmp_path);

        static Surface make(
            uint16_t width,
            uint16_t height,
            SDL_PixelFormat format = DEFAULT_FORMAT
        );
        // `pixels` is borrowed and must outlive every copy of the result
        static Surface make_from(
            void* pixels,
            uint16_t width,
            uint16_t height,
            int pitch,
            SDL_PixelFormat format = DEFAULT_FORMAT
        );
        // Takes ownership of `raw`
        static Surface adopt(SDL_Surface* raw);

        void load_bmp(const std::filesystem::path& path);
        void save_bmp(const std::filesystem::path& path) const;

        // Destroys the surface for this handle and every copy of it
        void free();
        long use_count() const;
        bool is_valid() const;

        bool fill(const Color& color, const Rect* area = nullptr);
        bool fill_areas(const Color& color, const std::vector<Rect>& areas);

        bool set_rle(bool enable);
        bool lock();
        void unlock();
        bool is_locked() const;
        bool must_lock() const;

        // Converts the pixels in place. Copies see the converted surface.
        void adapt_to(SDL_PixelFormat format);
        void adapt_to(const Surface& other);

        bool set_color_key(const Color& color);
        bool clear_color_key();
        std::optional<Color> get_color_key() const;

        bool set_alpha_mod(uint8_t alpha);
        uint8_t get_alpha_mod() const;

        bool set_blend_mode(BlendMode mode);
        BlendMode get_blend_mode() const;

        Rect get_clip_rect() const;
        bool set_clip_rect(const Rect& clip);

        const std::string& filename() const { return filename_; }
        uint16_t width() const;
        uint16_t height() const;
        int pitch() const;
        uint8_t bits() const;
        uint8_t bytes() const;
        SDL_PixelFormat format() const;
        void* pixels();
        const void* pixels() const;

        uint32_t map_color(const Color& color) const;
        bool is_mask(Mask mask, const Color& color) const;
        bool is_mask(Mask mask, uint32_t mapped) const;

        // Pixel access works on 32 bit formats only. Out of range
        // coordinates throw std::out_of_range. Surfaces that must be locked
        // are locked for the duration of the call.
        uint32_t get_pixel_at(uint16_t x, uint16_t y) const;
        void put_pixel_at(uint16_t x, uint16_t y, uint32_t pixel);
        Color get_color_at(uint16_t x, uint16_t y) const;

        // Null `src_rect` copies all of `src`. Null `dst_pos` draws at (0, 0).
        bool blit(
            const Surface& src,
            const Rect* src_rect = nullptr,
            const Rect* dst_pos = nullptr
        );
        bool blit_scaled(
            const Surface& src,
            const Rect* src_rect = nullptr,
            const Rect* dst_rect = nullptr
        );

        Surface sub_surface(const Rect& area) const;
        // Returns a new surface, this one is left untouched. Throws
        // std::runtime_error for formats under 8 bits per pixel.
        Surface flip(Flip mode) const;

        SDL_Surface* get() const;

    private:
        class Handle {

        public:
            explicit Handle(SDL_Surface* ptr) : ptr_(ptr) {}
            ~Handle() { this->terminate(); }

            Handle(const Handle&) = delete;
            Handle& operator=(const Handle&) = delete;

            void reset(SDL_Surface* ptr);
            void terminate();

            SDL_Surface* ptr_ = nullptr;
        };

        explicit Surface(SDL_Surface* raw);

        std::shared_ptr<Handle> target_;
        std::string filename_;
    };

}  // namespace noeul
