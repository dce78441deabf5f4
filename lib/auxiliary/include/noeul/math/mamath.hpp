#pragma once

#include <cmath>
#include <cstdint>
#include <limits>

#include <glm/vec2.hpp>
#include <sung/basic/angle.hpp>


namespace noeul {

    // Counter-clockwise rotation
    template <typename T>
    glm::tvec2<T> rotate_vec(const glm::tvec2<T>& vec, sung::TAngle<T> angle) {
        const auto cos_a = std::cos(angle.rad());
        const auto sin_a = std::sin(angle.rad());
        return glm::tvec2<T>{ vec.x * cos_a - vec.y * sin_a,
                              vec.x * sin_a + vec.y * cos_a };
    }

    // Truncates toward zero, saturating at the int32 range. NaN becomes 0.
    inline int32_t trunc_to_i32(double v) {
        if (std::isnan(v))
            return 0;
        if (v >= static_cast<double>(std::numeric_limits<int32_t>::max()))
            return std::numeric_limits<int32_t>::max();
        if (v <= static_cast<double>(std::numeric_limits<int32_t>::min()))
            return std::numeric_limits<int32_t>::min();
        return static_cast<int32_t>(v);
    }

    // Two's complement wraparound into 16 bits, independent of the
    // implementation-defined signed narrowing conversion.
    inline int16_t wrap_to_i16(int32_t v) {
        const auto low = static_cast<uint32_t>(v) & 0xFFFFu;
        if (low >= 0x8000u)
            return static_cast<int16_t>(static_cast<int32_t>(low) - 0x10000);
        return static_cast<int16_t>(low);
    }

    inline uint16_t wrap_to_u16(int32_t v) {
        return static_cast<uint16_t>(static_cast<uint32_t>(v) & 0xFFFFu);
    }

    inline int16_t narrow_coord(double v) {
        return wrap_to_i16(trunc_to_i32(v));
    }

}  // namespace noeul
