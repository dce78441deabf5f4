#pragma once

#include <spdlog/fmt/fmt.h>
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>


namespace fmt {

    template <typename T>
    struct formatter<glm::tvec2<T>> : formatter<T> {
        format_context::iterator format(
            const glm::tvec2<T>& v, format_context& ctx
        ) const {
            fmt::format_to(ctx.out(), "(");
            formatter<T>::format(v.x, ctx);
            fmt::format_to(ctx.out(), ", ");
            formatter<T>::format(v.y, ctx);
            fmt::format_to(ctx.out(), ")");

            return ctx.out();
        }
    };


    template <typename T>
    struct formatter<glm::tmat4x4<T>> : formatter<T> {
        format_context::iterator format(
            const glm::tmat4x4<T>& x, format_context& ctx
        ) const {
            fmt::format_to(ctx.out(), "[");
            for (int row = 0; row < 4; ++row) {
                fmt::format_to(ctx.out(), row == 0 ? "[" : "\n [");
                for (int col = 0; col < 4; ++col) {
                    if (col != 0)
                        fmt::format_to(ctx.out(), ", ");
                    formatter<T>::format(x[col][row], ctx);
                }
                fmt::format_to(ctx.out(), "]");
            }
            fmt::format_to(ctx.out(), "]");

            return ctx.out();
        }
    };

}  // namespace fmt
