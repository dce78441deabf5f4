#pragma once

#include <spdlog/fmt/fmt.h>

#include "noeul/input/event.hpp"


namespace fmt {

    template <>
    struct formatter<noeul::EventType> : formatter<string_view> {
        format_context::iterator format(
            noeul::EventType v, format_context& ctx
        ) const {
            return formatter<string_view>::format(noeul::to_str(v), ctx);
        }
    };


    template <>
    struct formatter<noeul::WindowEventId> : formatter<string_view> {
        format_context::iterator format(
            noeul::WindowEventId v, format_context& ctx
        ) const {
            return formatter<string_view>::format(noeul::to_str(v), ctx);
        }
    };


    // Writes "type@timestamp#window {payload}". Format spec is ignored.
    template <>
    struct formatter<noeul::Event> {
        constexpr format_parse_context::iterator parse(
            format_parse_context& ctx
        ) {
            return ctx.begin();
        }

        format_context::iterator format(
            const noeul::Event& e, format_context& ctx
        ) const {
            using noeul::EventType;

            auto out = fmt::format_to(
                ctx.out(),
                "{}@{}#{}",
                noeul::to_str(e.type()),
                e.timestamp(),
                e.window_id()
            );

            switch (e.type()) {
                case EventType::quit:
                    break;
                case EventType::window: {
                    const auto& w = e.window();
                    out = fmt::format_to(
                        out,
                        " {{{} {} {}}}",
                        noeul::to_str(w.id),
                        w.data1,
                        w.data2
                    );
                    break;
                }
                case EventType::key_down:
                case EventType::key_up: {
                    const auto& k = e.keyboard();
                    out = fmt::format_to(
                        out,
                        " {{code={} scan={} mod={:#x}{}}}",
                        static_cast<uint32_t>(k.code),
                        static_cast<uint32_t>(k.scancode),
                        static_cast<uint16_t>(k.mod),
                        k.repeat ? " repeat" : ""
                    );
                    break;
                }
                case EventType::mouse_motion: {
                    const auto& m = e.mouse_motion();
                    out = fmt::format_to(
                        out,
                        " {{({}, {}) rel=({}, {}){}}}",
                        m.x,
                        m.y,
                        m.rel_x,
                        m.rel_y,
                        m.state == noeul::mouse::State::pressed ? " pressed"
                                                                : ""
                    );
                    break;
                }
                case EventType::mouse_button_down:
                case EventType::mouse_button_up: {
                    const auto& m = e.mouse_button();
                    out = fmt::format_to(
                        out,
                        " {{btn={} ({}, {})}}",
                        static_cast<int>(m.button),
                        m.x,
                        m.y
                    );
                    break;
                }
                case EventType::mouse_wheel: {
                    const auto& m = e.mouse_wheel();
                    out = fmt::format_to(
                        out,
                        " {{({}, {}) delta=({}, {})}}",
                        m.x,
                        m.y,
                        m.delta_x,
                        m.delta_y
                    );
                    break;
                }
                case EventType::text_edit: {
                    const auto& t = e.text_edit();
                    out = fmt::format_to(
                        out, " {{\"{}\" {}+{}}}", t.str(), t.start, t.length
                    );
                    break;
                }
                case EventType::text_input:
                    out = fmt::format_to(
                        out, " {{\"{}\"}}", e.text_input().str()
                    );
                    break;
            }

            return out;
        }
    };

}  // namespace fmt
