#include <memory>

#define SDL_MAIN_USE_CALLBACKS
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>

#include <noeul/graphics/renderer.hpp>
#include <noeul/graphics/transformable.hpp>
#include <noeul/input/event_fmt.hpp>
#include <noeul/input/event_handler.hpp>
#include <noeul/lightweight/include_spdlog.hpp>
#include <noeul/lightweight/konsts.hpp>
#include <noeul/math/glm_fmt.hpp>


namespace {

    class WindowSDL {

    public:
        WindowSDL() {
            if (!SDL_Init(SDL_INIT_VIDEO))
                NOEUL_ABORT("SDL_Init failed: {}", SDL_GetError());

            window_ = SDL_CreateWindow(
                "Noeul", 800, 600, SDL_WINDOW_RESIZABLE
            );
            if (!window_)
                NOEUL_ABORT("SDL_CreateWindow failed: {}", SDL_GetError());
            SDL_ShowWindow(window_);
        }

        ~WindowSDL() {
            if (window_)
                SDL_DestroyWindow(window_);
            window_ = nullptr;
        }

        SDL_Window* get() const { return window_; }

    private:
        SDL_Window* window_ = nullptr;
    };


    // Moves a square around with the arrow keys and the mouse wheel
    class Player
        : public noeul::IEventListener
        , public noeul::Transformable {

    public:
        bool on_key(const noeul::Event& e) override {
            using noeul::key::Code;

            if (e.type() != noeul::EventType::key_down)
                return false;

            switch (e.keyboard().code) {
                case Code::left:
                    this->move(-10, 0);
                    return true;
                case Code::right:
                    this->move(10, 0);
                    return true;
                case Code::up:
                    this->move(0, -10);
                    return true;
                case Code::down:
                    this->move(0, 10);
                    return true;
                case Code::space:
                    this->reset_translation();
                    return true;
                default:
                    return false;
            }
        }

        bool on_mouse_wheel(const noeul::Event& e) override {
            this->rotate(e.mouse_wheel().delta_y * 15);
            return true;
        }

        void draw(noeul::Renderer& renderer) const {
            const auto m = this->make_model_mat();
            const glm::vec4 corners[] = {
                m * glm::vec4{ 0, 0, 0, 1 },
                m * glm::vec4{ SIZE, 0, 0, 1 },
                m * glm::vec4{ SIZE, SIZE, 0, 1 },
                m * glm::vec4{ 0, SIZE, 0, 1 },
            };

            renderer.set_draw_color(noeul::colors::green);
            for (int i = 0; i < 4; ++i) {
                const auto& a = corners[i];
                const auto& b = corners[(i + 1) % 4];
                renderer.draw_line(a.x, a.y, b.x, b.y);
            }
        }

    protected:
        void on_position_moved() override {
            SPDLOG_DEBUG("Player moved to {}", pos_);
        }

        void on_position_reset() override { SPDLOG_DEBUG("Player reset"); }

    private:
        constexpr static float SIZE = 50;
    };


    class EventLogger : public noeul::IEventListener {

    public:
        bool on_window(const noeul::Event& e) override {
            SPDLOG_INFO("{}", e);
            return false;
        }

        bool on_key(const noeul::Event& e) override {
            SPDLOG_DEBUG("{}", e);
            return false;
        }

        bool on_mouse_button(const noeul::Event& e) override {
            SPDLOG_DEBUG("{}", e);
            return false;
        }

        bool on_text_input(const noeul::Event& e) override {
            SPDLOG_INFO("{}", e);
            return false;
        }
    };


    class CombinedApp {

    public:
        CombinedApp() : renderer_(window_.get()) {
            spdlog::set_level(spdlog::level::level_enum::debug);
            SPDLOG_INFO(
                "{} {}.{}.{}",
                noeul::LIBRARY_NAME,
                noeul::LIBRARY_VERSION_MAJOR,
                noeul::LIBRARY_VERSION_MINOR,
                noeul::LIBRARY_VERSION_PATCH
            );

            noeul::EventHandlerCreateInfo cinfo;
            cinfo.disabled_types_.push_back(noeul::EventType::text_edit);
            handler_ = noeul::create_event_handler(std::move(cinfo));

            player_.set_position(200, 200);
            player_.set_center({ 25, 25 });

            noeul::key::start_text_input(window_.get());

            listeners_.add(&keys_);
            listeners_.add(std::make_unique<EventLogger>());
            listeners_.add(&player_);
        }

        ~CombinedApp() { noeul::key::stop_text_input(window_.get()); }

        void do_frame() {
            if (keys_.is_pressed(noeul::key::ScanCode::lshift))
                player_.rotate(1);

            renderer_.set_draw_color(noeul::colors::black);
            renderer_.clear();
            player_.draw(renderer_);
            renderer_.present();
        }

        SDL_AppResult proc_event(const SDL_Event& raw) {
            const auto e = handler_->translate(raw);
            if (!e)
                return SDL_AppResult::SDL_APP_CONTINUE;

            if (e->type() == noeul::EventType::key_down) {
                const auto code = e->keyboard().code;
                if (code == noeul::key::Code::escape)
                    return SDL_AppResult::SDL_APP_SUCCESS;

                if (code == noeul::key::Code::f1) {
                    const auto win = window_.get();
                    const auto rel = noeul::mouse::is_relative_mode(win);
                    noeul::mouse::set_relative_mode(win, !rel);
                    SPDLOG_INFO(
                        "Relative mouse mode {} at {}",
                        rel ? "off" : "on",
                        noeul::mouse::get_position()
                    );
                }
            }

            noeul::dispatch_event(*e, listeners_);
            return SDL_AppResult::SDL_APP_CONTINUE;
        }

    private:
        WindowSDL window_;
        noeul::Renderer renderer_;
        std::unique_ptr<noeul::IEventHandler> handler_;
        noeul::key::StateTracker keys_;
        Player player_;
        noeul::EventListenerMgr listeners_;
    };

}  // namespace


SDL_AppResult SDL_AppInit(void** appstate, int argc, char** argv) {
    auto app = std::make_unique<::CombinedApp>();
    *appstate = app.release();
    return SDL_AppResult::SDL_APP_CONTINUE;
}


SDL_AppResult SDL_AppIterate(void* appstate) {
    auto app = static_cast<::CombinedApp*>(appstate);
    app->do_frame();
    return SDL_AppResult::SDL_APP_CONTINUE;
}


SDL_AppResult SDL_AppEvent(void* appstate, SDL_Event* e) {
    if (nullptr == e)
        return SDL_AppResult::SDL_APP_CONTINUE;
    if (e->type == SDL_EVENT_QUIT)
        return SDL_AppResult::SDL_APP_SUCCESS;

    auto app = static_cast<::CombinedApp*>(appstate);
    if (nullptr == app)
        return SDL_AppResult::SDL_APP_FAILURE;

    return app->proc_event(*e);
}


void SDL_AppQuit(void* appstate, SDL_AppResult result) {
    std::unique_ptr<::CombinedApp> app(static_cast<::CombinedApp*>(appstate));
}
