#include "noeul/input/event_handler.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <set>

#include <gtest/gtest.h>

#include "noeul/input/event_source.hpp"


namespace {

    // In-memory queue that drops records of disabled types
    class FakeEventSource : public noeul::IEventSource {

    public:
        std::optional<SDL_Event> try_dequeue() override {
            if (queue_.empty())
                return std::nullopt;

            const auto out = queue_.front();
            queue_.pop_front();
            return out;
        }

        std::optional<SDL_Event> blocking_dequeue(
            std::optional<int32_t> timeout_ms
        ) override {
            return this->try_dequeue();
        }

        bool enqueue(SDL_Event& e) override {
            if (!this->is_enabled(e.type))
                return false;
            queue_.push_back(e);
            return true;
        }

        void flush(uint32_t first, uint32_t last) override {
            queue_.erase(
                std::remove_if(
                    queue_.begin(),
                    queue_.end(),
                    [&](const SDL_Event& e) {
                        return e.type >= first && e.type <= last;
                    }
                ),
                queue_.end()
            );
        }

        bool has_pending(uint32_t first, uint32_t last) override {
            return std::any_of(
                queue_.begin(), queue_.end(), [&](const SDL_Event& e) {
                    return e.type >= first && e.type <= last;
                }
            );
        }

        bool has_quit_pending() override {
            return this->has_pending(SDL_EVENT_QUIT, SDL_EVENT_QUIT);
        }

        bool is_enabled(uint32_t type) override {
            return disabled_.find(type) == disabled_.end();
        }

        void set_enabled(uint32_t type, bool enabled) override {
            if (enabled) {
                disabled_.erase(type);
            } else {
                disabled_.insert(type);
                this->flush(type, type);
            }
        }

        void add_raw(uint32_t type) {
            SDL_Event e;
            SDL_zero(e);
            e.type = type;
            queue_.push_back(e);
        }

        size_t size() const { return queue_.size(); }

    private:
        std::deque<SDL_Event> queue_;
        std::set<uint32_t> disabled_;
    };


    class FakeKeyboard : public noeul::key::IKeyboardState {

    public:
        noeul::key::Mod current_modifiers() const override {
            return noeul::key::Mod::none;
        }
    };


    class CountingListener : public noeul::IEventListener {

    public:
        bool on_quit(const noeul::Event& e) override {
            ++quit_;
            return consume_;
        }

        bool on_key(const noeul::Event& e) override {
            ++key_;
            return consume_;
        }

        bool on_mouse_motion(const noeul::Event& e) override {
            ++motion_;
            return consume_;
        }

        int quit_ = 0;
        int key_ = 0;
        int motion_ = 0;
        bool consume_ = false;
    };

}  // namespace


// Handler over a fake source
namespace {

    class EventHandlerFake : public testing::Test {

    protected:
        std::unique_ptr<noeul::IEventHandler> make_handler(
            size_t max_dispatch = 1024
        ) {
            noeul::EventHandlerCreateInfo cinfo;
            cinfo.source_ = &source_;
            cinfo.keyboard_ = &keyboard_;
            cinfo.max_dispatch_ = max_dispatch;
            return noeul::create_event_handler(std::move(cinfo));
        }

        FakeEventSource source_;
        FakeKeyboard keyboard_;
    };


    TEST_F(EventHandlerFake, PollSkipsUntranslatable) {
        auto handler = this->make_handler();
        source_.add_raw(SDL_EVENT_JOYSTICK_AXIS_MOTION);
        source_.add_raw(SDL_EVENT_KEY_DOWN);

        EXPECT_FALSE(handler->poll().has_value());
        const auto e = handler->poll();
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->type(), noeul::EventType::key_down);
        EXPECT_FALSE(handler->poll().has_value());
    }

    TEST_F(EventHandlerFake, DisabledAtCreation) {
        noeul::EventHandlerCreateInfo cinfo;
        cinfo.source_ = &source_;
        cinfo.keyboard_ = &keyboard_;
        cinfo.disabled_types_.push_back(noeul::EventType::mouse_wheel);
        auto handler = noeul::create_event_handler(std::move(cinfo));

        EXPECT_FALSE(source_.is_enabled(SDL_EVENT_MOUSE_WHEEL));
        EXPECT_TRUE(source_.is_enabled(SDL_EVENT_MOUSE_MOTION));
        EXPECT_FALSE(handler->push(noeul::EventType::mouse_wheel));
    }

    TEST_F(EventHandlerFake, SetStateReportsPrevious) {
        using noeul::EventState;
        using noeul::EventType;

        auto handler = this->make_handler();
        source_.add_raw(SDL_EVENT_MOUSE_WHEEL);
        EXPECT_TRUE(handler->has_pending(EventType::mouse_wheel));

        EXPECT_EQ(
            handler->set_state(EventType::mouse_wheel, EventState::ignore),
            EventState::enable
        );
        EXPECT_FALSE(handler->has_pending(EventType::mouse_wheel));
        EXPECT_FALSE(handler->push(EventType::mouse_wheel));
        EXPECT_FALSE(handler->has_pending(EventType::mouse_wheel));
        EXPECT_EQ(
            handler->set_state(EventType::mouse_wheel, EventState::query),
            EventState::disable
        );

        EXPECT_EQ(
            handler->set_state(EventType::mouse_wheel, EventState::enable),
            EventState::disable
        );
        EXPECT_TRUE(handler->push(EventType::mouse_wheel));
        EXPECT_TRUE(handler->has_pending(EventType::mouse_wheel));
    }

    TEST_F(EventHandlerFake, WindowRangeStateIsAllOrNothing) {
        using noeul::EventState;
        using noeul::EventType;

        auto handler = this->make_handler();
        EXPECT_EQ(
            handler->set_state(EventType::window, EventState::query),
            EventState::enable
        );

        source_.set_enabled(SDL_EVENT_WINDOW_MOVED, false);
        EXPECT_EQ(
            handler->set_state(EventType::window, EventState::query),
            EventState::disable
        );

        handler->set_state(EventType::window, EventState::disable);
        EXPECT_FALSE(source_.is_enabled(SDL_EVENT_WINDOW_SHOWN));
        EXPECT_FALSE(source_.is_enabled(SDL_EVENT_WINDOW_CLOSE_REQUESTED));
    }

    TEST_F(EventHandlerFake, FlushRemovesOnlyThatType) {
        auto handler = this->make_handler();
        source_.add_raw(SDL_EVENT_KEY_DOWN);
        source_.add_raw(SDL_EVENT_WINDOW_SHOWN);
        source_.add_raw(SDL_EVENT_WINDOW_RESIZED);
        source_.add_raw(SDL_EVENT_QUIT);

        handler->flush(noeul::EventType::window);
        EXPECT_EQ(source_.size(), 2u);
        EXPECT_FALSE(handler->has_pending(noeul::EventType::window));
        EXPECT_TRUE(handler->has_pending(noeul::EventType::key_down));
        EXPECT_TRUE(handler->has_quit_pending());
    }

    TEST_F(EventHandlerFake, PushWindowId) {
        auto handler = this->make_handler();
        EXPECT_FALSE(handler->push(noeul::WindowEventId::none));
        ASSERT_TRUE(handler->push(noeul::WindowEventId::focus_lost));

        const auto e = handler->poll();
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->window().id, noeul::WindowEventId::focus_lost);
    }

    TEST_F(EventHandlerFake, WaitConsumesUntranslatable) {
        auto handler = this->make_handler();
        source_.add_raw(SDL_EVENT_JOYSTICK_AXIS_MOTION);

        EXPECT_FALSE(handler->wait(10).has_value());
        EXPECT_EQ(source_.size(), 0u);
        EXPECT_FALSE(handler->wait(10).has_value());
    }

    TEST_F(EventHandlerFake, WaitReturnsWindowEvent) {
        auto handler = this->make_handler();

        SDL_Event raw;
        SDL_zero(raw);
        raw.type = SDL_EVENT_WINDOW_RESIZED;
        raw.window.windowID = 3;
        raw.window.data1 = 640;
        raw.window.data2 = 480;
        ASSERT_TRUE(source_.enqueue(raw));

        const auto e = handler->wait(10);
        ASSERT_TRUE(e.has_value());
        ASSERT_EQ(e->type(), noeul::EventType::window);
        EXPECT_EQ(e->window_id(), 3u);
        EXPECT_EQ(e->window().id, noeul::WindowEventId::resized);
        EXPECT_EQ(e->window().data1, 640);
        EXPECT_EQ(e->window().data2, 480);
        EXPECT_EQ(source_.size(), 0u);
    }

    TEST_F(EventHandlerFake, DispatchPending) {
        auto handler = this->make_handler();
        source_.add_raw(SDL_EVENT_KEY_DOWN);
        source_.add_raw(SDL_EVENT_JOYSTICK_AXIS_MOTION);
        source_.add_raw(SDL_EVENT_MOUSE_MOTION);
        source_.add_raw(SDL_EVENT_KEY_UP);

        CountingListener listener;
        EXPECT_EQ(handler->dispatch_pending(listener), 3u);
        EXPECT_EQ(listener.key_, 2);
        EXPECT_EQ(listener.motion_, 1);
        EXPECT_EQ(source_.size(), 0u);
    }

    TEST_F(EventHandlerFake, DispatchPendingBounded) {
        auto handler = this->make_handler(2);
        for (int i = 0; i < 5; ++i) source_.add_raw(SDL_EVENT_KEY_DOWN);

        CountingListener listener;
        EXPECT_EQ(handler->dispatch_pending(listener), 2u);
        EXPECT_EQ(source_.size(), 3u);
    }

}  // namespace


// Listeners
namespace {

    TEST(EventListenerMgr, StopsAtFirstConsumer) {
        CountingListener first, second, third;
        second.consume_ = true;

        noeul::EventListenerMgr mgr;
        mgr.add(&first);
        mgr.add(&second);
        mgr.add(&third);
        ASSERT_EQ(mgr.size(), 3u);

        EXPECT_TRUE(noeul::dispatch_event(noeul::Event::make_quit(), mgr));
        EXPECT_EQ(first.quit_, 1);
        EXPECT_EQ(second.quit_, 1);
        EXPECT_EQ(third.quit_, 0);
    }

    TEST(EventListenerMgr, OwnedListener) {
        noeul::EventListenerMgr mgr;
        mgr.add(std::make_unique<CountingListener>());

        const auto e = noeul::Event::make_key(true, 10, 1, {});
        EXPECT_FALSE(noeul::dispatch_event(e, mgr));
        EXPECT_FALSE(noeul::dispatch_event(noeul::Event::make_quit(), mgr));
    }

    TEST(StateTracker, FollowsKeyEvents) {
        using noeul::key::ScanCode;

        noeul::key::StateTracker tracker;
        EXPECT_FALSE(tracker.is_pressed(ScanCode::a));
        EXPECT_FALSE(tracker.get_timestamp(ScanCode::a).has_value());

        noeul::KeyboardEvent k;
        k.scancode = ScanCode::a;
        EXPECT_FALSE(tracker.on_key(noeul::Event::make_key(true, 100, 0, k)));
        EXPECT_TRUE(tracker.is_pressed(ScanCode::a));
        EXPECT_EQ(tracker.get_timestamp(ScanCode::a), 100u);
        EXPECT_TRUE(tracker.get_timepoint(ScanCode::a).has_value());

        tracker.on_key(noeul::Event::make_key(false, 150, 0, k));
        EXPECT_FALSE(tracker.is_pressed(ScanCode::a));
        EXPECT_EQ(tracker.get_timestamp(ScanCode::a), 150u);

        tracker.clear();
        EXPECT_FALSE(tracker.get_timestamp(ScanCode::a).has_value());
    }

}  // namespace


// Handler over the SDL queue
namespace {

    class EventHandlerSdl : public testing::Test {

    protected:
        void SetUp() override {
            SDL_FlushEvents(SDL_EVENT_FIRST, SDL_EVENT_LAST);
            handler_ = noeul::create_event_handler({});
        }

        void TearDown() override {
            handler_.reset();
            SDL_FlushEvents(SDL_EVENT_FIRST, SDL_EVENT_LAST);
        }

        noeul::SdlEventSubsystem subsystem_;
        std::unique_ptr<noeul::IEventHandler> handler_;
    };


    TEST_F(EventHandlerSdl, PushQuitThenPoll) {
        ASSERT_TRUE(handler_->push(noeul::EventType::quit));
        EXPECT_TRUE(handler_->has_quit_pending());

        const auto e = handler_->poll();
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->type(), noeul::EventType::quit);
    }

    TEST_F(EventHandlerSdl, DisableWheelDropsPending) {
        using noeul::EventState;
        using noeul::EventType;

        ASSERT_TRUE(handler_->push(EventType::mouse_wheel));
        EXPECT_TRUE(handler_->has_pending(EventType::mouse_wheel));

        EXPECT_EQ(
            handler_->set_state(EventType::mouse_wheel, EventState::disable),
            EventState::enable
        );
        EXPECT_FALSE(handler_->has_pending(EventType::mouse_wheel));
        EXPECT_EQ(
            handler_->set_state(EventType::mouse_wheel, EventState::query),
            EventState::disable
        );

        handler_->set_state(EventType::mouse_wheel, EventState::enable);
        EXPECT_EQ(
            handler_->set_state(EventType::mouse_wheel, EventState::query),
            EventState::enable
        );
    }

    TEST_F(EventHandlerSdl, WaitTimesOut) {
        using Clock = std::chrono::steady_clock;
        using std::chrono::milliseconds;

        const auto start = Clock::now();
        const auto e = handler_->wait(50);
        const auto elapsed = Clock::now() - start;

        EXPECT_FALSE(e.has_value());
        EXPECT_GE(elapsed, milliseconds(45));
        EXPECT_LT(elapsed, milliseconds(1000));
    }

    TEST_F(EventHandlerSdl, WaitReturnsQueued) {
        ASSERT_TRUE(handler_->push(noeul::EventType::key_up));

        const auto e = handler_->wait(1000);
        ASSERT_TRUE(e.has_value());
        EXPECT_EQ(e->type(), noeul::EventType::key_up);
    }

    TEST_F(EventHandlerSdl, PushedWindowHasDefaultPayload) {
        ASSERT_TRUE(handler_->push(noeul::EventType::window));

        const auto e = handler_->poll();
        ASSERT_TRUE(e.has_value());
        ASSERT_EQ(e->type(), noeul::EventType::window);
        EXPECT_EQ(e->window_id(), 0);
        EXPECT_EQ(e->window().id, noeul::WindowEventId::shown);
        EXPECT_EQ(e->window().data1, 0);
        EXPECT_EQ(e->window().data2, 0);
    }

    TEST_F(EventHandlerSdl, PollEmptyQueue) {
        EXPECT_FALSE(handler_->poll().has_value());
        EXPECT_FALSE(handler_->has_quit_pending());
    }

}  // namespace


int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
