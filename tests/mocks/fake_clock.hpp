#ifndef HTTPSINK_TESTS_MOCKS_FAKE_CLOCK_HPP
#define HTTPSINK_TESTS_MOCKS_FAKE_CLOCK_HPP

#include "httpsink/auth/credential_provider.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace httpsink::testing {

// ─────────────────────────────────────────────────────────────────────────────
// FakeClock - Manually advanced time source
// ─────────────────────────────────────────────────────────────────────────────
// now() and sleep() hand out callables sharing the clock's state, so they stay
// valid when the engine copies them. sleep() advances time instead of
// blocking and records each requested delay.

class FakeClock {
public:
    FakeClock()
        : state_(std::make_shared<State>())
    {}

    [[nodiscard]] Clock::time_point current() const {
        return state_->now;
    }

    void advance(std::chrono::milliseconds delta) {
        state_->now += delta;
    }

    [[nodiscard]] NowFunction now() const {
        auto state = state_;
        return [state] { return state->now; };
    }

    [[nodiscard]] std::function<void(std::chrono::milliseconds)> sleep() const {
        auto state = state_;
        return [state](std::chrono::milliseconds delay) {
            state->sleeps.push_back(delay);
            state->now += delay;
        };
    }

    [[nodiscard]] const std::vector<std::chrono::milliseconds>& sleeps() const noexcept {
        return state_->sleeps;
    }

private:
    struct State {
        Clock::time_point now{std::chrono::hours{1}};
        std::vector<std::chrono::milliseconds> sleeps;
    };

    std::shared_ptr<State> state_;
};

}  // namespace httpsink::testing

#endif  // HTTPSINK_TESTS_MOCKS_FAKE_CLOCK_HPP
