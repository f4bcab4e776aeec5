#pragma once

#include "event.hpp"

namespace mavftp {
    namespace util {

        // ─── State holder with transition notification ──────────────────────────────
        template <typename StateEnum> class StateMachine {
            StateEnum state_;
            StateEnum previous_;
            u32 transitions_ = 0;

          public:
            explicit StateMachine(StateEnum initial) : state_(initial), previous_(initial) {}

            StateEnum state() const noexcept { return state_; }
            StateEnum previous() const noexcept { return previous_; }
            u32 transition_count() const noexcept { return transitions_; }

            bool is(StateEnum s) const noexcept { return state_ == s; }

            template <typename... Rest> bool is_any(StateEnum s, Rest... rest) const noexcept {
                return state_ == s || ((state_ == rest) || ...);
            }

            void transition(StateEnum next) {
                if (next == state_)
                    return;
                previous_ = state_;
                state_ = next;
                ++transitions_;
                on_transition.emit(previous_, next);
            }

            Event<StateEnum, StateEnum> on_transition; // (from, to)
        };

    } // namespace util
    using namespace util;
} // namespace mavftp
