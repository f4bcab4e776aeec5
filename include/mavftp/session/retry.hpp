#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <echo/echo.hpp>

namespace mavftp {
    namespace session {

        // ─── Backoff curve between attempts ──────────────────────────────────────────
        enum class Backoff : u8 { Fixed, Linear, Exponential };

        // ─── Retry policy ────────────────────────────────────────────────────────────
        struct RetryPolicy {
            u32 timeout_ms = DEFAULT_REQUEST_TIMEOUT_MS;
            u32 max_retries = DEFAULT_MAX_RETRIES;
            Backoff backoff = Backoff::Fixed;
            u32 max_timeout_ms = DEFAULT_MAX_TIMEOUT_MS;

            RetryPolicy &timeout(u32 ms) {
                timeout_ms = ms;
                return *this;
            }
            RetryPolicy &retries(u32 n) {
                max_retries = n;
                return *this;
            }
            RetryPolicy &with_backoff(Backoff b, u32 cap_ms = DEFAULT_MAX_TIMEOUT_MS) {
                backoff = b;
                max_timeout_ms = cap_ms;
                return *this;
            }

            // Wait allowed for attempt n (0 = first transmission)
            u32 timeout_for(u32 attempt) const noexcept {
                u64 ms = timeout_ms;
                switch (backoff) {
                case Backoff::Fixed:
                    break;
                case Backoff::Linear:
                    ms = static_cast<u64>(timeout_ms) * (attempt + 1);
                    break;
                case Backoff::Exponential:
                    ms = static_cast<u64>(timeout_ms) << (attempt > 16 ? 16 : attempt);
                    break;
                }
                if (backoff != Backoff::Fixed && ms > max_timeout_ms)
                    ms = max_timeout_ms > timeout_ms ? max_timeout_ms : timeout_ms;
                return static_cast<u32>(ms);
            }
        };

        enum class RetryAction : u8 { None, Resend, Exhausted };

        // ─── Retry controller ────────────────────────────────────────────────────────
        // Tracks the wait for the single outstanding request. Every expiry either asks for a
        // resend or reports exhaustion, so a wait can never last longer than
        // sum(timeout_for(0..max_retries)).
        class RetryController {
            RetryPolicy policy_;
            u32 elapsed_ms_ = 0;
            u32 retries_ = 0;
            u32 total_resends_ = 0;
            bool armed_ = false;

          public:
            explicit RetryController(RetryPolicy policy = {}) : policy_(policy) {}

            // Fresh request: new attempt budget
            void arm() noexcept {
                armed_ = true;
                elapsed_ms_ = 0;
                retries_ = 0;
            }

            // An accepted response restarts the wait without refunding spent retries
            // unless the caller also re-arms for a new request.
            void progress() noexcept { elapsed_ms_ = 0; }

            void disarm() noexcept { armed_ = false; }

            // Corrective resend requested by the state machine; counts against the budget.
            bool consume_retry() noexcept {
                if (retries_ >= policy_.max_retries)
                    return false;
                ++retries_;
                ++total_resends_;
                elapsed_ms_ = 0;
                return true;
            }

            RetryAction update(u32 delta_ms) noexcept {
                if (!armed_)
                    return RetryAction::None;

                elapsed_ms_ += delta_ms;
                if (elapsed_ms_ < current_timeout())
                    return RetryAction::None;

                elapsed_ms_ = 0;
                if (retries_ >= policy_.max_retries) {
                    armed_ = false;
                    echo::category("mavftp.retry").warn("retry budget exhausted after ", retries_, " resends");
                    return RetryAction::Exhausted;
                }
                ++retries_;
                ++total_resends_;
                echo::category("mavftp.retry").debug("timeout, resend ", retries_, "/", policy_.max_retries);
                return RetryAction::Resend;
            }

            u32 current_timeout() const noexcept { return policy_.timeout_for(retries_); }
            u32 retries() const noexcept { return retries_; }
            u32 total_resends() const noexcept { return total_resends_; }
            u32 elapsed() const noexcept { return elapsed_ms_; }
            bool armed() const noexcept { return armed_; }
            const RetryPolicy &policy() const noexcept { return policy_; }
            void set_policy(RetryPolicy p) noexcept { policy_ = p; }
        };

    } // namespace session
    using namespace session;
} // namespace mavftp
