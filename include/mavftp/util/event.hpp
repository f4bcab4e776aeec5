#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace mavftp {
    namespace util {

        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Observer list for progress and state notifications ──────────────────────
        // Listeners removed while an emit is running are only marked, then swept afterwards,
        // so a progress callback may unsubscribe itself.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = INVALID_TOKEN;
                std::function<void(Args...)> fn;
                bool removed = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            u32 depth_ = 0;

            void sweep() {
                for (auto it = listeners_.begin(); it != listeners_.end();) {
                    if (it->removed)
                        it = listeners_.erase(it);
                    else
                        ++it;
                }
            }

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                for (auto &l : listeners_) {
                    if (l.token == token && !l.removed) {
                        l.removed = true;
                        if (depth_ == 0)
                            sweep();
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) {
                ++depth_;
                // Index loop: a listener may subscribe during emit and grow the vector
                for (usize i = 0; i < listeners_.size(); ++i) {
                    if (!listeners_[i].removed && listeners_[i].fn)
                        listeners_[i].fn(args...);
                }
                if (--depth_ == 0)
                    sweep();
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.removed)
                        ++active;
                }
                return active;
            }

            bool empty() const noexcept { return count() == 0; }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace mavftp
