#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace fsmkit {
    namespace util {

        // ─── Listener token for unsubscription ────────────────────────────────────────
        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Type-safe event dispatcher ──────────────────────────────────────────────
        // Listeners may re-enter emit() (a transition listener that requests another
        // transition), subscribe, or unsubscribe while a dispatch is running.
        // Removal is deferred until the outermost emit() returns; listeners added
        // during a dispatch are first called on the next one.
        template <typename... Args> class Event {
            struct Listener {
                ListenerToken token = 0;
                std::function<void(Args...)> fn;
                bool pending_remove = false;
            };

            dp::Vector<Listener> listeners_;
            ListenerToken next_token_ = 1;
            u32 depth_ = 0;

            void purge() {
                for (auto it = listeners_.begin(); it != listeners_.end();) {
                    if (it->pending_remove) {
                        it = listeners_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }

            // Unwinds the dispatch depth even when a listener throws
            struct DispatchScope {
                Event &event;
                explicit DispatchScope(Event &e) : event(e) { ++event.depth_; }
                ~DispatchScope() {
                    if (--event.depth_ == 0)
                        event.purge();
                }
            };

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                ListenerToken token = next_token_++;
                listeners_.push_back({token, std::move(fn), false});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
                    if (it->token == token && !it->pending_remove) {
                        if (depth_ > 0) {
                            it->pending_remove = true;
                        } else {
                            listeners_.erase(it);
                        }
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) {
                DispatchScope scope(*this);
                const usize snapshot = listeners_.size();
                for (usize i = 0; i < snapshot && i < listeners_.size(); ++i) {
                    if (listeners_[i].pending_remove || !listeners_[i].fn)
                        continue;
                    // The vector may grow while the listener runs
                    auto fn = listeners_[i].fn;
                    fn(args...);
                }
            }

            // Like emit(), but stops before the next listener once keep_going() is false
            template <typename Pred> void emit_while(Pred &&keep_going, Args... args) {
                DispatchScope scope(*this);
                const usize snapshot = listeners_.size();
                for (usize i = 0; i < snapshot && i < listeners_.size(); ++i) {
                    if (!keep_going())
                        return;
                    if (listeners_[i].pending_remove || !listeners_[i].fn)
                        continue;
                    auto fn = listeners_[i].fn;
                    fn(args...);
                }
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &l : listeners_) {
                    if (!l.pending_remove)
                        active++;
                }
                return active;
            }

            bool dispatching() const noexcept { return depth_ > 0; }

            void clear() {
                if (depth_ > 0) {
                    for (auto &l : listeners_)
                        l.pending_remove = true;
                } else {
                    listeners_.clear();
                }
            }

            ListenerToken operator+=(std::function<void(Args...)> fn) { return subscribe(std::move(fn)); }
        };

    } // namespace util
    using namespace util;
} // namespace fsmkit
