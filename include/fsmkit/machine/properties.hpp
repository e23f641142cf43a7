#pragma once

#include "../core/types.hpp"
#include <concepts>
#include <datapod/datapod.hpp>
#include <functional>
#include <utility>

namespace fsmkit {
    namespace machine {

        // ─── State identifier constraint ─────────────────────────────────────────────
        // Any copyable value usable as a hash-map key. No ordering is required.
        template <typename S>
        concept StateKey = std::copyable<S> && std::equality_comparable<S> && requires(const S &s) {
            { std::hash<S>{}(s) } -> std::convertible_to<usize>;
        };

        // ─── Properties capability ───────────────────────────────────────────────────
        // The engine only needs two optional hooks from a property bundle:
        //   on_enter : () -> dp::Optional<S>   empty = accept, value = redirect
        //   on_exit  : () -> void
        // Both must be testable for presence (std::function, function pointer, ...).
        template <typename P, typename S>
        concept HookedProperties = std::copy_constructible<P> && requires(const P &p) {
            { static_cast<bool>(p.on_enter) };
            { static_cast<bool>(p.on_exit) };
            { p.on_enter() } -> std::convertible_to<dp::Optional<S>>;
            p.on_exit();
        };

        // ─── Base property bundle ────────────────────────────────────────────────────
        // Caller payload structs inherit from this to pick up the lifecycle hooks.
        template <StateKey S> struct FsmProperties {
            using EnterHook = std::function<dp::Optional<S>()>;
            using ExitHook = std::function<void()>;

            EnterHook on_enter;
            ExitHook on_exit;

            // Hook return helpers
            static dp::Optional<S> accept() noexcept { return dp::nullopt; }
            static dp::Optional<S> redirect_to(S target) { return dp::Optional<S>(std::move(target)); }
        };

    } // namespace machine
    using namespace machine;
} // namespace fsmkit
