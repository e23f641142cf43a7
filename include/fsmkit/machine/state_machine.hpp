#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/event.hpp"
#include "../util/loggable.hpp"
#include "config.hpp"
#include "properties.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <functional>
#include <utility>

namespace fsmkit {
    namespace machine {

        // ─── Finite state machine with redirecting entry hooks ───────────────────────
        // Exactly one state is active at a time. Each state maps to a property bundle
        // whose on_enter hook may refuse entry by naming another state; the machine
        // follows such redirects until a state accepts, and only that final state is
        // ever committed or reported.
        //
        // Hooks may call set_state() on the same machine. The nested call runs to
        // completion first, then the outer call commits its own resolved state.
        // Exceptions thrown by hooks or observers propagate out of set_state().
        template <StateKey S, HookedProperties<S> P> class StateMachine {
          public:
            using StateId = S;
            using Properties = P;
            using Table = dp::Map<S, P>;
            using DefaultFactory = std::function<P(const S &)>;
            using EnteredFn = std::function<void(const S &, const P &)>;

          private:
            Table table_;
            DefaultFactory default_properties_;
            EnteredFn on_entered_state_;
            MachineConfig config_;
            dp::Optional<S> current_;
            u64 transitions_ = 0;

            struct Deferred {};

            // Builds the machine without running the initial transition
            StateMachine(Deferred, Table table, DefaultFactory default_properties, EnteredFn on_entered,
                         MachineConfig config)
                : table_(std::move(table)), default_properties_(std::move(default_properties)),
                  on_entered_state_(std::move(on_entered)), config_(std::move(config)) {}

          public:
            // Unbounded machine: redirects are followed without a hop limit
            StateMachine(Table table, S initial_state, DefaultFactory default_properties, EnteredFn on_entered = {})
                : StateMachine(Deferred{}, std::move(table), std::move(default_properties), std::move(on_entered),
                               MachineConfig{}) {
                // Unbounded resolution cannot fail, so the result always holds a state
                commit(resolve(std::move(initial_state)).value());
            }

            // Machine with an explicit configuration. Fails if the configuration is
            // rejected or the initial state cannot be resolved within the hop limit.
            static Result<StateMachine> create(Table table, S initial_state, DefaultFactory default_properties,
                                               EnteredFn on_entered = {}, MachineConfig config = {}) {
                auto valid = config.validate();
                if (valid.is_err()) {
                    return Result<StateMachine>::err(valid.error());
                }

                StateMachine machine(Deferred{}, std::move(table), std::move(default_properties),
                                     std::move(on_entered), std::move(config));
                auto res = machine.set_state(std::move(initial_state));
                if (res.is_err()) {
                    return Result<StateMachine>::err(res.error());
                }
                return Result<StateMachine>::ok(std::move(machine));
            }

            // ─── Property lookup ─────────────────────────────────────────────────────
            // Table entry if present, otherwise a fresh instance from the default factory.
            P get(const S &id) const {
                auto it = table_.find(id);
                if (it != table_.end()) {
                    return it->second;
                }
                return default_properties_(id);
            }

            P operator[](const S &id) const { return get(id); }

            bool contains(const S &id) const { return table_.find(id) != table_.end(); }

            // ─── Accessors ───────────────────────────────────────────────────────────
            // Require a committed state. Hooks that run inside the initial transition
            // (constructor or create()) see none yet and must use try_state() instead.
            const S &current_state() const noexcept { return *current_; }
            const S &state() const noexcept { return *current_; }
            P values() const { return get(*current_); }
            bool is(const S &id) const { return current_.has_value() && *current_ == id; }

            // Checked forms, InvalidState until the initial transition has committed
            Result<S> try_state() const {
                if (!current_.has_value()) {
                    return Result<S>::err(Error::invalid_state(config_.machine_name + ": no state committed yet"));
                }
                return Result<S>::ok(*current_);
            }

            Result<P> try_values() const {
                if (!current_.has_value()) {
                    return Result<P>::err(Error::invalid_state(config_.machine_name + ": no state committed yet"));
                }
                return Result<P>::ok(get(*current_));
            }

            // Committed transitions on this instance, the initial one included
            u64 transitions() const noexcept { return transitions_; }

            const Table &table() const noexcept { return table_; }
            const MachineConfig &config() const noexcept { return config_; }

            // ─── Transition ──────────────────────────────────────────────────────────
            Result<void> set_state(S target) {
                if (current_.has_value()) {
                    const S leaving = *current_;
                    with_properties(leaving, [](const P &p) {
                        if (p.on_exit)
                            p.on_exit();
                    });
                }

                auto settled = resolve(std::move(target));
                if (settled.is_err()) {
                    return Result<void>::err(settled.error());
                }

                commit(std::move(settled.value()));
                return {};
            }

            Event<S, const P &> on_entered; // (state, properties)

          private:
            // Runs fn against the table entry in place, or against a synthesized bundle.
            // Table hooks are invoked on the stored callable so stateful hooks keep their state.
            template <typename Fn> decltype(auto) with_properties(const S &id, Fn &&fn) const {
                auto it = table_.find(id);
                if (it != table_.end()) {
                    return fn(it->second);
                }
                const P synthesized = default_properties_(id);
                return fn(synthesized);
            }

            Result<S> resolve(S candidate) const {
                u32 hops = 0;
                while (true) {
                    dp::Optional<S> redirect = with_properties(candidate, [](const P &p) -> dp::Optional<S> {
                        if (!p.on_enter)
                            return dp::nullopt;
                        return p.on_enter();
                    });

                    if (!redirect.has_value() || *redirect == candidate) {
                        break;
                    }

                    if (config_.bounded() && ++hops > config_.redirect_limit) {
                        echo::category(LOG_MACHINE)
                            .warn(config_.machine_name, ": redirect limit (", config_.redirect_limit,
                                  ") exceeded at ", loggable(candidate));
                        return Result<S>::err(Error::redirect_limit(config_.redirect_limit));
                    }

                    echo::category(LOG_MACHINE)
                        .trace(config_.machine_name, ": redirect ", loggable(candidate), " -> ", loggable(*redirect));
                    candidate = std::move(*redirect);
                }
                return Result<S>::ok(std::move(candidate));
            }

            void commit(S settled) {
                if (current_.has_value()) {
                    echo::category(LOG_MACHINE)
                        .debug(config_.machine_name, ": ", loggable(*current_), " -> ", loggable(settled));
                } else {
                    echo::category(LOG_MACHINE).debug(config_.machine_name, ": start in ", loggable(settled));
                }

                current_ = settled;
                const u64 generation = ++transitions_;

                if (!on_entered_state_ && on_entered.count() == 0) {
                    return;
                }
                // A nested set_state() from an observer supersedes this commit and has
                // already reported its own state; the rest of this report is dropped.
                auto still_current = [this, generation] { return transitions_ == generation; };
                with_properties(settled, [&](const P &p) {
                    if (on_entered_state_)
                        on_entered_state_(settled, p);
                    on_entered.emit_while(still_current, settled, p);
                });
            }
        };

    } // namespace machine
    using namespace machine;
} // namespace fsmkit
