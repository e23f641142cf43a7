#include "test_states.hpp"
#include <doctest/doctest.h>
#include <fsmkit/machine/state_machine.hpp>
#include <functional>
#include <stdexcept>

using namespace fsmkit;

// ─── Nested transitions ──────────────────────────────────────────────────────

TEST_CASE("Reentrancy: notification cascades into a further transition") {
    Machine *self = nullptr;
    dp::Vector<TestState> reported;

    Machine machine(
        {
            {TestState::one, props(ResultState::i)},
            {TestState::two, props(ResultState::ii)},
            {TestState::three, props(ResultState::iii)},
        },
        TestState::one, fallback, [&](const TestState &s, const StateProperties &) {
            reported.push_back(s);
            if (s == TestState::two && self != nullptr) {
                self->set_state(TestState::three);
            }
        });
    self = &machine;
    reported.clear();

    machine.set_state(TestState::two);

    CHECK(machine.current_state() == TestState::three);
    REQUIRE(reported.size() == 2);
    CHECK(reported[0] == TestState::two);
    CHECK(reported[1] == TestState::three);
}

TEST_CASE("Reentrancy: on_entered listeners that request another transition") {
    Machine machine(
        {
            {TestState::one, props(ResultState::i)},
            {TestState::two, props(ResultState::ii)},
            {TestState::three, props(ResultState::iii)},
            {TestState::four, props(ResultState::iv)},
        },
        TestState::one, fallback);

    dp::Vector<TestState> first;
    dp::Vector<TestState> second;

    SUBCASE("a listener cascades, later listeners only see the final state") {
        machine.on_entered.subscribe([&](const TestState &s, const StateProperties &) {
            first.push_back(s);
            if (s == TestState::two)
                machine.set_state(TestState::three);
        });
        machine.on_entered.subscribe([&](const TestState &s, const StateProperties &p) {
            second.push_back(s);
            CHECK(s == machine.current_state());
            CHECK(p.result_state == ResultState::iii);
        });

        machine.set_state(TestState::two);

        CHECK(machine.current_state() == TestState::three);
        CHECK(machine.transitions() == 3);
        REQUIRE(first.size() == 2);
        CHECK(first[0] == TestState::two);
        CHECK(first[1] == TestState::three);
        REQUIRE(second.size() == 1);
        CHECK(second[0] == TestState::three);
    }

    SUBCASE("callback and listener both cascade") {
        Machine *self = nullptr;
        dp::Vector<TestState> callback_seen;
        Machine cascading(
            {
                {TestState::one, props(ResultState::i)},
                {TestState::two, props(ResultState::ii)},
                {TestState::three, props(ResultState::iii)},
                {TestState::four, props(ResultState::iv)},
            },
            TestState::one, fallback, [&](const TestState &s, const StateProperties &) {
                callback_seen.push_back(s);
                if (s == TestState::two && self != nullptr)
                    self->set_state(TestState::three);
            });
        self = &cascading;
        callback_seen.clear();

        cascading.on_entered.subscribe([&](const TestState &s, const StateProperties &) {
            first.push_back(s);
            if (s == TestState::three)
                cascading.set_state(TestState::four);
        });
        cascading.on_entered.subscribe([&](const TestState &s, const StateProperties &) { second.push_back(s); });

        cascading.set_state(TestState::two);

        CHECK(cascading.current_state() == TestState::four);
        REQUIRE(callback_seen.size() == 3);
        CHECK(callback_seen[0] == TestState::two);
        CHECK(callback_seen[1] == TestState::three);
        CHECK(callback_seen[2] == TestState::four);
        // two was superseded inside the callback and is never emitted
        REQUIRE(first.size() == 2);
        CHECK(first[0] == TestState::three);
        CHECK(first[1] == TestState::four);
        REQUIRE(second.size() == 1);
        CHECK(second[0] == TestState::four);
    }

    SUBCASE("the last reported state is always the current one") {
        machine.on_entered.subscribe([&](const TestState &s, const StateProperties &) {
            first.push_back(s);
            if (s == TestState::two)
                machine.set_state(TestState::three);
            else if (s == TestState::three)
                machine.set_state(TestState::four);
        });

        machine.set_state(TestState::two);

        CHECK(machine.current_state() == TestState::four);
        REQUIRE(first.size() == 3);
        CHECK(first[2] == machine.current_state());
    }
}

TEST_CASE("Reentrancy: nested call from an entry hook completes before the outer commit") {
    Machine *self = nullptr;
    dp::Vector<dp::String> log;

    Machine machine(
        {
            {TestState::one, props(ResultState::i, {}, [&] { log.push_back("exit one"); })},
            {TestState::two, props(ResultState::ii,
                                   [&]() -> dp::Optional<TestState> {
                                       log.push_back("enter two");
                                       self->set_state(TestState::three);
                                       log.push_back("nested done");
                                       return dp::nullopt;
                                   })},
            {TestState::three, props(ResultState::iii,
                                     [&]() -> dp::Optional<TestState> {
                                         log.push_back("enter three");
                                         return dp::nullopt;
                                     })},
        },
        TestState::one, fallback,
        [&](const TestState &s, const StateProperties &) {
            log.push_back(s == TestState::two ? "entered two" : "entered three");
        });
    self = &machine;
    log.clear();

    machine.set_state(TestState::two);

    // The nested call still sees one as the committed state, so it exits one again
    REQUIRE(log.size() == 7);
    CHECK(log[0] == "exit one");
    CHECK(log[1] == "enter two");
    CHECK(log[2] == "exit one");
    CHECK(log[3] == "enter three");
    CHECK(log[4] == "entered three");
    CHECK(log[5] == "nested done");
    CHECK(log[6] == "entered two");
    CHECK(machine.current_state() == TestState::two);
    CHECK(machine.transitions() == 3);
}

// ─── Hook faults ─────────────────────────────────────────────────────────────

TEST_CASE("Reentrancy: entry hook exception leaves the state unchanged") {
    i32 exits = 0;
    i32 reports = 0;
    Machine machine(
        {
            {TestState::one, props(ResultState::i, {}, [&] { exits++; })},
            {TestState::two, props(ResultState::ii,
                                   []() -> dp::Optional<TestState> { throw std::runtime_error("refused"); })},
        },
        TestState::one, fallback, [&](const TestState &, const StateProperties &) { reports++; });

    CHECK_THROWS_AS(machine.set_state(TestState::two), std::runtime_error);
    CHECK(machine.current_state() == TestState::one);
    CHECK(exits == 1);
    CHECK(reports == 1);
    CHECK(machine.transitions() == 1);
}

TEST_CASE("Reentrancy: exit hook exception aborts before resolution") {
    i32 enters = 0;
    Machine machine(
        {
            {TestState::one, props(ResultState::i, {}, [] { throw std::logic_error("stuck"); })},
            {TestState::two, props(ResultState::ii,
                                   [&]() -> dp::Optional<TestState> {
                                       enters++;
                                       return dp::nullopt;
                                   })},
        },
        TestState::one, fallback);

    CHECK_THROWS_AS(machine.set_state(TestState::two), std::logic_error);
    CHECK(enters == 0);
    CHECK(machine.current_state() == TestState::one);
}

TEST_CASE("Reentrancy: notification exception happens after commit") {
    bool armed = false;
    Machine machine(
        {
            {TestState::one, props(ResultState::i)},
            {TestState::two, props(ResultState::ii)},
        },
        TestState::one, fallback, [&](const TestState &, const StateProperties &) {
            if (armed)
                throw std::runtime_error("observer failed");
        });

    armed = true;
    CHECK_THROWS_AS(machine.set_state(TestState::two), std::runtime_error);
    CHECK(machine.current_state() == TestState::two);
}

TEST_CASE("Reentrancy: constructor propagates hook exceptions") {
    auto build = [] {
        Machine machine({{TestState::one, props(ResultState::i,
                                                []() -> dp::Optional<TestState> { throw std::runtime_error("no"); })}},
                        TestState::one, fallback);
    };
    CHECK_THROWS_AS(build(), std::runtime_error);
}

// ─── Asynchronous completions ────────────────────────────────────────────────

TEST_CASE("Reentrancy: stale completions are ignored by the hook") {
    // two = "opening": starts work that completes later and moves to three
    dp::Vector<std::function<void()>> pending;
    Machine *self = nullptr;

    Machine machine(
        {
            {TestState::one, props(ResultState::i)},
            {TestState::two, props(ResultState::ii,
                                   [&]() -> dp::Optional<TestState> {
                                       // This entry commits as the next transition
                                       const u64 expected = self->transitions() + 1;
                                       pending.push_back([&self, expected] {
                                           if (self->transitions() == expected && self->is(TestState::two))
                                               self->set_state(TestState::three);
                                       });
                                       return dp::nullopt;
                                   })},
            {TestState::three, props(ResultState::iii)},
        },
        TestState::one, fallback);
    self = &machine;

    SUBCASE("completion while still waiting") {
        machine.set_state(TestState::two);
        REQUIRE(pending.size() == 1);
        pending[0]();
        CHECK(machine.current_state() == TestState::three);
    }

    SUBCASE("completion after the machine moved on") {
        machine.set_state(TestState::two);
        machine.set_state(TestState::one);
        pending[0]();
        CHECK(machine.current_state() == TestState::one);
    }

    SUBCASE("completion from an earlier visit of the same state") {
        machine.set_state(TestState::two);
        machine.set_state(TestState::one);
        machine.set_state(TestState::two);
        REQUIRE(pending.size() == 2);
        pending[0]();
        CHECK(machine.current_state() == TestState::two);
        pending[1]();
        CHECK(machine.current_state() == TestState::three);
    }
}
