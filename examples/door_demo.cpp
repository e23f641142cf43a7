#include <echo/echo.hpp>
#include <fsmkit.hpp>
#include <functional>

using namespace fsmkit;

// ─── Garage door with a slow motor ───────────────────────────────────────────
// Entering Opening or Closing starts motor travel that finishes later. The
// completion is an independent set_state() call, so each job remembers which
// transition started it and does nothing if the door has moved on since.

enum class Door : u8 { Closed, Opening, Open, Closing };

static const char *door_name(Door d) {
    switch (d) {
    case Door::Closed:
        return "Closed";
    case Door::Opening:
        return "Opening";
    case Door::Open:
        return "Open";
    case Door::Closing:
        return "Closing";
    }
    return "?";
}

struct DoorInfo : FsmProperties<Door> {
    const char *label = "";
};

struct MotorJob {
    u32 remaining_ms = 0;
    std::function<void()> done;
};

class GarageDoor {
    static constexpr u32 TRAVEL_MS = 300;

    dp::Vector<MotorJob> jobs_;
    bool obstructed_ = false;
    StateMachine<Door, DoorInfo> machine_;

    // Starts travel towards `arrive` and returns no redirect
    std::function<dp::Optional<Door>()> travel(Door moving, Door arrive) {
        return [this, moving, arrive]() -> dp::Optional<Door> {
            const u64 started = machine_.transitions() + 1;
            jobs_.push_back({TRAVEL_MS, [this, moving, arrive, started] {
                                 if (machine_.transitions() != started || !machine_.is(moving)) {
                                     echo::debug("stale motor completion for ", door_name(moving), " ignored");
                                     return;
                                 }
                                 apply(arrive);
                             }});
            return dp::nullopt;
        };
    }

    StateMachine<Door, DoorInfo>::Table plan() {
        StateMachine<Door, DoorInfo>::Table t;

        DoorInfo closed;
        closed.label = "closed";
        t[Door::Closed] = closed;

        DoorInfo open;
        open.label = "open";
        t[Door::Open] = open;

        DoorInfo opening;
        opening.label = "opening";
        opening.on_enter = travel(Door::Opening, Door::Open);
        t[Door::Opening] = opening;

        // An obstruction refuses Closing and reopens instead
        DoorInfo closing;
        closing.label = "closing";
        auto start_closing = travel(Door::Closing, Door::Closed);
        closing.on_enter = [this, start_closing]() -> dp::Optional<Door> {
            if (obstructed_) {
                echo::warn("obstruction detected, reopening");
                return Door::Opening;
            }
            return start_closing();
        };
        t[Door::Closing] = closing;

        return t;
    }

    void apply(Door target) {
        auto res = machine_.set_state(target);
        if (res.is_err()) {
            echo::error("door transition failed: ", res.error().message);
        }
    }

  public:
    GarageDoor()
        : machine_(plan(), Door::Closed, [](const Door &) { return DoorInfo{}; },
                   [](const Door &d, const DoorInfo &info) {
                       echo::info("door is ", info.label, " (", door_name(d), ")");
                   }) {}

    GarageDoor(const GarageDoor &) = delete;
    GarageDoor &operator=(const GarageDoor &) = delete;

    void press_open() { apply(Door::Opening); }
    void press_close() { apply(Door::Closing); }
    void set_obstructed(bool obstructed) { obstructed_ = obstructed; }

    Door state() const noexcept { return machine_.state(); }

    void update(u32 delta_ms) {
        dp::Vector<MotorJob> due;
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (it->remaining_ms <= delta_ms) {
                due.push_back(std::move(*it));
                it = jobs_.erase(it);
            } else {
                it->remaining_ms -= delta_ms;
                ++it;
            }
        }
        for (auto &job : due) {
            job.done();
        }
    }
};

int main() {
    echo::info("=== Garage Door Demo ===");

    GarageDoor door;

    echo::info("-- open fully");
    door.press_open();
    door.update(150);
    door.update(150);

    echo::info("-- close, change of mind halfway");
    door.press_close();
    door.update(150);
    door.press_open();
    door.update(150); // closing job arrives stale
    door.update(150); // opening job completes

    echo::info("-- close with an obstruction");
    door.set_obstructed(true);
    door.press_close();
    door.set_obstructed(false);
    door.update(300);

    echo::info("final state: ", door_name(door.state()));
    return 0;
}
