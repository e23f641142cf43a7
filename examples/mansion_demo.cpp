#include <echo/echo.hpp>
#include <fsmkit.hpp>
#include <iostream>
#include <string>
#include <utility>

using namespace fsmkit;

// ─── Cluedo mansion walk-through ─────────────────────────────────────────────
// Each room is a state. The upstairs landing costs a life every time it is
// entered and sends the visitor to the dungeon once no lives are left. The
// dungeon has no table entry: the default factory synthesises it, and the only
// way out is a reset.

enum class Room : u8 {
    Study,
    Hall,
    Lounge,
    DiningRoom,
    Kitchen,
    Ballroom,
    Conservatory,
    BilliardRoom,
    Library,
    Stairs,
    Landing,
    Dungeon
};

static const char *room_id(Room r) {
    switch (r) {
    case Room::Study:
        return "study";
    case Room::Hall:
        return "hall";
    case Room::Lounge:
        return "lounge";
    case Room::DiningRoom:
        return "diningRoom";
    case Room::Kitchen:
        return "kitchen";
    case Room::Ballroom:
        return "ballroom";
    case Room::Conservatory:
        return "conservatory";
    case Room::BilliardRoom:
        return "billiardRoom";
    case Room::Library:
        return "library";
    case Room::Stairs:
        return "stairs";
    case Room::Landing:
        return "landing";
    case Room::Dungeon:
        return "dungeon";
    }
    return "?";
}

struct RoomInfo : FsmProperties<Room> {
    dp::String name;
    dp::Optional<Room> north;
    dp::Optional<Room> south;
    dp::Optional<Room> east;
    dp::Optional<Room> west;
    dp::Optional<Room> tunnel;
    bool can_reset = false;
};

class Mansion {
    static constexpr i32 START_LIVES = 3;

    i32 lives_ = START_LIVES;
    StateMachine<Room, RoomInfo> machine_;

    static RoomInfo room(dp::String name) {
        RoomInfo info;
        info.name = std::move(name);
        return info;
    }

    StateMachine<Room, RoomInfo>::Table floor_plan() {
        StateMachine<Room, RoomInfo>::Table plan;

        auto study = room("Study");
        study.east = Room::Hall;
        study.tunnel = Room::Kitchen;
        plan[Room::Study] = study;

        auto hall = room("Hall");
        hall.west = Room::Study;
        hall.south = Room::Stairs;
        hall.east = Room::Lounge;
        plan[Room::Hall] = hall;

        auto lounge = room("Lounge");
        lounge.south = Room::DiningRoom;
        lounge.west = Room::Stairs;
        lounge.tunnel = Room::Conservatory;
        plan[Room::Lounge] = lounge;

        auto dining = room("Dining Room");
        dining.north = Room::Lounge;
        dining.west = Room::Stairs;
        plan[Room::DiningRoom] = dining;

        auto kitchen = room("Kitchen");
        kitchen.north = Room::DiningRoom;
        kitchen.tunnel = Room::Study;
        plan[Room::Kitchen] = kitchen;

        auto ballroom = room("Ball Room");
        ballroom.east = Room::Kitchen;
        ballroom.north = Room::Stairs;
        ballroom.west = Room::Conservatory;
        plan[Room::Ballroom] = ballroom;

        auto conservatory = room("Conservatory");
        conservatory.east = Room::Ballroom;
        conservatory.tunnel = Room::Lounge;
        plan[Room::Conservatory] = conservatory;

        auto billiard = room("Billiard Room");
        billiard.east = Room::Stairs;
        billiard.north = Room::Library;
        plan[Room::BilliardRoom] = billiard;

        auto library = room("Library");
        library.east = Room::Stairs;
        library.south = Room::BilliardRoom;
        plan[Room::Library] = library;

        auto stairs = room("Grand Staircase");
        stairs.north = Room::Hall;
        stairs.south = Room::Ballroom;
        stairs.east = Room::DiningRoom;
        stairs.west = Room::BilliardRoom;
        stairs.tunnel = Room::Landing;
        plan[Room::Stairs] = stairs;

        auto landing = room("Upstairs (you shouldn't be here)");
        landing.tunnel = Room::Stairs;
        landing.on_enter = [this]() -> dp::Optional<Room> {
            --lives_;
            if (lives_ <= 0)
                return Room::Dungeon;
            echo::warn("Going upstairs just cost you a life. ", lives_, " lives left.");
            return dp::nullopt;
        };
        plan[Room::Landing] = landing;

        // No entry for the dungeon
        return plan;
    }

    static RoomInfo synthesise(const Room &r) {
        auto info = room(dp::String(room_id(r)) + " (quiet in here, isn't it)");
        info.can_reset = true;
        return info;
    }

  public:
    Mansion()
        : machine_(floor_plan(), Room::Hall, synthesise,
                   [](const Room &, const RoomInfo &info) { echo::info("Just entered ", info.name); }) {}

    Mansion(const Mansion &) = delete;
    Mansion &operator=(const Mansion &) = delete;

    // Returns false when the command is not a usable exit from the current room
    bool move(const std::string &cmd) {
        const RoomInfo here = machine_.values();
        dp::Optional<Room> target;
        if (cmd == "n")
            target = here.north;
        else if (cmd == "s")
            target = here.south;
        else if (cmd == "e")
            target = here.east;
        else if (cmd == "w")
            target = here.west;
        else if (cmd == "t")
            target = here.tunnel;
        else if (cmd == "r" && here.can_reset) {
            lives_ = START_LIVES;
            target = Room::Hall;
        }

        if (!target.has_value()) {
            echo::warn("No way '", cmd, "' from ", here.name);
            return false;
        }
        auto res = machine_.set_state(*target);
        if (res.is_err()) {
            echo::error("move failed: ", res.error().message);
            return false;
        }
        return true;
    }

    void describe() const {
        const RoomInfo here = machine_.values();
        echo::info("[", here.name, "] lives=", lives_);
        auto show = [&](const char *dir, const dp::Optional<Room> &to) {
            if (to.has_value())
                echo::info("  ", dir, " -> ", machine_[*to].name);
        };
        show("n", here.north);
        show("s", here.south);
        show("e", here.east);
        show("w", here.west);
        show("t", here.tunnel);
        if (here.can_reset)
            echo::info("  r -> teleport back to the Hall");
    }
};

int main(int argc, char **argv) {
    echo::info("=== Mansion Demo ===");

    Mansion mansion;
    mansion.describe();

    if (argc > 1) {
        for (int i = 1; i < argc; ++i) {
            if (mansion.move(argv[i]))
                mansion.describe();
        }
        return 0;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "q")
            break;
        if (line.empty())
            continue;
        if (mansion.move(line))
            mansion.describe();
    }
    return 0;
}
