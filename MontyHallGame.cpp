#include "MontyHallGame.h"
#include <algorithm>
#include <utility>

namespace MontyHall {

    static void requireDoorCount(int doorCount) {
        if (doorCount < kClassicDoorCount) {
            throw InvalidArgument("Door count must be at least " + std::to_string(kClassicDoorCount)
                                  + ", got " + std::to_string(doorCount) + ".");
        }
    }

    static void requireDoor(Door door, int doorCount, const char* what) {
        if (door < 1 || door > doorCount) {
            throw InvalidArgument(std::string(what) + " " + std::to_string(door)
                                  + " is outside doors 1.." + std::to_string(doorCount) + ".");
        }
    }

    // --- Assignment ---

    Assignment::Assignment(std::vector<DoorContent> contents) : m_contents(std::move(contents)) {}

    DoorContent Assignment::at(Door door) const {
        requireDoor(door, doorCount(), "Door");
        return m_contents[door - 1];
    }

    Door Assignment::prizeDoor() const {
        Door prize = 0;
        int prize_count = 0;
        for (int i = 0; i < doorCount(); ++i) {
            if (m_contents[i] == DoorContent::Prize) {
                prize = i + 1;
                prize_count++;
            }
        }
        if (prize_count != 1) {
            throw InvalidState("Assignment must hold exactly one prize, found "
                               + std::to_string(prize_count) + ".");
        }
        return prize;
    }

    // --- Round Stages ---

    Assignment createAssignment(std::mt19937& rng, int doorCount) {
        requireDoorCount(doorCount);
        std::vector<DoorContent> contents(doorCount, DoorContent::Blank);
        contents[0] = DoorContent::Prize;
        std::shuffle(contents.begin(), contents.end(), rng);
        return Assignment(std::move(contents));
    }

    Door selectInitialPick(std::mt19937& rng, int doorCount) {
        requireDoorCount(doorCount);
        std::uniform_int_distribution<int> door_dist(1, doorCount);
        return door_dist(rng);
    }

    Door revealDoor(const Assignment& assignment, Door pick, std::mt19937& rng) {
        requireDoor(pick, assignment.doorCount(), "Pick");
        const Door prize = assignment.prizeDoor(); // throws InvalidState on a malformed setup

        // Blank doors the contestant is not holding. If the pick is the prize this is every blank door.
        std::vector<Door> candidates;
        candidates.reserve(assignment.doorCount());
        for (Door door = 1; door <= assignment.doorCount(); ++door) {
            if (door != prize && door != pick) {
                candidates.push_back(door);
            }
        }

        if (candidates.size() == 1) {
            return candidates.front();
        }
        std::uniform_int_distribution<size_t> candidate_dist(0, candidates.size() - 1);
        return candidates[candidate_dist(rng)];
    }

    Door resolveFinalPick(Strategy strategy, Door initialPick, Door revealedDoor, int doorCount) {
        requireDoorCount(doorCount);
        requireDoor(initialPick, doorCount, "Initial pick");
        requireDoor(revealedDoor, doorCount, "Revealed door");
        if (initialPick == revealedDoor) {
            throw InvalidArgument("The host cannot reveal the contestant's own door ("
                                  + std::to_string(initialPick) + ").");
        }

        if (strategy == Strategy::Stay) {
            return initialPick;
        }

        // TODO: pick a rule for switching among several unopened doors if more than 3 doors are ever supported.
        if (doorCount != kClassicDoorCount) {
            throw InvalidArgument("Switching is only defined when exactly one other door remains ("
                                  + std::to_string(kClassicDoorCount) + " doors), got "
                                  + std::to_string(doorCount) + " doors.");
        }
        for (Door door = 1; door <= doorCount; ++door) {
            if (door != initialPick && door != revealedDoor) {
                return door;
            }
        }
        throw InvalidState("No door left to switch to.");
    }

    Outcome determineOutcome(Door finalPick, const Assignment& assignment) {
        requireDoor(finalPick, assignment.doorCount(), "Final pick");
        return assignment.at(finalPick) == DoorContent::Prize ? Outcome::Win : Outcome::Lose;
    }

    RoundReport playRound(std::mt19937& rng, int doorCount) {
        Assignment assignment = createAssignment(rng, doorCount);
        const Door first_pick = selectInitialPick(rng, doorCount);
        const Door opened_door = revealDoor(assignment, first_pick, rng);

        const Door stay_pick = resolveFinalPick(Strategy::Stay, first_pick, opened_door, doorCount);
        const Door switch_pick = resolveFinalPick(Strategy::Switch, first_pick, opened_door, doorCount);

        const RoundResult stay{Strategy::Stay, determineOutcome(stay_pick, assignment)};
        const RoundResult switched{Strategy::Switch, determineOutcome(switch_pick, assignment)};

        return RoundReport{std::move(assignment), first_pick, opened_door, stay_pick, switch_pick, stay, switched};
    }

    // --- Reporting ---

    std::string toString(Strategy strategy) {
        return strategy == Strategy::Stay ? "stay" : "switch";
    }

    std::string toString(Outcome outcome) {
        return outcome == Outcome::Win ? "WIN" : "LOSE";
    }

    std::string toString(DoorContent content) {
        return content == DoorContent::Prize ? "car" : "goat";
    }

    void printRoundReport(const RoundReport& report, Strategy strategy, std::ostream& out) {
        const bool stayed = strategy == Strategy::Stay;
        out << "GAME SETUP (" << toString(strategy) << ")" << std::endl;
        for (Door door = 1; door <= report.assignment.doorCount(); ++door) {
            out << "  Door " << door << ": " << toString(report.assignment.at(door)) << std::endl;
        }
        out << "My initial selection: " << report.initial_pick << std::endl;
        out << "The opened goat door: " << report.revealed_door << std::endl;
        out << "My final selection: " << (stayed ? report.stay_pick : report.switch_pick) << std::endl;
        out << "GAME OUTCOME: " << toString(stayed ? report.stay.outcome : report.switched.outcome) << std::endl;
    }

} // namespace MontyHall
