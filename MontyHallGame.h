#ifndef MONTY_HALL_GAME_H
#define MONTY_HALL_GAME_H

#include <vector>
#include <string>
#include <random>
#include <ostream>
#include <stdexcept>

namespace MontyHall {

    // Doors are numbered 1..N, as announced on the show.
    using Door = int;

    const int kClassicDoorCount = 3;

    // --- Error Types ---
    // Bad input from the caller: door out of range, n < 1, unsupported door count.
    class InvalidArgument : public std::invalid_argument {
    public:
        explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) {}
    };

    // A structure that should be impossible to build, e.g. an assignment with two prizes.
    class InvalidState : public std::logic_error {
    public:
        explicit InvalidState(const std::string& what) : std::logic_error(what) {}
    };

    // What is behind a door ("car" or "goat" on the show)
    enum class DoorContent {
        Prize,
        Blank
    };

    enum class Strategy {
        Stay,
        Switch
    };

    enum class Outcome {
        Win,
        Lose
    };

    // Ordered mapping Door -> DoorContent. Built once per round, read-only afterwards.
    class Assignment {
    public:
        explicit Assignment(std::vector<DoorContent> contents);

        int doorCount() const { return static_cast<int>(m_contents.size()); }
        bool isValidDoor(Door door) const { return door >= 1 && door <= doorCount(); }

        /**
         * @brief Content behind a door.
         * @throws InvalidArgument if the door is outside 1..doorCount().
         */
        DoorContent at(Door door) const;

        /**
         * @brief Door hiding the prize.
         * @throws InvalidState unless exactly one door holds the prize.
         */
        Door prizeDoor() const;

        const std::vector<DoorContent>& contents() const { return m_contents; }

    private:
        std::vector<DoorContent> m_contents; // index 0 holds door 1
    };

    struct RoundResult {
        Strategy strategy = Strategy::Stay;
        Outcome outcome = Outcome::Lose;
    };

    // Full state of one played round. Both strategies share the same setup.
    struct RoundReport {
        Assignment assignment;
        Door initial_pick;
        Door revealed_door;
        Door stay_pick;
        Door switch_pick;
        RoundResult stay;
        RoundResult switched;
    };

    // --- Game Module Interface ---

    /**
     * @brief Places one prize and (doorCount - 1) blanks as a uniform random permutation.
     * @param rng The random source to draw from.
     * @param doorCount Number of doors. Must be at least 3.
     */
    Assignment createAssignment(std::mt19937& rng, int doorCount = kClassicDoorCount);

    /**
     * @brief Contestant's first pick, uniform over 1..doorCount.
     */
    Door selectInitialPick(std::mt19937& rng, int doorCount = kClassicDoorCount);

    /**
     * @brief Host opens a blank door that is not the contestant's pick.
     *
     * When the pick hides the prize the host chooses uniformly among the blank
     * doors. Otherwise the only eligible door is returned without touching the rng
     * (with more than three doors the choice among eligible doors is uniform).
     *
     * @throws InvalidArgument if the pick is out of range.
     * @throws InvalidState if the assignment does not hold exactly one prize.
     */
    Door revealDoor(const Assignment& assignment, Door pick, std::mt19937& rng);

    /**
     * @brief Final pick after the reveal.
     *
     * Stay keeps the initial pick. Switch takes the one door that is neither the
     * initial pick nor the revealed door, which is only defined for three doors;
     * any other door count is rejected rather than guessed.
     *
     * @throws InvalidArgument on out-of-range doors, initialPick == revealedDoor,
     *         or Switch with doorCount != 3.
     */
    Door resolveFinalPick(Strategy strategy, Door initialPick, Door revealedDoor,
                          int doorCount = kClassicDoorCount);

    /**
     * @brief Win iff the final pick hides the prize.
     * @throws InvalidArgument if finalPick is out of range.
     */
    Outcome determineOutcome(Door finalPick, const Assignment& assignment);

    // One setup, one initial pick, one reveal, evaluated for both strategies.
    RoundReport playRound(std::mt19937& rng, int doorCount = kClassicDoorCount);

    std::string toString(Strategy strategy);
    std::string toString(Outcome outcome);
    std::string toString(DoorContent content);

    // Narrated walkthrough of a single round from one strategy's point of view.
    void printRoundReport(const RoundReport& report, Strategy strategy, std::ostream& out);

} // namespace MontyHall

#endif // MONTY_HALL_GAME_H
