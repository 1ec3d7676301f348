#ifndef BOT_HPP
#define BOT_HPP

#include "../engine/engine.hpp"
#include <random>

/*
 * Anything that picks a move from an observation. Bots never touch the live
 * environment; they only see the board it returns.
 */
class Bot
{
    public:
        virtual ~Bot() = default;
        // Returns an action in 0..3, or NO_ACTION when the board is terminal
        virtual int choose_action(const Board &board) = 0;
        // Called at the start of every episode
        virtual void reset() {}
};

class RandomBot : public Bot
{
    private:
        std::mt19937 rng;

    public:
        explicit RandomBot(const unsigned int seed = 1);
        int choose_action(const Board &board) override;
};

/*
 * Plays uniform random legal moves (each followed by a spawn) from `board`
 * until the game ends or `max_depth` moves were made (0 means no cap).
 * Returns the sum of discount^t * score_delta_t.
 */
double random_playout(const Board &board, std::mt19937 &rng,
                      const int max_depth, const double discount = 1.0);

#endif
