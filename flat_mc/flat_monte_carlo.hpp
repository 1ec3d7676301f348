#ifndef FLAT_MONTE_CARLO_HPP
#define FLAT_MONTE_CARLO_HPP

#include "../engine/engine.hpp"
#include "../bot/bot.hpp"
#include <random>
#include <vector>

struct FlatMCConfig {
    int playouts_per_move = 25;
    int rollout_depth = 0;       // 0 plays every playout to the end
    unsigned int seed = 1;
    unsigned int num_threads = N_ACTIONS;
};

/*
 * Flat Monte Carlo: no tree. Every legal first move is scored by the mean
 * return of independent random playouts started after it.
 */
class FlatMonteCarloBot : public Bot
{
    private:
        const FlatMCConfig config;
        std::mt19937 rng;
        std::vector<double> last_values;

        double evaluate_move(const Board &board, const int action, std::mt19937 &move_rng) const;

    public:
        explicit FlatMonteCarloBot(const FlatMCConfig &config = FlatMCConfig());
        int choose_action(const Board &board) override;
        void reset() override;
        // Mean return per action from the last decision, -inf for illegal moves
        const std::vector<double> &get_last_values() const { return last_values; }
};

#endif
