#include "flat_monte_carlo.hpp"
#include <limits>
#include <stdexcept>
#include <omp.h>

FlatMonteCarloBot::FlatMonteCarloBot(const FlatMCConfig &config)
    : config(config)
{
    if(config.playouts_per_move <= 0)
        throw std::invalid_argument("Flat Monte Carlo needs at least one playout per move");
    if(config.rollout_depth < 0)
        throw std::invalid_argument("Rollout depth must be non-negative");
    if(config.num_threads == 0)
        throw std::invalid_argument("Flat Monte Carlo needs at least one thread");
    this->rng.seed(config.seed);
}

void FlatMonteCarloBot::reset()
{
    this->rng.seed(this->config.seed);
    this->last_values.clear();
}

double FlatMonteCarloBot::evaluate_move(const Board &board, const int action, std::mt19937 &move_rng) const
{
    TransitionResult first = apply_move_unchecked(board, action);
    double total = 0.0;
    for(int i = 0; i < this->config.playouts_per_move; i++) {
        Board state = spawn_tile_unchecked(first.board, move_rng);
        total += first.score_delta + random_playout(state, move_rng, this->config.rollout_depth);
    }
    return total / this->config.playouts_per_move;
}

int FlatMonteCarloBot::choose_action(const Board &board)
{
    validate_board(board);
    this->last_values.assign(N_ACTIONS, -std::numeric_limits<double>::infinity());

    std::vector<int> actions = legal_moves(board);
    if(actions.empty())
        return NO_ACTION;
    if(actions.size() == 1)
        return actions[0];

    // One independent stream per first move
    const unsigned int base_seed = this->rng();
    const int n_moves = actions.size();
    std::vector<double> values(n_moves, 0.0);
    #pragma omp parallel for num_threads(this->config.num_threads) schedule(dynamic)
    for(int i = 0; i < n_moves; i++) {
        std::mt19937 move_rng(base_seed + actions[i] * 13331);
        values[i] = evaluate_move(board, actions[i], move_rng);
    }

    int best = 0;
    for(int i = 0; i < n_moves; i++) {
        this->last_values[actions[i]] = values[i];
        if(values[i] > values[best])
            best = i;
    }
    return actions[best];
}
