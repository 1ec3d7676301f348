#include "bot.hpp"

RandomBot::RandomBot(const unsigned int seed)
{
    this->rng.seed(seed);
}

int RandomBot::choose_action(const Board &board)
{
    std::vector<int> legal_actions = legal_moves(board);
    if(legal_actions.empty())
        return NO_ACTION;
    std::uniform_int_distribution<> dis(0, legal_actions.size() - 1);
    return legal_actions[dis(this->rng)];
}

double random_playout(const Board &board, std::mt19937 &rng,
                      const int max_depth, const double discount)
{
    validate_board(board);
    Board state = board;
    double total = 0.0;
    double weight = 1.0;
    for(int depth = 0; max_depth == 0 || depth < max_depth; depth++) {
        std::vector<int> legal_actions = legal_moves_unchecked(state);
        if(legal_actions.empty())
            break;
        std::uniform_int_distribution<> dis(0, legal_actions.size() - 1);
        TransitionResult result = apply_move_unchecked(state, legal_actions[dis(rng)]);
        total += weight * result.score_delta;
        weight *= discount;
        state = spawn_tile_unchecked(result.board, rng);
    }
    return total;
}
