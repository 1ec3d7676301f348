#include "2048env.hpp"
#include <sstream>
#include <stdexcept>

Env2048::Env2048(const EnvConfig &config)
    : config(config)
{
    if(config.max_steps < 0 || config.max_illegal_moves < 0) {
        throw std::invalid_argument("Step limits must be non-negative");
    }
    if(config.illegal_move_penalty < 0.0) {
        throw std::invalid_argument("Illegal move penalty must be non-negative");
    }
    if(config.use_seed) {
        this->rng.seed(config.seed);
    } else {
        std::random_device rd;
        this->rng.seed(rd());
    }

    this->n_actions = N_ACTIONS;
    this->last_move_valid = true;

    reset();
}

Board Env2048::reset()
{
    if(this->config.use_seed && this->config.reseed_on_reset)
        this->rng.seed(this->config.seed);

    this->board = empty_board();
    this->score = 0;
    this->steps = 0;
    this->illegal_moves = 0;
    this->last_move_valid = true;
    this->board = spawn_tile(this->board, this->rng);
    this->board = spawn_tile(this->board, this->rng);
    this->game_over = is_terminal(this->board);
    return board;
}

double Env2048::compute_reward(const TransitionResult &transition) const
{
    switch(this->config.reward_mode) {
        case RewardMode::Log2Merge:
            return transition.merge_log2;
        case RewardMode::ScoreDelta:
        default:
            return static_cast<double>(transition.score_delta);
    }
}

bool Env2048::is_truncated() const
{
    if(this->config.max_steps > 0 && this->steps >= this->config.max_steps)
        return true;
    if(this->config.max_illegal_moves > 0 && this->illegal_moves > this->config.max_illegal_moves)
        return true;
    return false;
}

bool Env2048::has_won() const
{
    return max_tile(this->board) >= this->config.win_tile;
}

StepInfo Env2048::make_info(const bool is_valid) const
{
    StepInfo info;
    info.score = this->score;
    info.highest = max_tile(this->board);
    info.steps = this->steps;
    info.illegal_moves = this->illegal_moves;
    info.is_valid = is_valid;
    info.truncated = is_truncated();
    return info;
}

StepResult Env2048::step(const int action)
{
    validate_action(action);
    this->steps++;

    TransitionResult transition = apply_move(this->board, action);
    this->last_move_valid = transition.moved;
    if(!transition.moved) {
        // No-op: board, score and terminal flag are left untouched
        this->illegal_moves++;
        StepInfo info = make_info(false);
        bool done = this->game_over || info.truncated
                    || (this->config.stop_on_win && has_won());
        return {this->board, -this->config.illegal_move_penalty, done, info};
    }

    this->score += transition.score_delta;
    this->board = spawn_tile(transition.board, this->rng);
    this->game_over = is_terminal(this->board);

    StepInfo info = make_info(true);
    bool done = this->game_over || info.truncated
                || (this->config.stop_on_win && has_won());
    return {this->board, compute_reward(transition), done, info};
}

bool Env2048::is_move_legal(const int action) const
{
    validate_action(action);
    return apply_move(this->board, action).moved;
}

std::vector<int> Env2048::get_legal_actions() const
{
    return legal_moves(this->board);
}

void Env2048::set_board(const Board &new_board)
{
    validate_board(new_board);
    this->board = new_board;
    this->game_over = is_terminal(this->board);
}

void Env2048::set_score(const int new_score)
{
    if(new_score < 0) {
        throw std::invalid_argument("Score must be non-negative");
    }
    this->score = new_score;
}

std::string Env2048::render() const
{
    std::ostringstream oss;
    oss << "Score: " << this->score << "\n";
    oss << "Highest: " << max_tile(this->board) << "\n";
    oss << board_to_string(this->board) << "\n";
    return oss.str();
}
