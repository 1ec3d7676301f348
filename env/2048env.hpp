#ifndef ENV2048_HPP
#define ENV2048_HPP

#include "../engine/engine.hpp"
#include <random>
#include <string>
#include <vector>

enum class RewardMode {
    ScoreDelta,   // Raw score gained by the move
    Log2Merge     // Sum of log2 of every tile produced by a merge
};

struct EnvConfig {
    unsigned int seed = 0;
    bool use_seed = false;          // Otherwise seeded from std::random_device
    bool reseed_on_reset = false;   // Replay the same episode on every reset
    RewardMode reward_mode = RewardMode::ScoreDelta;
    double illegal_move_penalty = 0.0;
    int max_steps = 0;              // 0 means unlimited
    int max_illegal_moves = 0;      // 0 means unlimited
    int win_tile = 2048;
    bool stop_on_win = false;
};

struct StepInfo {
    int score = 0;
    int highest = 0;
    int steps = 0;
    int illegal_moves = 0;
    bool is_valid = true;
    bool truncated = false;
};

struct StepResult {
    Board board;
    double reward;
    bool done;
    StepInfo info;
};

class Env2048
{
    private:
        EnvConfig config;
        Board board;
        int score;
        int n_actions;
        int steps;
        int illegal_moves;
        bool game_over;
        bool last_move_valid;
        std::mt19937 rng;

        double compute_reward(const TransitionResult &transition) const;
        bool is_truncated() const;
        StepInfo make_info(const bool is_valid) const;

    public:
        explicit Env2048(const EnvConfig &config = EnvConfig());
        Board reset();
        StepResult step(const int action);
        std::string render() const;

        bool is_game_over() const { return game_over; }
        bool has_won() const;
        bool is_move_legal(const int action) const;
        std::vector<int> get_legal_actions() const;
        void set_board(const Board &new_board);
        void set_score(const int new_score);
        const Board &get_board() const { return board; }
        int get_score() const { return score; }
        int get_n_actions() const { return n_actions; }
        int get_steps() const { return steps; }
        int get_illegal_moves() const { return illegal_moves; }
        bool is_last_move_valid() const { return last_move_valid; }
        const EnvConfig &get_config() const { return config; }
};

#endif
