#pragma once
#include "../engine/engine.hpp"
#include "../bot/bot.hpp"
#include "mcts_config.hpp"
#include "mcts_node.hpp"

#include <atomic>
#include <chrono>
#include <random>
#include <vector>

struct ActionStats {
    int action;
    int visits;
    double avg_value;
};

struct SearchStats {
    int simulations = 0;
    int tree_size = 0;
    double elapsed_ms = 0.0;
    bool reused_tree = false;
    std::vector<ActionStats> actions;
};

/*
 * UCT search over the engine. The live environment is never touched; every
 * simulated move and spawn uses the bot's own generators.
 */
class MCTSBot : public Bot
{
public:
    explicit MCTSBot(const MCTSConfig &config = MCTSConfig());
    ~MCTSBot();
    MCTSBot(const MCTSBot &) = delete;
    MCTSBot &operator=(const MCTSBot &) = delete;

    int choose_action(const Board &board) override;
    void reset() override;
    const SearchStats &last_stats() const { return stats; }
    const MCTSConfig &get_config() const { return config; }
    const MCTSNode *get_root() const { return root; }

private:
    typedef std::chrono::steady_clock Clock;

    const MCTSConfig config;
    MCTSNode *root = nullptr;
    std::mt19937 rng;
    SearchStats stats;

    bool prepare_root(const Board &board);
    void run_search();
    void run_sequential(const Clock::time_point &start);
    void run_parallel(const Clock::time_point &start);
    bool claim_simulation(std::atomic<int> &claimed, const Clock::time_point &start) const;
    MCTSNode *select_and_expand(std::mt19937 &rng);
    double rollout(const Board &board, std::mt19937 &rng) const;
    void backpropagate(MCTSNode *leaf, double value) const;
    int get_best_action() const;
    void fill_stats();
    void delete_tree();
};

int mcts_action(const Board &board, const MCTSConfig &config = MCTSConfig());
