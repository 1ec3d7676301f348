#ifndef MCTS_NODE_HPP
#define MCTS_NODE_HPP

#include "../engine/engine.hpp"
#include <limits>
#include <random>
#include <vector>

/*
 * One decision point of the search tree. The board is the position after the
 * spawn that followed `action`. A node owns its children; `parent` is only
 * followed during backpropagation.
 */
struct MCTSNode
{
    Board board;
    int action;            // Move that led here, NO_ACTION for the root
    double reward;         // Score delta of that move
    bool game_over;
    int visit_count = 0;
    double total_value = 0.0;
    // Spread of the children's averages seen so far
    double min_avg = std::numeric_limits<double>::infinity();
    double max_avg = -std::numeric_limits<double>::infinity();
    std::vector<int> untried_actions;
    MCTSNode *parent;
    std::vector<MCTSNode *> children;

    MCTSNode(const Board &board, MCTSNode *parent = nullptr,
             const int action = NO_ACTION, const double reward = 0.0);
    ~MCTSNode();
    MCTSNode(const MCTSNode &) = delete;
    MCTSNode &operator=(const MCTSNode &) = delete;

    double avg_value() const;
    bool fully_expanded() const { return untried_actions.empty(); }
    double uct_value(const double explore_c, const bool range_scaling) const;
    MCTSNode *select_child(const double explore_c, const bool range_scaling) const;
    MCTSNode *best_child() const;
    MCTSNode *expand(std::mt19937 &rng);
    void update(const double value);
    void observe_child_avg(const double avg);
    MCTSNode *find_child(const int action) const;
    MCTSNode *detach_child(const Board &board);
    int subtree_size() const;
};

#endif
