#include <random>
#include <iostream>
#include <stdexcept>
#include <omp.h>
#include "mcts.hpp"

// #define DEBUG

void validate_config(const MCTSConfig &config)
{
    if (config.iterations < 0)
        throw std::invalid_argument("MCTS iterations must be non-negative");
    if (config.time_limit_ms < 0)
        throw std::invalid_argument("MCTS time limit must be non-negative");
    if (config.rollout_depth < 0)
        throw std::invalid_argument("MCTS rollout depth must be non-negative");
    if (config.exploration_constant < 0.0)
        throw std::invalid_argument("MCTS exploration constant must be non-negative");
    if (config.discount <= 0.0 || config.discount > 1.0)
        throw std::invalid_argument("MCTS discount must be in (0, 1]");
    if (config.num_threads == 0)
        throw std::invalid_argument("MCTS needs at least one thread");
}

MCTSBot::MCTSBot(const MCTSConfig &config)
    : config(config)
{
    validate_config(this->config);
    this->rng.seed(this->config.seed);
}

MCTSBot::~MCTSBot()
{
    this->delete_tree();
}

void MCTSBot::delete_tree()
{
    delete this->root;
    this->root = nullptr;
}

void MCTSBot::reset()
{
    this->delete_tree();
    this->rng.seed(this->config.seed);
    this->stats = SearchStats();
}

/*
 * Reuses the subtree of the previous decision when the observed board is one
 * of the previous root's children. Returns true if a subtree was kept.
 */
bool MCTSBot::prepare_root(const Board &board)
{
    if (this->config.reuse_tree && this->root != nullptr) {
        if (this->root->board == board)
            return true;
        MCTSNode *child = this->root->detach_child(board);
        if (child != nullptr) {
            this->delete_tree();
            child->action = NO_ACTION;
            child->reward = 0.0;
            this->root = child;
            return true;
        }
    }
    this->delete_tree();
    this->root = new MCTSNode(board);
    return false;
}

int MCTSBot::choose_action(const Board &board)
{
    validate_board(board);
    this->stats = SearchStats();

    std::vector<int> legal_actions = legal_moves(board);
    if (legal_actions.empty()) {
        this->delete_tree();
        return NO_ACTION;
    }
    if (legal_actions.size() == 1) {
        // Nothing to compare, skip the search
        this->delete_tree();
        this->stats.actions.push_back({legal_actions[0], 0, 0.0});
        return legal_actions[0];
    }

    this->stats.reused_tree = this->prepare_root(board);
    this->run_search();
    this->fill_stats();

    const int action = this->get_best_action();
    if (action == NO_ACTION)
        std::cerr << "[MCTS] Budget exhausted before any child was expanded" << std::endl;
#ifdef DEBUG
    std::cerr << "[MCTS] " << this->stats.simulations << " simulations, "
              << this->stats.tree_size << " nodes, chose " << action_name(action) << std::endl;
#endif
    return action;
}

void MCTSBot::run_search()
{
    const Clock::time_point start = Clock::now();
    if (this->config.num_threads > 1)
        this->run_parallel(start);
    else
        this->run_sequential(start);
    this->stats.elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

// Budget is checked between simulations, a rollout in flight always finishes
bool MCTSBot::claim_simulation(std::atomic<int> &claimed, const Clock::time_point &start) const
{
    if (this->config.time_limit_ms > 0) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        if (elapsed.count() >= this->config.time_limit_ms)
            return false;
        if (this->config.iterations == 0) {
            claimed.fetch_add(1);
            return true;
        }
    }
    return claimed.fetch_add(1) < this->config.iterations;
}

void MCTSBot::run_sequential(const Clock::time_point &start)
{
    std::atomic<int> claimed(0);
    while (this->claim_simulation(claimed, start)) {
        MCTSNode *leaf = this->select_and_expand(this->rng);
        const double value = this->rollout(leaf->board, this->rng);
        this->backpropagate(leaf, value);
        this->stats.simulations++;
    }
}

/*
 * Tree walks and updates happen inside one critical section; only the
 * rollouts run concurrently. Nodes are never freed during a search, so a
 * leaf's board can be read outside the lock.
 */
void MCTSBot::run_parallel(const Clock::time_point &start)
{
    std::atomic<int> claimed(0);
    std::atomic<int> completed(0);
    const int num_threads = static_cast<int>(this->config.num_threads);

    std::vector<unsigned int> thread_seeds(num_threads);
    const unsigned int base_seed = this->rng();
    for (int tid = 0; tid < num_threads; tid++)
        thread_seeds[tid] = base_seed + tid * 13331;

    #pragma omp parallel num_threads(num_threads)
    {
        std::mt19937 thread_rng(thread_seeds[omp_get_thread_num()]);
        while (this->claim_simulation(claimed, start)) {
            MCTSNode *leaf = nullptr;
            #pragma omp critical(mcts_tree)
            leaf = this->select_and_expand(thread_rng);

            const double value = this->rollout(leaf->board, thread_rng);

            #pragma omp critical(mcts_tree)
            this->backpropagate(leaf, value);
            completed.fetch_add(1);
        }
    }
    this->stats.simulations = completed.load();
}

MCTSNode *MCTSBot::select_and_expand(std::mt19937 &rng)
{
    MCTSNode *cursor = this->root;
    while (cursor->fully_expanded() && !cursor->children.empty()) {
        cursor = cursor->select_child(this->config.exploration_constant,
                                      this->config.value_range_scaling);
    }
    if (cursor->game_over)
        return cursor;
    return cursor->expand(rng);
}

double MCTSBot::rollout(const Board &board, std::mt19937 &rng) const
{
    return random_playout(board, rng, this->config.rollout_depth, this->config.discount);
}

/*
 * Every node from the leaf up to the root is updated. The value credited to
 * a node is the return measured from that node: the rollout plus the rewards
 * of the moves between it and the leaf.
 */
void MCTSBot::backpropagate(MCTSNode *leaf, double value) const
{
    MCTSNode *cursor = leaf;
    while (cursor != nullptr) {
        value = cursor->reward + this->config.discount * value;
        cursor->update(value);
        if (cursor->parent != nullptr)
            cursor->parent->observe_child_avg(cursor->avg_value());
        cursor = cursor->parent;
    }
}

int MCTSBot::get_best_action() const
{
    const MCTSNode *best = this->root->best_child();
    return (best == nullptr) ? NO_ACTION : best->action;
}

void MCTSBot::fill_stats()
{
    this->stats.tree_size = this->root->subtree_size();
    for (int action = 0; action < N_ACTIONS; action++) {
        const MCTSNode *child = this->root->find_child(action);
        if (child != nullptr)
            this->stats.actions.push_back({action, child->visit_count, child->avg_value()});
    }
}

int mcts_action(const Board &board, const MCTSConfig &config)
{
    MCTSBot bot(config);
    return bot.choose_action(board);
}
