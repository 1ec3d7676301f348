#include "mcts_node.hpp"
#include <algorithm>
#include <cmath>

MCTSNode::MCTSNode(const Board &board, MCTSNode *parent, const int action, const double reward)
    : board(board), action(action), reward(reward), parent(parent)
{
    this->untried_actions = legal_moves_unchecked(this->board);
    this->game_over = this->untried_actions.empty();
}

MCTSNode::~MCTSNode()
{
    for (MCTSNode *child : this->children) {
        delete child;
    }
}

double MCTSNode::avg_value() const
{
    if (this->visit_count == 0)
        return 0.0;
    return this->total_value / this->visit_count;
}

double MCTSNode::uct_value(const double explore_c, const bool range_scaling) const
{
    if (this->visit_count == 0)
        return std::numeric_limits<double>::infinity();
    // Parent may still be at zero visits while another thread is mid-rollout
    const double parent_visits = std::max(this->parent->visit_count, 1);
    double scale = 1.0;
    if (range_scaling && this->parent->max_avg >= this->parent->min_avg)
        scale = this->parent->max_avg - this->parent->min_avg;
    return this->avg_value()
        + explore_c * scale * std::sqrt(std::log(parent_visits) / this->visit_count);
}

MCTSNode *MCTSNode::select_child(const double explore_c, const bool range_scaling) const
{
    double best_uct = -std::numeric_limits<double>::infinity();
    MCTSNode *best_child = nullptr;
    for (MCTSNode *child : this->children) {
        const double uct = child->uct_value(explore_c, range_scaling);
        if (best_child == nullptr || uct > best_uct) {
            best_uct = uct;
            best_child = child;
        }
    }
    return best_child;
}

// Most visited child, then best average, then lowest action index.
// Unvisited children are never chosen.
MCTSNode *MCTSNode::best_child() const
{
    MCTSNode *best = nullptr;
    for (MCTSNode *child : this->children) {
        if (child->visit_count == 0)
            continue;
        if (best == nullptr
            || child->visit_count > best->visit_count
            || (child->visit_count == best->visit_count && child->avg_value() > best->avg_value())
            || (child->visit_count == best->visit_count && child->avg_value() == best->avg_value()
                && child->action < best->action)) {
            best = child;
        }
    }
    return best;
}

MCTSNode *MCTSNode::expand(std::mt19937 &rng)
{
    std::uniform_int_distribution<> dis(0, this->untried_actions.size() - 1);
    const int action_idx = dis(rng);
    const int action = this->untried_actions[action_idx];
    this->untried_actions.erase(this->untried_actions.begin() + action_idx);

    TransitionResult result = apply_move_unchecked(this->board, action);
    Board next = spawn_tile_unchecked(result.board, rng);
    MCTSNode *child = new MCTSNode(next, this, action, result.score_delta);
    this->children.push_back(child);
    return child;
}

void MCTSNode::update(const double value)
{
    this->visit_count += 1;
    this->total_value += value;
}

void MCTSNode::observe_child_avg(const double avg)
{
    this->min_avg = std::min(this->min_avg, avg);
    this->max_avg = std::max(this->max_avg, avg);
}

MCTSNode *MCTSNode::find_child(const int action) const
{
    for (MCTSNode *child : this->children) {
        if (child->action == action)
            return child;
    }
    return nullptr;
}

// Unlinks the child holding `board`, the caller takes ownership
MCTSNode *MCTSNode::detach_child(const Board &board)
{
    for (auto it = this->children.begin(); it != this->children.end(); ++it) {
        if ((*it)->board == board) {
            MCTSNode *child = *it;
            this->children.erase(it);
            child->parent = nullptr;
            return child;
        }
    }
    return nullptr;
}

int MCTSNode::subtree_size() const
{
    int size = 1;
    for (const MCTSNode *child : this->children) {
        size += child->subtree_size();
    }
    return size;
}
