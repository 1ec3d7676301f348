/**
 * MCTS Tests
 *
 * Search edge cases (terminal root, forced move), UCT selection, statistics
 * bookkeeping, reproducibility, tree reuse and the parallel search path.
 */

#include <doctest/doctest.h>
#include "../mcts/mcts.hpp"
#include "../env/2048env.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <vector>

namespace {

const Board kTerminalBoard = {
    {2, 4, 2, 4},
    {4, 2, 4, 2},
    {2, 4, 2, 4},
    {4, 2, 4, 2}
};

// Only Left changes this board
const Board kForcedLeft = {
    {0, 2, 4, 2},
    {0, 4, 2, 4},
    {0, 2, 4, 2},
    {0, 4, 2, 4}
};

const Board kOpening = {
    {2, 0, 0, 0},
    {0, 0, 0, 0},
    {0, 0, 2, 0},
    {0, 0, 0, 0}
};

MCTSConfig small_config(const int iterations)
{
    MCTSConfig config;
    config.iterations = iterations;
    config.rollout_depth = 10;
    config.seed = 7;
    return config;
}

bool contains(const std::vector<int> &actions, const int action)
{
    return std::find(actions.begin(), actions.end(), action) != actions.end();
}

}  // namespace

TEST_SUITE("MCTS edge cases") {

    TEST_CASE("Terminal root reports no legal move") {
        MCTSBot bot(small_config(100));
        CHECK(bot.choose_action(kTerminalBoard) == NO_ACTION);
        CHECK(bot.last_stats().simulations == 0);
    }

    TEST_CASE("Single legal move is returned without simulations") {
        MCTSBot bot(small_config(0));
        CHECK(bot.choose_action(kForcedLeft) == Left);
        CHECK(bot.last_stats().simulations == 0);
        CHECK(mcts_action(kForcedLeft, small_config(0)) == Left);
    }

    TEST_CASE("Zero budget with several legal moves reports no move") {
        MCTSBot bot(small_config(0));
        CHECK(bot.choose_action(kOpening) == NO_ACTION);
    }

    TEST_CASE("Malformed input is rejected") {
        MCTSBot bot(small_config(10));
        Board bad = kOpening;
        bad[0][0] = 5;
        CHECK_THROWS_AS(bot.choose_action(bad), std::invalid_argument);

        MCTSConfig config;
        config.iterations = -1;
        CHECK_THROWS_AS(MCTSBot{config}, std::invalid_argument);
        config = MCTSConfig();
        config.num_threads = 0;
        CHECK_THROWS_AS(MCTSBot{config}, std::invalid_argument);
        config = MCTSConfig();
        config.discount = 0.0;
        CHECK_THROWS_AS(validate_config(config), std::invalid_argument);
    }
}

TEST_SUITE("MCTSNode") {

    TEST_CASE("Unvisited child has unbounded priority") {
        MCTSNode root(kOpening);
        std::mt19937 rng(1);
        MCTSNode *visited = root.expand(rng);
        MCTSNode *fresh = root.expand(rng);
        root.update(10.0);
        visited->update(1000.0);

        CHECK(std::isinf(fresh->uct_value(1.41, false)));
        CHECK(root.select_child(1.41, false) == fresh);
    }

    TEST_CASE("UCT value follows average plus exploration bonus") {
        MCTSNode root(kOpening);
        std::mt19937 rng(1);
        MCTSNode *child = root.expand(rng);
        for (int i = 0; i < 10; i++)
            root.update(0.0);
        child->update(4.0);
        child->update(6.0);

        const double expected = 5.0 + 1.41 * std::sqrt(std::log(10.0) / 2.0);
        CHECK(child->avg_value() == doctest::Approx(5.0));
        CHECK(child->uct_value(1.41, false) == doctest::Approx(expected));
    }

    TEST_CASE("Larger exploration constant prefers the rarely visited child") {
        MCTSNode root(kOpening);
        std::mt19937 rng(1);
        MCTSNode *often = root.expand(rng);
        MCTSNode *rarely = root.expand(rng);
        for (int i = 0; i < 100; i++)
            root.update(0.0);
        for (int i = 0; i < 90; i++)
            often->update(10.0);
        for (int i = 0; i < 10; i++)
            rarely->update(8.0);

        CHECK(root.select_child(0.0, false) == often);
        CHECK(root.select_child(10.0, false) == rarely);
    }

    TEST_CASE("Best child prefers visits, then average, then lower action") {
        MCTSNode root(kOpening);
        MCTSNode *up = new MCTSNode(kOpening, &root, Up, 0.0);
        MCTSNode *down = new MCTSNode(kOpening, &root, Down, 0.0);
        MCTSNode *left = new MCTSNode(kOpening, &root, Left, 0.0);
        MCTSNode *right = new MCTSNode(kOpening, &root, Right, 0.0);
        // Out of action order on purpose
        root.children = {right, left, down, up};

        right->visit_count = 5;
        right->total_value = 50.0;
        left->visit_count = 5;
        left->total_value = 60.0;
        CHECK(root.best_child() == left);

        left->total_value = 50.0;
        CHECK(root.best_child() == left);

        down->visit_count = 5;
        down->total_value = 50.0;
        CHECK(root.best_child() == down);

        // Unvisited children never win, even with the lowest action
        CHECK(up->visit_count == 0);
        up->total_value = 1000.0;
        CHECK(root.best_child() == down);

        right->visit_count = 6;
        right->total_value = 6.0;
        CHECK(root.best_child() == right);
    }

    TEST_CASE("No visited child means no best child") {
        MCTSNode root(kOpening);
        std::mt19937 rng(2);
        root.expand(rng);
        CHECK(root.best_child() == nullptr);
    }

    TEST_CASE("Expansion consumes untried moves and materializes legal children") {
        MCTSNode root(kOpening);
        std::mt19937 rng(5);
        const std::vector<int> legal = legal_moves(kOpening);
        CHECK(root.untried_actions == legal);
        while (!root.fully_expanded()) {
            MCTSNode *child = root.expand(rng);
            CHECK(child->parent == &root);
            CHECK(contains(legal, child->action));
            CHECK(count_tiles(child->board) == count_tiles(apply_move(kOpening, child->action).board) + 1);
        }
        CHECK(root.children.size() == legal.size());
        CHECK(root.subtree_size() == 1 + static_cast<int>(legal.size()));

        MCTSNode *detached = root.detach_child(root.children.front()->board);
        REQUIRE(detached != nullptr);
        CHECK(detached->parent == nullptr);
        CHECK(root.children.size() == legal.size() - 1);
        delete detached;
    }
}

TEST_SUITE("MCTS search") {

    TEST_CASE("Visit counts add up after a fresh search") {
        MCTSBot bot(small_config(200));
        const int action = bot.choose_action(kOpening);
        const SearchStats &stats = bot.last_stats();

        CHECK(contains(legal_moves(kOpening), action));
        CHECK(stats.simulations == 200);
        CHECK_FALSE(stats.reused_tree);
        REQUIRE(bot.get_root() != nullptr);
        CHECK(bot.get_root()->visit_count == 200);

        int child_visits = 0;
        int best_visits = 0;
        for (const ActionStats &a : stats.actions) {
            child_visits += a.visits;
            best_visits = std::max(best_visits, a.visits);
        }
        CHECK(child_visits == 200);
        // The chosen move is the most visited one
        for (const ActionStats &a : stats.actions) {
            if (a.action == action) {
                CHECK(a.visits == best_visits);
            }
        }
        CHECK(stats.tree_size == bot.get_root()->subtree_size());
    }

    TEST_CASE("Discounted returns are credited to every ancestor") {
        MCTSConfig config = small_config(50);
        config.discount = 0.9;
        MCTSBot bot(config);
        CHECK(bot.get_config().discount == 0.9);
        bot.choose_action(kOpening);
        const MCTSNode *root = bot.get_root();
        REQUIRE(root != nullptr);

        // The root has no move reward, so each simulation adds
        // 0.9 * (value credited to the child it went through)
        double child_total = 0.0;
        for (const MCTSNode *child : root->children)
            child_total += child->total_value;
        CHECK(root->total_value == doctest::Approx(0.9 * child_total));

        // One level down: a visited child with expanded children got its own
        // rollout on expansion plus a discounted share of each grandchild
        for (const MCTSNode *child : root->children) {
            double grandchild_total = 0.0;
            int grandchild_visits = 0;
            for (const MCTSNode *g : child->children) {
                grandchild_total += g->total_value;
                grandchild_visits += g->visit_count;
            }
            CHECK(child->visit_count == grandchild_visits + 1);
            CHECK(child->total_value + 1e-6 >= child->reward * child->visit_count + 0.9 * grandchild_total);
        }
    }

    TEST_CASE("Undiscounted backpropagation adds the move rewards") {
        MCTSConfig config = small_config(30);
        config.discount = 1.0;
        MCTSBot bot(config);
        bot.choose_action(kOpening);
        const MCTSNode *root = bot.get_root();
        double child_total = 0.0;
        for (const MCTSNode *child : root->children)
            child_total += child->total_value;
        CHECK(root->total_value == doctest::Approx(child_total));
    }

    TEST_CASE("Same seed gives the same decision") {
        MCTSBot a(small_config(150));
        MCTSBot b(small_config(150));
        CHECK(a.choose_action(kOpening) == b.choose_action(kOpening));
        for (size_t i = 0; i < a.last_stats().actions.size(); i++) {
            CHECK(a.last_stats().actions[i].visits == b.last_stats().actions[i].visits);
        }
    }

    TEST_CASE("Returned moves are always legal") {
        EnvConfig env_config;
        env_config.use_seed = true;
        env_config.seed = 31;
        Env2048 env(env_config);
        MCTSBot bot(small_config(30));
        for (int turn = 0; turn < 60 && !env.is_game_over(); turn++) {
            const int action = bot.choose_action(env.get_board());
            REQUIRE(contains(env.get_legal_actions(), action));
            env.step(action);
        }
    }

    TEST_CASE("Search never mutates the observed board") {
        Env2048 env;
        const Board before = env.get_board();
        MCTSBot bot(small_config(50));
        bot.choose_action(env.get_board());
        CHECK(env.get_board() == before);
        CHECK(env.get_score() == 0);
    }

    TEST_CASE("Subtree of the observed child is reused") {
        MCTSBot bot(small_config(120));
        const int action = bot.choose_action(kOpening);
        const MCTSNode *child = bot.get_root()->find_child(action);
        REQUIRE(child != nullptr);
        const Board next = child->board;
        // Two moves can land on the same board after the spawn; the first
        // matching child is the one kept
        int kept_visits = -1;
        for (const MCTSNode *c : bot.get_root()->children) {
            if (c->board == next) {
                kept_visits = c->visit_count;
                break;
            }
        }
        REQUIRE(legal_moves(next).size() > 1);

        bot.choose_action(next);

        CHECK(bot.last_stats().reused_tree);
        CHECK(bot.get_root()->parent == nullptr);
        CHECK(bot.get_root()->board == next);
        CHECK(bot.get_root()->visit_count == kept_visits + 120);
    }

    TEST_CASE("Unrelated board starts a fresh tree") {
        MCTSBot bot(small_config(50));
        bot.choose_action(kOpening);
        Board other = empty_board();
        other[3] = {2, 4, 8, 0};
        bot.choose_action(other);
        CHECK_FALSE(bot.last_stats().reused_tree);
        CHECK(bot.get_root()->visit_count == 50);
    }

    TEST_CASE("Tree reuse can be turned off") {
        MCTSConfig config = small_config(80);
        config.reuse_tree = false;
        MCTSBot bot(config);
        const int action = bot.choose_action(kOpening);
        const Board next = bot.get_root()->find_child(action)->board;
        REQUIRE(legal_moves(next).size() > 1);
        bot.choose_action(next);
        CHECK_FALSE(bot.last_stats().reused_tree);
        CHECK(bot.get_root()->visit_count == 80);
    }

    TEST_CASE("Reset discards the tree") {
        MCTSBot bot(small_config(40));
        bot.choose_action(kOpening);
        bot.reset();
        CHECK(bot.get_root() == nullptr);
        CHECK(bot.last_stats().simulations == 0);
    }

    TEST_CASE("Time limited search stops on its own") {
        MCTSConfig config = small_config(0);
        config.time_limit_ms = 30;
        MCTSBot bot(config);
        const int action = bot.choose_action(kOpening);
        CHECK(contains(legal_moves(kOpening), action));
        CHECK(bot.last_stats().simulations > 0);
        CHECK(bot.last_stats().elapsed_ms < 1000.0);
    }

    TEST_CASE("Range scaled exploration still returns a legal move") {
        MCTSConfig config = small_config(100);
        config.value_range_scaling = true;
        MCTSBot bot(config);
        CHECK(contains(legal_moves(kOpening), bot.choose_action(kOpening)));
    }

    TEST_CASE("Parallel rollouts keep the statistics consistent") {
        MCTSConfig config = small_config(400);
        config.num_threads = 4;
        MCTSBot bot(config);
        const int action = bot.choose_action(kOpening);

        CHECK(contains(legal_moves(kOpening), action));
        CHECK(bot.last_stats().simulations == 400);
        CHECK(bot.get_root()->visit_count == 400);
        int child_visits = 0;
        for (const MCTSNode *child : bot.get_root()->children)
            child_visits += child->visit_count;
        CHECK(child_visits == 400);
    }
}
