#ifndef MCTS_CONFIG_HPP
#define MCTS_CONFIG_HPP

/*
 * Search parameters, fixed for the lifetime of one MCTSBot.
 *
 * The budget is `iterations` simulations, `time_limit_ms` of wall clock, or
 * whichever runs out first when both are set. With a time limit and
 * iterations == 0 the count is unbounded.
 */
struct MCTSConfig {
    double exploration_constant = 1.41;
    int iterations = 500;
    int time_limit_ms = 0;
    int rollout_depth = 50;        // Moves per rollout, 0 plays to the end
    double discount = 1.0;
    unsigned int seed = 1;
    unsigned int num_threads = 1;
    bool reuse_tree = true;
    // Multiply the exploration term by the spread of the children's averages
    bool value_range_scaling = false;
};

void validate_config(const MCTSConfig &config);

#endif
