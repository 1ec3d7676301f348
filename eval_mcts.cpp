#include "eval/evaluate.hpp"
#include "mcts/mcts.hpp"
#include "flat_mc/flat_monte_carlo.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

/*
 * Usage: eval_mcts [episodes] [iterations] [threads] [rollout_depth] [seed] [bot]
 * bot is one of mcts (default), flat, random. Episodes run in parallel on
 * `threads` workers; each search itself is single threaded.
 */
int main(int argc, char* argv[]) {
    int eval_episodes = 20;
    int iterations = 500;
    int num_threads = 4;
    int rollout_depth = 50;
    unsigned int seed = 1;
    std::string bot_name = "mcts";

    try {
        if (argc >= 2) eval_episodes = std::stoi(argv[1]);
        if (argc >= 3) iterations = std::stoi(argv[2]);
        if (argc >= 4) num_threads = std::stoi(argv[3]);
        if (argc >= 5) rollout_depth = std::stoi(argv[4]);
        if (argc >= 6) seed = static_cast<unsigned int>(std::stoul(argv[5]));
        if (argc >= 7) bot_name = argv[6];
    } catch (const std::exception &e) {
        std::cerr << "Invalid argument: " << e.what() << "\n"
                  << "Usage: " << argv[0]
                  << " [episodes] [iterations] [threads] [rollout_depth] [seed] [mcts|flat|random]" << std::endl;
        return 1;
    }
    if (eval_episodes <= 0 || num_threads <= 0) {
        std::cerr << "Episodes and threads must be positive" << std::endl;
        return 1;
    }

    MCTSConfig mcts_config;
    mcts_config.iterations = iterations;
    mcts_config.rollout_depth = rollout_depth;

    FlatMCConfig flat_config;
    flat_config.playouts_per_move = iterations / N_ACTIONS > 0 ? iterations / N_ACTIONS : 1;
    flat_config.rollout_depth = rollout_depth;
    flat_config.num_threads = 1;

    BotFactory make_bot;
    if (bot_name == "mcts") {
        make_bot = [mcts_config, seed](int episode) {
            MCTSConfig config = mcts_config;
            config.seed = seed + episode;
            return std::shared_ptr<Bot>(new MCTSBot(config));
        };
    } else if (bot_name == "flat") {
        make_bot = [flat_config, seed](int episode) {
            FlatMCConfig config = flat_config;
            config.seed = seed + episode;
            return std::shared_ptr<Bot>(new FlatMonteCarloBot(config));
        };
    } else if (bot_name == "random") {
        make_bot = [seed](int episode) {
            return std::shared_ptr<Bot>(new RandomBot(seed + episode));
        };
    } else {
        std::cerr << "Unknown bot: " << bot_name << std::endl;
        return 1;
    }

    EnvConfig env_config;
    env_config.use_seed = true;
    env_config.seed = seed;

    std::cout << "[EVAL] bot=" << bot_name << ", episodes=" << eval_episodes
              << ", iterations=" << iterations << ", threads=" << num_threads
              << ", rollout_depth=" << rollout_depth << ", seed=" << seed << std::endl;

    std::chrono::steady_clock::time_point t_begin = std::chrono::steady_clock::now();
    EvalSummary summary;
    try {
        summary = evaluate(make_bot, env_config, eval_episodes, num_threads);
    } catch (const std::exception &e) {
        std::cerr << "Evaluation failed: " << e.what() << std::endl;
        return 1;
    }
    std::chrono::steady_clock::time_point t_end = std::chrono::steady_clock::now();
    unsigned long long duration = std::chrono::duration_cast<std::chrono::milliseconds>(t_end - t_begin).count();

    std::cout << format_summary(summary);
    std::cout << "Total time: " << duration << " (ms)" << std::endl;

    return 0;
}
