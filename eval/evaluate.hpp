#ifndef EVALUATE_HPP
#define EVALUATE_HPP

#include "../env/2048env.hpp"
#include "../bot/bot.hpp"
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

struct EpisodeResult {
    int score = 0;
    int highest = 0;
    int steps = 0;
};

struct EvalSummary {
    std::vector<EpisodeResult> episodes;
    double avg_score = 0.0;
    int min_score = 0;
    int max_score = 0;
    std::map<int, int> highest_tiles;   // Max tile -> number of episodes
};

// Builds a fresh bot for the given episode index
typedef std::function<std::shared_ptr<Bot>(int)> BotFactory;

EpisodeResult run_episode(Env2048 &env, Bot &bot);
EvalSummary summarize(const std::vector<EpisodeResult> &episodes);
// Episode i runs on its own env; with env_config.use_seed its seed is
// env_config.seed + i
EvalSummary evaluate(const BotFactory &make_bot, const EnvConfig &env_config,
                     const int episodes, const unsigned int num_threads = 1);
std::string format_summary(const EvalSummary &summary);

#endif
