#include "evaluate.hpp"
#include "../common/thread_pool.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>

EpisodeResult run_episode(Env2048 &env, Bot &bot)
{
    env.reset();
    bot.reset();
    bool done = env.is_game_over();

    while (!done) {
        int action = bot.choose_action(env.get_board());
        if (action == NO_ACTION) {
            if (!env.is_game_over())
                std::cerr << "[EVAL] Bot gave no move on a live board, episode stopped after "
                          << env.get_steps() << " steps" << std::endl;
            break;
        }

        StepResult result = env.step(action);
        done = result.done;
    }

    EpisodeResult episode;
    episode.score = env.get_score();
    episode.highest = max_tile(env.get_board());
    episode.steps = env.get_steps();
    return episode;
}

EvalSummary summarize(const std::vector<EpisodeResult> &episodes)
{
    EvalSummary summary;
    summary.episodes = episodes;
    if (episodes.empty())
        return summary;

    double sum = std::accumulate(episodes.begin(), episodes.end(), 0.0,
        [](double acc, const EpisodeResult &e) { return acc + e.score; });
    summary.avg_score = sum / episodes.size();
    summary.min_score = episodes.front().score;
    summary.max_score = episodes.front().score;
    for (const EpisodeResult &e : episodes) {
        summary.min_score = std::min(summary.min_score, e.score);
        summary.max_score = std::max(summary.max_score, e.score);
        summary.highest_tiles[e.highest]++;
    }
    return summary;
}

EvalSummary evaluate(const BotFactory &make_bot, const EnvConfig &env_config,
                     const int episodes, const unsigned int num_threads)
{
    if (episodes <= 0)
        throw std::invalid_argument("Number of episodes must be positive");

    ThreadPool pool(num_threads);
    std::vector<std::future<EpisodeResult>> future_results;
    future_results.reserve(episodes);
    for (int ep = 0; ep < episodes; ++ep) {
        future_results.emplace_back(pool.enqueue([&make_bot, env_config, ep] {
            EnvConfig config = env_config;
            config.seed = env_config.seed + ep;
            Env2048 env(config);
            std::shared_ptr<Bot> bot = make_bot(ep);
            return run_episode(env, *bot);
        }));
    }

    std::vector<EpisodeResult> results;
    results.reserve(episodes);
    for (auto &future : future_results) {
        results.push_back(future.get());
    }
    return summarize(results);
}

std::string format_summary(const EvalSummary &summary)
{
    std::ostringstream oss;
    oss << "====================================\n";
    oss << "Eval episodes: " << summary.episodes.size() << "\n";
    oss << "Average score: " << summary.avg_score << "\n";
    oss << "Min score:     " << summary.min_score << "\n";
    oss << "Max score:     " << summary.max_score << "\n";
    for (const auto &kv : summary.highest_tiles) {
        oss << "Reached " << kv.first << ":\t" << kv.second << "\n";
    }
    oss << "====================================\n";
    return oss.str();
}
