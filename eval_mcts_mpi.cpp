#include "eval/evaluate.hpp"
#include "mcts/mcts.hpp"
#include <mpi.h>

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <vector>

/*
 * Usage: mpirun -np N eval_mcts_mpi [episodes_per_proc] [iterations] [rollout_depth] [seed]
 * Every rank plays its own episodes; scores are reduced to rank 0.
 */
int main(int argc, char** argv)
{
    MPI_Init(&argc, &argv);

    int rank, world_size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &world_size);

    int episodes_per_proc = 10;
    if (argc >= 2) {
        episodes_per_proc = std::atoi(argv[1]);
    }

    int iterations = 500;
    if (argc >= 3) {
        iterations = std::atoi(argv[2]);
    }

    int rollout_depth = 50;
    if (argc >= 4) {
        rollout_depth = std::atoi(argv[3]);
    }

    unsigned int seed = 1;
    if (argc >= 5) {
        seed = static_cast<unsigned int>(std::strtoul(argv[4], nullptr, 10));
    }

    if (episodes_per_proc <= 0 || iterations < 0 || rollout_depth < 0) {
        if (rank == 0) {
            std::cerr << "Usage: " << argv[0]
                      << " [episodes_per_proc > 0] [iterations >= 0] [rollout_depth >= 0] [seed]"
                      << std::endl;
        }
        MPI_Finalize();
        return 1;
    }

    // Disjoint seed ranges per rank
    const unsigned int rank_seed = seed + static_cast<unsigned int>(rank) * 13331;

    MCTSConfig mcts_config;
    mcts_config.iterations = iterations;
    mcts_config.rollout_depth = rollout_depth;

    EnvConfig env_config;
    env_config.use_seed = true;
    env_config.seed = rank_seed;

    double t0 = MPI_Wtime();
    double local_sum = 0.0;
    int local_min = std::numeric_limits<int>::max();
    int local_max = 0;
    int local_best_tile = 0;

    for (int ep = 0; ep < episodes_per_proc; ++ep) {
        EnvConfig config = env_config;
        config.seed = rank_seed + ep;
        Env2048 env(config);
        MCTSConfig search_config = mcts_config;
        search_config.seed = rank_seed + ep;
        MCTSBot bot(search_config);

        EpisodeResult episode = run_episode(env, bot);
        local_sum += static_cast<double>(episode.score);
        local_min = std::min(local_min, episode.score);
        local_max = std::max(local_max, episode.score);
        local_best_tile = std::max(local_best_tile, episode.highest);
    }
    double local_time = MPI_Wtime() - t0;

    double global_sum = 0.0;
    int global_min = 0, global_max = 0, global_best_tile = 0;
    double max_time = 0.0;
    MPI_Reduce(&local_sum, &global_sum, 1, MPI_DOUBLE, MPI_SUM, 0, MPI_COMM_WORLD);
    MPI_Reduce(&local_min, &global_min, 1, MPI_INT, MPI_MIN, 0, MPI_COMM_WORLD);
    MPI_Reduce(&local_max, &global_max, 1, MPI_INT, MPI_MAX, 0, MPI_COMM_WORLD);
    MPI_Reduce(&local_best_tile, &global_best_tile, 1, MPI_INT, MPI_MAX, 0, MPI_COMM_WORLD);
    MPI_Reduce(&local_time, &max_time, 1, MPI_DOUBLE, MPI_MAX, 0, MPI_COMM_WORLD);

    if (rank == 0) {
        const int total_episodes = episodes_per_proc * world_size;
        std::cout << "====================================\n";
        std::cout << "[MPI] world_size=" << world_size
                  << ", episodes_per_proc=" << episodes_per_proc
                  << ", iterations=" << iterations
                  << ", rollout_depth=" << rollout_depth << "\n";
        std::cout << "Eval episodes: " << total_episodes << "\n";
        std::cout << "Average score: " << global_sum / total_episodes << "\n";
        std::cout << "Min score:     " << global_min << "\n";
        std::cout << "Max score:     " << global_max << "\n";
        std::cout << "Best tile:     " << global_best_tile << "\n";
        std::cout << "Slowest rank:  " << max_time << " s\n";
        std::cout << "====================================" << std::endl;
    }

    MPI_Finalize();
    return 0;
}
