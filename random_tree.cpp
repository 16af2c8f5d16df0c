#include "cpp/random_tree.hpp"
#include "cpp/rollout.hpp"

#include <algorithm>
#include <future>
#include <thread>
#include <vector>

score_t metric_value(const GameBoard &terminal, RandomTreeMetric metric)
{
    switch (metric) {
    case METRIC_AVG_MOVES: return terminal.num_moves;
    case METRIC_AVG_SCORE: return terminal.score;
    };
    return terminal.score;
}

size_t worker_count(size_t tasks)
{
    size_t threads = std::thread::hardware_concurrency();
    if (threads == 0) {
        threads = 1;
    }
    return std::max<size_t>(1, std::min(threads, tasks));
}

score_t rollout_total(const GameBoard &start,
                      size_t sim_count,
                      RandomTreeMetric metric,
                      bool parallel,
                      rng_t &rng)
{
    std::vector<uint64_t> seeds(sim_count);
    for (auto &seed: seeds) {
        seed = rng();
    }

    auto run_slice = [&start, &seeds, metric](size_t first, size_t stride) {
        score_t total = 0;
        for (size_t i = first; i < seeds.size(); i += stride) {
            rng_t sim_rng(seeds[i]);
            total += metric_value(simulate_random_game(start, sim_rng), metric);
        }
        return total;
    };

    if (!parallel || sim_count < 2) {
        return run_slice(0, 1);
    }

    // static partitioning, every worker owns its slice of the seeds
    const size_t workers = worker_count(sim_count);
    std::vector<std::future<score_t>> tasks;
    tasks.reserve(workers);
    for (size_t w = 0; w < workers; w++) {
        tasks.push_back(std::async(std::launch::async, run_slice, w, workers));
    }

    score_t total = 0;
    for (auto &task: tasks) {
        total += task.get();
    }
    return total;
}

MoveScores score_moves(const GameBoard &board,
                       size_t sim_count,
                       RandomTreeMetric metric,
                       bool parallel,
                       rng_t &rng)
{
    MoveScores scores;
    for (Direction dir: all_directions) {
        GameBoard sim_board(board);
        if (!sim_board.make_move(dir, rng)) {
            continue;
        }
        scores.set(dir, rollout_total(sim_board, sim_count, metric, parallel, rng));
    }
    return scores;
}
