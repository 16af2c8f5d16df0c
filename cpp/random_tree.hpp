#ifndef AI2048_RANDOM_TREE_HPP
#define AI2048_RANDOM_TREE_HPP

#include "game.hpp"
#include "move_scores.hpp"

enum RandomTreeMetric {
    METRIC_AVG_SCORE,
    METRIC_AVG_MOVES
};

score_t metric_value(const GameBoard &terminal, RandomTreeMetric metric);

// number of threads used for a fan-out of *tasks* independent jobs
size_t worker_count(size_t tasks);

/**
 * Sum of *metric* over *sim_count* random rollouts from *start*.
 *
 * One seed per rollout is drawn from *rng* up front, so the result for a
 * given engine state is the same whether or not the rollouts run in
 * parallel.
 */
score_t rollout_total(const GameBoard &start,
                      size_t sim_count,
                      RandomTreeMetric metric,
                      bool parallel,
                      rng_t &rng);

/**
 * Score every direction by the summed outcome of *sim_count* rollouts from
 * the board after that move. Directions that do not change the board stay
 * unavailable.
 */
MoveScores score_moves(const GameBoard &board,
                       size_t sim_count,
                       RandomTreeMetric metric,
                       bool parallel,
                       rng_t &rng);

#endif
