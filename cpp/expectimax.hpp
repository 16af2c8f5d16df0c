#ifndef AI2048_EXPECTIMAX_HPP
#define AI2048_EXPECTIMAX_HPP

#include "game.hpp"
#include "move_scores.hpp"

#include <atomic>

// probability weights of the two spawn outcomes at a chance layer
static constexpr double WEIGHT_SPAWN_ONE = SPAWN_ONE_PROBABILITY;
static constexpr double WEIGHT_SPAWN_TWO = 1.0 - SPAWN_ONE_PROBABILITY;

enum ExpectimaxHeuristic {
    // mean terminal score of the rollouts
    HEURISTIC_ROLLOUT,
    // mean terminal score times the number of empty cells
    HEURISTIC_WEIGHTED_EMPTY
};

const char *heuristic_name(ExpectimaxHeuristic heuristic);

struct ExpectimaxParams {
    ExpectimaxParams();

    size_t tree_depth;
    // empty cells sampled at each chance layer
    size_t num_tiles;
    // rollouts per heuristic evaluation
    size_t heuristic_sims;
    // bound on counted max-layer visits per decision
    size_t max_evals;
    ExpectimaxHeuristic heuristic;
    // fan out the first chance layer onto threads; where the evaluation
    // budget cuts off then depends on timing, so seeded runs only repeat
    // exactly with parallel = false
    bool parallel;
    bool has_seed;
    uint64_t seed;
};

/**
 * Depth and budget bounded expectimax over the player moves (max layer)
 * and sampled tile spawns (chance layer), with random rollouts as the leaf
 * heuristic.
 *
 * A chance layer scores as the sum of weight * max over its hypotheticals
 * divided by their count.
 *
 * Every branch works on its own copy of the board; the evaluation counter
 * is the only state shared between parallel branches.
 */
class Expectimax {
public:
    explicit Expectimax(const ExpectimaxParams &params = ExpectimaxParams());
    Expectimax(const Expectimax &ref) = delete;
    Expectimax &operator=(const Expectimax &ref) = delete;

private:
    ExpectimaxParams _params;
    std::atomic<size_t> _evals;

private:
    bool count_evaluation();
    double max_layer(const GameBoard &board, size_t depth, rng_t &rng);

public:
    inline const ExpectimaxParams &params() const
    {
        return _params;
    };

    // counted evaluations of the last search
    inline size_t evaluations() const
    {
        return _evals.load();
    };

    MoveScores search(const GameBoard &board, rng_t &rng);
    double recurse(const GameBoard &board, size_t depth, rng_t &rng);
    double heuristic(const GameBoard &board, rng_t &rng) const;

};

#endif
