#include "cpp/expectimax.hpp"
#include "cpp/random_tree.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <vector>

namespace {

struct Hypothetical {
    GameBoard board;
    double weight;
};

}

const char *heuristic_name(ExpectimaxHeuristic heuristic)
{
    switch (heuristic) {
    case HEURISTIC_ROLLOUT: return "rollout average";
    case HEURISTIC_WEIGHTED_EMPTY: return "empty-weighted rollout average";
    };
    return "?";
}

/* ExpectimaxParams */

ExpectimaxParams::ExpectimaxParams():
    tree_depth(2),
    num_tiles(4),
    heuristic_sims(20),
    max_evals(5000),
    heuristic(HEURISTIC_WEIGHTED_EMPTY),
    parallel(true),
    has_seed(false),
    seed(0)
{

}

/* Expectimax */

Expectimax::Expectimax(const ExpectimaxParams &params):
    _params(params),
    _evals(0)
{
    if (_params.num_tiles == 0) {
        throw std::invalid_argument("expectimax: num_tiles must be at least 1");
    }
    if (_params.heuristic_sims == 0) {
        throw std::invalid_argument("expectimax: heuristic_sims must be at least 1");
    }
}

bool Expectimax::count_evaluation()
{
    size_t current = _evals.load();
    while (current < _params.max_evals) {
        if (_evals.compare_exchange_weak(current, current + 1)) {
            return true;
        }
    }
    return false;
}

double Expectimax::heuristic(const GameBoard &board, rng_t &rng) const
{
    const score_t total = rollout_total(board,
                                        _params.heuristic_sims,
                                        METRIC_AVG_SCORE,
                                        false,
                                        rng);
    const double mean = static_cast<double>(total) / _params.heuristic_sims;
    if (_params.heuristic == HEURISTIC_WEIGHTED_EMPTY) {
        return mean * board.empty_count();
    }
    return mean;
}

double Expectimax::max_layer(const GameBoard &board,
                             size_t depth,
                             rng_t &rng)
{
    double best = 0;
    bool any = false;
    for (Direction dir: all_directions) {
        const GameBoard child = board.shifted(dir);
        if (child.cells == board.cells) {
            continue;
        }

        const double value = count_evaluation()
            ? recurse(child, depth+1, rng)
            : heuristic(child, rng);
        if (!any || value > best) {
            best = value;
            any = true;
        }
    }

    if (!any) {
        return heuristic(board, rng);
    }
    return best;
}

double Expectimax::recurse(const GameBoard &board,
                           size_t depth,
                           rng_t &rng)
{
    if (_evals.load() >= _params.max_evals ||
            depth >= _params.tree_depth ||
            board.game_over())
    {
        return heuristic(board, rng);
    }

    std::vector<cell_coord_t> free_fields = board.free_cells();
    std::shuffle(free_fields.begin(), free_fields.end(), rng);
    if (free_fields.size() > _params.num_tiles) {
        free_fields.resize(_params.num_tiles);
    }

    std::vector<Hypothetical> hypotheticals;
    if (free_fields.empty()) {
        hypotheticals.push_back(Hypothetical{board, 1.0});
    }
    for (const cell_coord_t &option: free_fields) {
        const size_t x = std::get<0>(option);
        const size_t y = std::get<1>(option);
        hypotheticals.push_back(Hypothetical{
            GameBoard(board).place_tile(x, y, 1), WEIGHT_SPAWN_ONE});
        hypotheticals.push_back(Hypothetical{
            GameBoard(board).place_tile(x, y, 2), WEIGHT_SPAWN_TWO});
    }

    double total = 0;
    if (_params.parallel && depth == 0 && hypotheticals.size() > 1) {
        std::vector<std::future<double>> tasks;
        tasks.reserve(hypotheticals.size());
        for (const Hypothetical &hypothetical: hypotheticals) {
            const uint64_t seed = rng();
            const Hypothetical *item = &hypothetical;
            tasks.push_back(std::async(std::launch::async, [this, item, depth, seed]() {
                rng_t task_rng(seed);
                return item->weight * max_layer(item->board, depth, task_rng);
            }));
        }
        for (auto &task: tasks) {
            total += task.get();
        }
    } else {
        for (const Hypothetical &hypothetical: hypotheticals) {
            total += hypothetical.weight * max_layer(hypothetical.board, depth, rng);
        }
    }

    // weighted scores averaged over the number of hypotheticals
    return total / hypotheticals.size();
}

MoveScores Expectimax::search(const GameBoard &board, rng_t &rng)
{
    _evals.store(0);

    MoveScores scores;
    for (Direction dir: all_directions) {
        const GameBoard child = board.shifted(dir);
        if (child.cells == board.cells) {
            continue;
        }
        // truncated to an integer score only here
        scores.set(dir, static_cast<score_t>(recurse(child, 0, rng)));
    }
    return scores;
}
