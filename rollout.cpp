#include "cpp/rollout.hpp"

Direction random_direction(rng_t &rng)
{
    return static_cast<Direction>(rng() % direction_count);
}

GameBoard simulate_random_game(GameBoard board, rng_t &rng)
{
    // no-op moves are simply redrawn by the next iteration
    while (!board.game_over()) {
        board.make_move(random_direction(rng), rng);
    }
    return board;
}
