#ifndef AI2048_ROLLOUT_HPP
#define AI2048_ROLLOUT_HPP

#include "game.hpp"

Direction random_direction(rng_t &rng);

/**
 * Play uniformly random moves on a copy of *board* until the game is over
 * and return the terminal board.
 */
GameBoard simulate_random_game(GameBoard board, rng_t &rng);

#endif
