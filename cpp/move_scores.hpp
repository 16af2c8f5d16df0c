#ifndef AI2048_MOVE_SCORES_HPP
#define AI2048_MOVE_SCORES_HPP

#include "game.hpp"

/**
 * Score per direction. Directions that were never scored are unavailable
 * and lose against any available one, whatever its score.
 */
class MoveScores {
public:
    MoveScores();

private:
    std::array<score_t, direction_count> _scores;
    std::array<bool, direction_count> _available;

public:
    inline score_t operator[](Direction dir) const
    {
        return _scores[dir];
    };

    inline bool available(Direction dir) const
    {
        return _available[dir];
    };

    void set(Direction dir, score_t score);
    bool any_available() const;

    // highest available score, earliest declared direction on ties
    Direction max_move() const;

};

bool operator==(const MoveScores &a, const MoveScores &b);
bool operator!=(const MoveScores &a, const MoveScores &b);

#endif
