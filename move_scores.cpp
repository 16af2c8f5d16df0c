#include "cpp/move_scores.hpp"

MoveScores::MoveScores():
    _scores(),
    _available()
{

}

void MoveScores::set(Direction dir, score_t score)
{
    _scores[dir] = score;
    _available[dir] = true;
}

bool MoveScores::any_available() const
{
    for (bool flag: _available) {
        if (flag) {
            return true;
        }
    }
    return false;
}

Direction MoveScores::max_move() const
{
    Direction result = DIR_UP;
    bool found = false;
    for (Direction dir: all_directions) {
        if (!_available[dir]) {
            continue;
        }
        // strict comparison keeps the earlier direction on ties
        if (!found || _scores[dir] > _scores[result]) {
            result = dir;
            found = true;
        }
    }
    return result;
}

bool operator==(const MoveScores &a, const MoveScores &b)
{
    for (Direction dir: all_directions) {
        if (a.available(dir) != b.available(dir) || a[dir] != b[dir]) {
            return false;
        }
    }
    return true;
}

bool operator!=(const MoveScores &a, const MoveScores &b)
{
    return !(a == b);
}
