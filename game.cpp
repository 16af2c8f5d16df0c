#include "cpp/game.hpp"

#include <algorithm>
#include <iomanip>

static std::independent_bits_engine<std::random_device,
                                    64,
                                    uint64_t> indepbits;

/* free functions */

const char *direction_name(Direction dir)
{
    switch (dir) {
    case DIR_UP: return "Up";
    case DIR_DOWN: return "Down";
    case DIR_LEFT: return "Left";
    case DIR_RIGHT: return "Right";
    };
    return "?";
}

uint64_t fresh_seed()
{
    return indepbits();
}

score_t shift_line(std::array<cell_value_t*, board_size> &line,
                   bool pad_front)
{
    std::array<cell_value_t, board_size> condensed{};
    size_t count = 0;
    for (cell_value_t *cell: line) {
        if (*cell != 0) {
            condensed[count++] = *cell;
        }
    }

    // merge pass runs in index order whatever the direction
    std::array<cell_value_t, board_size> merged{};
    size_t merged_count = 0;
    score_t result = 0;
    for (size_t i = 0; i < count; /* nothing */) {
        if (i + 1 < count && condensed[i] == condensed[i+1]) {
            merged[merged_count] = condensed[i] + 1;
            result += score_t(1) << merged[merged_count];
            merged_count++;
            // the consumed neighbour cannot merge again in this move
            i += 2;
        } else {
            merged[merged_count++] = condensed[i];
            i++;
        }
    }

    const size_t offset = pad_front ? line.size() - merged_count : 0;
    for (size_t i = 0; i < line.size(); i++) {
        *line[i] = 0;
    }
    for (size_t i = 0; i < merged_count; i++) {
        *line[offset + i] = merged[i];
    }
    return result;
};


/* GameBoard */

GameBoard::GameBoard():
    cells(),
    score(0),
    num_moves(0)
{

}

GameBoard::GameBoard(const RawBoard &cells):
    cells(cells),
    score(0),
    num_moves(0)
{

}

GameBoard GameBoard::new_seeded(uint64_t seed)
{
    rng_t rng(seed);
    return new_game(rng);
}

GameBoard GameBoard::new_random()
{
    return new_seeded(fresh_seed());
}

GameBoard &GameBoard::place_tile(
    const size_t x,
    const size_t y,
    const cell_value_t v)
{
    set_tile(x, y, v);
    return *this;
};

std::vector<cell_coord_t> GameBoard::free_cells() const
{
    std::vector<cell_coord_t> result;
    free_fields(std::back_inserter(result));
    return result;
}

size_t GameBoard::empty_count() const
{
    return std::count(cells.begin(), cells.end(), 0);
}

uint32_t GameBoard::max_tile() const
{
    const cell_value_t highest = *std::max_element(cells.begin(), cells.end());
    return highest == 0 ? 0 : (uint32_t(1) << highest);
}

TileTable GameBoard::tile_values() const
{
    TileTable table{};
    for (size_t y = 0; y < board_size; y++) {
        for (size_t x = 0; x < board_size; x++) {
            const cell_value_t v = get_tile(x, y);
            table[y][x] = (v == 0 ? 0 : (uint32_t(1) << v));
        }
    }
    return table;
}

GameBoard &GameBoard::shift(Direction dir, score_t *gained)
{
    // one view per row or column, always in index order
    std::array<std::array<cell_value_t*, board_size>, board_size> views{};
    switch (dir) {
    case DIR_UP:
    case DIR_DOWN:
    {
        for (size_t x = 0; x < board_size; x++) {
            for (size_t y = 0; y < board_size; y++) {
                views[x][y] = &cells[xy_to_index(x, y)];
            }
        }
        break;
    };
    case DIR_LEFT:
    case DIR_RIGHT:
    {
        for (size_t y = 0; y < board_size; y++) {
            for (size_t x = 0; x < board_size; x++) {
                views[y][x] = &cells[xy_to_index(x, y)];
            }
        }
        break;
    };
    };

    const bool pad_front = (dir == DIR_DOWN || dir == DIR_RIGHT);
    score_t total_score = 0;
    for (size_t i = 0; i < board_size; i++) {
        total_score += shift_line(views[i], pad_front);
    }
    score += total_score;
    if (gained) {
        *gained = total_score;
    }

    return *this;
};

bool GameBoard::can_move(Direction dir) const
{
    return shifted(dir).cells != cells;
}

std::vector<Direction> GameBoard::available_moves() const
{
    std::vector<Direction> result;
    for (Direction dir: all_directions) {
        if (can_move(dir)) {
            result.push_back(dir);
        }
    }
    return result;
}

bool GameBoard::game_over() const
{
    if (empty_count() > 0) {
        return false;
    }
    // with no gaps the condensed lines are the raw rows and columns
    for (size_t y = 0; y < board_size; y++) {
        for (size_t x = 1; x < board_size; x++) {
            if (get_tile(x-1, y) == get_tile(x, y)) {
                return false;
            }
        }
    }
    for (size_t x = 0; x < board_size; x++) {
        for (size_t y = 1; y < board_size; y++) {
            if (get_tile(x, y-1) == get_tile(x, y)) {
                return false;
            }
        }
    }
    return true;
}

bool operator==(const GameBoard &a, const GameBoard &b)
{
    return a.cells == b.cells &&
        a.score == b.score &&
        a.num_moves == b.num_moves;
}

bool operator!=(const GameBoard &a, const GameBoard &b)
{
    return !(a == b);
}

namespace std {

size_t hash<GameBoard>::operator()(const GameBoard &board) const noexcept
{
    // FNV-1a over the exponents, then score and moves
    uint64_t value = 0xcbf29ce484222325ULL;
    for (cell_value_t cell: board.cells) {
        value = (value ^ cell) * 0x100000001b3ULL;
    }
    value = (value ^ board.score) * 0x100000001b3ULL;
    value = (value ^ board.num_moves) * 0x100000001b3ULL;
    return static_cast<size_t>(value);
}

std::ostream &operator<<(std::ostream &s, const GameBoard &board)
{
    const TileTable table = board.tile_values();
    for (size_t y = 0; y < board_size; y++) {
        for (size_t x = 0; x < board_size; x++) {
            s << std::setw(6) << table[y][x];
        }
        s << std::endl;
    }
    return s;
};

}
