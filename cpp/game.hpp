#ifndef AI2048_GAME_HPP
#define AI2048_GAME_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <ostream>
#include <random>
#include <tuple>
#include <vector>

typedef uint8_t cell_value_t;
typedef std::tuple<size_t, size_t> cell_coord_t;
typedef uint64_t score_t;
typedef std::mt19937_64 rng_t;

static constexpr size_t board_size = 4;
static constexpr size_t board_cells = board_size * board_size;

// a spawned tile has exponent 1 (value 2) in 9 of 10 cases, else exponent 2
static constexpr unsigned SPAWN_ONE_TENTHS = 9;
static constexpr double SPAWN_ONE_PROBABILITY = SPAWN_ONE_TENTHS / 10.0;

enum Direction {
    DIR_UP = 0,
    DIR_DOWN = 1,
    DIR_LEFT = 2,
    DIR_RIGHT = 3
};

static constexpr size_t direction_count = 4;

static constexpr std::array<Direction, direction_count> all_directions{{
    DIR_UP, DIR_DOWN, DIR_LEFT, DIR_RIGHT
}};

const char *direction_name(Direction dir);

typedef std::array<cell_value_t, board_cells> RawBoard;
typedef std::array<std::array<uint32_t, board_size>, board_size> TileTable;

/**
 * Condense one line, merge equal neighbours in a single pass from index 0
 * upwards and write it back padded with empties at the end, or at the
 * front when *pad_front* is set.
 *
 * The line is given as pointers into the board so that the same code
 * serves rows and columns. Returns the score gained by the merges.
 */
score_t shift_line(std::array<cell_value_t*, board_size> &line,
                   bool pad_front);

/* draws a fresh 64 bit seed from the system entropy source */
uint64_t fresh_seed();

/**
 * A 4x4 board of log2 exponents (0 = empty) with score and move counter.
 *
 * Cells are row-major, index = x + y * 4, x being the column.
 */
class GameBoard {
public:
    GameBoard();
    explicit GameBoard(const RawBoard &cells);

    // empty board followed by two spawns
    template <typename URNG>
    static GameBoard new_game(URNG &&rng)
    {
        GameBoard result;
        result.spawn_tile(rng);
        result.spawn_tile(rng);
        return result;
    }

    static GameBoard new_seeded(uint64_t seed);
    static GameBoard new_random();

    RawBoard cells;
    score_t score;
    score_t num_moves;

    static inline size_t xy_to_index(const size_t x, const size_t y)
    {
        return x + y * board_size;
    };

    inline cell_value_t get_tile(const size_t x, const size_t y) const
    {
        return cells[xy_to_index(x, y)];
    };

    inline void set_tile(const size_t x, const size_t y, const cell_value_t v)
    {
        cells[xy_to_index(x, y)] = v;
    };

    GameBoard &place_tile(const size_t x,
                          const size_t y,
                          const cell_value_t v);

    inline const RawBoard &get_cells() const
    {
        return cells;
    };

    inline void set_cells(const RawBoard &new_cells)
    {
        cells = new_cells;
    };

    template <typename OutputIterator>
    inline void free_fields(OutputIterator it) const {
        for (size_t y = 0; y < board_size; y++) {
            for (size_t x = 0; x < board_size; x++) {
                if (get_tile(x, y) == 0) {
                    *it++ = cell_coord_t(x, y);
                }
            }
        }
    };

    std::vector<cell_coord_t> free_cells() const;
    size_t empty_count() const;
    uint32_t max_tile() const;
    TileTable tile_values() const;

    /**
     * Slide and merge all lines in direction *dir*. Adds the merge score to
     * the board score, never spawns and never touches num_moves.
     */
    GameBoard &shift(Direction dir, score_t *gained = nullptr);

    inline GameBoard shifted(Direction dir, score_t *gained = nullptr) const
    {
        GameBoard result(*this);
        result.shift(dir, gained);
        return result;
    };

    bool can_move(Direction dir) const;
    std::vector<Direction> available_moves() const;

    /**
     * Apply *dir* to the real game: shift, then spawn one tile and count the
     * move if any cell changed. Returns false (and changes nothing) for a
     * move that does not change the cells.
     */
    template <typename URNG>
    bool make_move(Direction dir, URNG &&rng)
    {
        const RawBoard before = cells;
        shift(dir);
        if (cells == before) {
            return false;
        }
        spawn_tile(rng);
        num_moves++;
        return true;
    }

    /**
     * Place a tile on a uniformly chosen empty cell, exponent 1 with
     * probability 0.9, exponent 2 otherwise. Returns false on a full board.
     *
     * Draws exactly two raw values from *rng*: the cell (modulo the number
     * of empty cells, row-major order) and then the tile (modulo 10). Plain
     * modulo keeps seeded games identical across standard libraries.
     */
    template <typename URNG>
    bool spawn_tile(URNG &&rng)
    {
        std::vector<cell_coord_t> options;
        free_fields(std::back_inserter(options));
        if (options.empty()) {
            return false;
        }

        const cell_coord_t option = options[rng() % options.size()];
        const cell_value_t tile = (rng() % 10 < SPAWN_ONE_TENTHS ? 1 : 2);
        place_tile(std::get<0>(option), std::get<1>(option), tile);
        return true;
    }

    bool game_over() const;

};

bool operator==(const GameBoard &a, const GameBoard &b);
bool operator!=(const GameBoard &a, const GameBoard &b);

namespace std {

template <>
struct hash<GameBoard> {
    size_t operator()(const GameBoard &board) const noexcept;
};

std::ostream &operator<<(std::ostream &s, const GameBoard &board);

}

#endif
