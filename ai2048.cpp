#include "cpp/agent.hpp"
#include "cpp/log.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

enum AgentKind {
    AGENT_RANDOM,
    AGENT_TREE,
    AGENT_TREE_MOVES,
    AGENT_EXPECTIMAX
};

struct Options {
    Options();

    AgentKind agent;
    bool has_seed;
    uint64_t seed;
    size_t sims;
    ExpectimaxParams expectimax;
    bool sequential;
    bool pipe;
    bool quiet;
    std::string log_path;
};

Options::Options():
    agent(AGENT_EXPECTIMAX),
    has_seed(false),
    seed(0),
    sims(1000),
    expectimax(),
    sequential(false),
    pipe(false),
    quiet(false),
    log_path()
{

}

static void usage(const char *argv0)
{
    std::cerr << "usage: " << argv0
              << " [--agent random|tree|tree-moves|expectimax] [--seed N]"
              << " [--sims N] [--depth N] [--evals N] [--sequential]"
              << " [--log FILE] [--pipe] [--quiet]" << std::endl;
}

static bool parse_number(const std::string &text, uint64_t &out)
{
    if (text.empty() || text[0] == '-') {
        return false;
    }
    try {
        size_t end = 0;
        unsigned long long value = std::stoull(text, &end, 10);
        if (end != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::logic_error &) {
        // invalid_argument and out_of_range
        return false;
    }
}

static bool parse_options(int argc, char **argv, Options &options)
{
    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        uint64_t number = 0;

        if (arg == "--sequential") {
            options.sequential = true;
        } else if (arg == "--pipe") {
            options.pipe = true;
        } else if (arg == "--quiet") {
            options.quiet = true;
        } else if (!has_value) {
            return false;
        } else if (arg == "--agent") {
            const std::string name = argv[++i];
            if (name == "random") {
                options.agent = AGENT_RANDOM;
            } else if (name == "tree") {
                options.agent = AGENT_TREE;
            } else if (name == "tree-moves") {
                options.agent = AGENT_TREE_MOVES;
            } else if (name == "expectimax") {
                options.agent = AGENT_EXPECTIMAX;
            } else {
                return false;
            }
        } else if (arg == "--log") {
            options.log_path = argv[++i];
        } else if (!parse_number(argv[++i], number)) {
            return false;
        } else if (arg == "--seed") {
            options.has_seed = true;
            options.seed = number;
        } else if (arg == "--sims") {
            options.sims = number;
        } else if (arg == "--depth") {
            options.expectimax.tree_depth = number;
        } else if (arg == "--evals") {
            options.expectimax.max_evals = number;
        } else {
            return false;
        }
    }
    return true;
}

static std::unique_ptr<Agent> make_agent(const Options &options,
                                         const GameBoard &game,
                                         uint64_t seed)
{
    const bool parallel = !options.sequential;
    switch (options.agent) {
    case AGENT_RANDOM:
        return std::unique_ptr<Agent>(new RandomAgent(game, seed));
    case AGENT_TREE:
        return std::unique_ptr<Agent>(new RandomTreeAgent(
            game, seed, options.sims, METRIC_AVG_SCORE, parallel));
    case AGENT_TREE_MOVES:
        return std::unique_ptr<Agent>(new RandomTreeAgent(
            game, seed, options.sims, METRIC_AVG_MOVES, parallel));
    case AGENT_EXPECTIMAX:
    {
        ExpectimaxParams params = options.expectimax;
        params.parallel = parallel;
        params.has_seed = true;
        params.seed = seed;
        return std::unique_ptr<Agent>(new ExpectimaxAgent(game, params));
    };
    };
    return std::unique_ptr<Agent>();
}

static void print_messages(const Agent &agent)
{
    for (const MessageLine &line: agent.messages()) {
        if (line.emphasis) {
            std::cout << "* " << line.text << std::endl;
        } else {
            std::cout << "  " << line.text << std::endl;
        }
    }
}

static int self_play(const Options &options, uint64_t seed)
{
    rng_t rng(seed);
    const GameBoard start = GameBoard::new_game(rng);
    std::unique_ptr<Agent> agent = make_agent(options, start, rng());

    while (!agent->get_game().game_over()) {
        agent->make_move();
        if (!options.quiet) {
            const GameBoard &game = agent->get_game();
            std::cout << game
                      << "score: " << game.score
                      << "  moves: " << game.num_moves << std::endl;
            print_messages(*agent);
            std::cout << std::endl;
        }
    }

    const GameBoard &game = agent->get_game();
    std::cout << game
              << "game over. score: " << game.score
              << "  moves: " << game.num_moves
              << "  largest tile: " << game.max_tile() << std::endl;
    return 0;
}

static bool read_board(std::istream &is, RawBoard &board)
{
    for (size_t i = 0; i < board_cells; i++) {
        is.read((std::istream::char_type*)&board[i], 1);
    }
    return bool(is);
}

static bool read_state(std::istream &is, uint8_t &state)
{
    is.read((std::istream::char_type*)&state, 1);
    return bool(is);
}

// one board in, one direction byte out, until no move is left
static int pipe_loop(const Options &options, uint64_t seed)
{
    RawBoard cells;
    uint8_t state;
    while (read_board(std::cin, cells) && read_state(std::cin, state)) {
        const GameBoard board(cells);
        if (board.available_moves().empty()) {
            std::cerr << "ai: no further options. terminating." << std::endl;
            return 0;
        }
        std::unique_ptr<Agent> agent = make_agent(options, board, seed++);
        std::cout << (uint8_t)agent->next_move() << std::flush;
    }
    return 0;
}

int main(int argc, char **argv)
{
    Options options;
    if (!parse_options(argc, argv, options)) {
        usage(argv[0]);
        return 2;
    }

    if (!options.log_path.empty() && !open_log(options.log_path)) {
        std::cerr << "ai: cannot open log. terminating." << std::endl;
        return 1;
    }

    const uint64_t seed = options.has_seed ? options.seed : fresh_seed();
    try {
        if (options.pipe) {
            return pipe_loop(options, seed);
        }
        return self_play(options, seed);
    } catch (const std::invalid_argument &e) {
        std::cerr << "ai: " << e.what() << std::endl;
        return 2;
    }
}
