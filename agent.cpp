#include "cpp/agent.hpp"
#include "cpp/log.hpp"
#include "cpp/rollout.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>

typedef std::chrono::steady_clock default_clock;

/* InputEvent */

InputEvent InputEvent::character(char ch)
{
    return InputEvent{KEY, KEY_CHAR, ch};
}

InputEvent InputEvent::key(KeyCode code)
{
    return InputEvent{KEY, code, 0};
}

InputEvent InputEvent::non_key(Kind kind)
{
    return InputEvent{kind, KEY_OTHER, 0};
}

/* free functions */

std::vector<MessageLine> score_messages(const MoveScores &scores,
                                        score_t divisor)
{
    if (divisor == 0) {
        divisor = 1;
    }

    const Direction best = scores.max_move();
    std::vector<MessageLine> result;
    for (Direction dir: all_directions) {
        std::ostringstream line;
        line << direction_name(dir) << ": ";
        if (scores.available(dir)) {
            line << scores[dir] / divisor;
        } else {
            line << "-";
        }
        result.push_back(MessageLine{
            line.str(),
            scores.any_available() && dir == best});
    }
    return result;
}

/* Agent */

Agent::Agent(const GameBoard &game):
    _game(game)
{

}

Agent::~Agent()
{

}

InputAction Agent::get_input(const InputEvent &)
{
    return INPUT_CONTINUE;
}

/* RandomAgent */

RandomAgent::RandomAgent(const GameBoard &game, uint64_t seed):
    Agent(game),
    _prng(seed)
{

}

Direction RandomAgent::next_move() const
{
    rng_t rng(_prng);
    return random_direction(rng);
}

void RandomAgent::make_move()
{
    const Direction dir = random_direction(_prng);
    _game.make_move(dir, _prng);
}

std::vector<MessageLine> RandomAgent::messages() const
{
    return std::vector<MessageLine>{
        MessageLine{"Performing random actions.", false}};
}

/* RandomTreeAgent */

RandomTreeAgent::RandomTreeAgent(const GameBoard &game,
                                 uint64_t seed,
                                 size_t sim_count,
                                 RandomTreeMetric metric,
                                 bool parallel):
    Agent(game),
    _prng(seed),
    _sim_count(sim_count),
    _metric(metric),
    _parallel(parallel),
    _last_scores()
{
    if (_sim_count == 0) {
        throw std::invalid_argument("random tree: sim_count must be at least 1");
    }
}

Direction RandomTreeAgent::next_move() const
{
    rng_t rng(_prng);
    return score_moves(_game, _sim_count, _metric, _parallel, rng).max_move();
}

void RandomTreeAgent::make_move()
{
    if (_game.game_over()) {
        return;
    }

    default_clock::time_point start = default_clock::now();
    _last_scores = score_moves(_game, _sim_count, _metric, _parallel, _prng);
    std::chrono::duration<double> elapsed = default_clock::now() - start;

    const Direction move = _last_scores.max_move();
    logfile << "ai [move=" << (_game.num_moves+1) << "]: eval time = "
            << elapsed.count() << " seconds" << std::endl
            << "ai [move=" << (_game.num_moves+1) << "]: chosen "
            << direction_name(move) << ", total "
            << _last_scores[move] << " over "
            << _sim_count << " simulations" << std::endl;
    _game.make_move(move, _prng);
}

std::vector<MessageLine> RandomTreeAgent::messages() const
{
    std::ostringstream summary;
    summary << "Taking the average of " << _sim_count
            << " simulations, per move, to determine the next best move."
            << " Comparing by "
            << (_metric == METRIC_AVG_SCORE ? "highest score" : "number of moves")
            << ".";

    std::vector<MessageLine> result{
        MessageLine{"Random Tree Search", true},
        MessageLine{summary.str(), false},
        MessageLine{"", false}};
    for (const MessageLine &line: score_messages(_last_scores, _sim_count)) {
        result.push_back(line);
    }
    return result;
}

/* ExpectimaxAgent */

ExpectimaxAgent::ExpectimaxAgent(const GameBoard &game,
                                 const ExpectimaxParams &params):
    Agent(game),
    _search(params),
    _prng(params.has_seed ? params.seed : fresh_seed()),
    _last_scores(),
    _last_evals(0)
{

}

Direction ExpectimaxAgent::next_move() const
{
    Expectimax search(_search.params());
    rng_t rng(_prng);
    return search.search(_game, rng).max_move();
}

void ExpectimaxAgent::make_move()
{
    if (_game.game_over()) {
        return;
    }

    default_clock::time_point start = default_clock::now();
    _last_scores = _search.search(_game, _prng);
    std::chrono::duration<double> elapsed = default_clock::now() - start;
    _last_evals = _search.evaluations();

    const Direction move = _last_scores.max_move();
    logfile << "ai [move=" << (_game.num_moves+1) << "]: eval time = "
            << elapsed.count() << " seconds" << std::endl
            << "ai [move=" << (_game.num_moves+1) << "]: " << std::endl
            << "  evaluations         : " << _last_evals << std::endl
            << "  chosen move         : " << direction_name(move) << std::endl
            << "  chosen subtree score: " << _last_scores[move] << std::endl;
    _game.make_move(move, _prng);
}

std::vector<MessageLine> ExpectimaxAgent::messages() const
{
    const ExpectimaxParams &params = _search.params();
    std::ostringstream summary;
    summary << "Searching " << params.tree_depth << " levels deep, sampling "
            << params.num_tiles << " tiles per chance layer, "
            << params.heuristic_sims << " simulations per "
            << heuristic_name(params.heuristic) << ", at most "
            << params.max_evals << " evaluations.";
    std::ostringstream evals;
    evals << "Evaluations last move: " << _last_evals;

    std::vector<MessageLine> result{
        MessageLine{"Expectimax", true},
        MessageLine{summary.str(), false},
        MessageLine{evals.str(), false},
        MessageLine{"", false}};
    for (const MessageLine &line: score_messages(_last_scores, 1)) {
        result.push_back(line);
    }
    return result;
}

/* UserAgent */

UserAgent::UserAgent(const GameBoard &game, uint64_t seed):
    Agent(game),
    _prng(seed),
    _last_move(DIR_UP)
{

}

Direction UserAgent::next_move() const
{
    return _last_move;
}

void UserAgent::make_move()
{

}

std::vector<MessageLine> UserAgent::messages() const
{
    return std::vector<MessageLine>{
        MessageLine{"Use WASD or arrow keys to move.", false}};
}

InputAction UserAgent::get_input(const InputEvent &event)
{
    if (event.kind != InputEvent::KEY) {
        return INPUT_CONTINUE;
    }

    Direction dir;
    switch (event.code) {
    case InputEvent::KEY_UP: dir = DIR_UP; break;
    case InputEvent::KEY_DOWN: dir = DIR_DOWN; break;
    case InputEvent::KEY_LEFT: dir = DIR_LEFT; break;
    case InputEvent::KEY_RIGHT: dir = DIR_RIGHT; break;
    case InputEvent::KEY_CHAR:
    {
        switch (event.ch) {
        case 'q': return INPUT_EXIT;
        case 'w': dir = DIR_UP; break;
        case 's': dir = DIR_DOWN; break;
        case 'a': dir = DIR_LEFT; break;
        case 'd': dir = DIR_RIGHT; break;
        default: return INPUT_CONTINUE;
        };
        break;
    };
    default:
        // unrecognised keys are ignored
        return INPUT_CONTINUE;
    };

    _last_move = dir;
    _game.make_move(dir, _prng);
    return INPUT_CONTINUE;
}
