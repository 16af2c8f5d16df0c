#include <doctest/doctest.h>

#include "cpp/agent.hpp"
#include "cpp/rollout.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <stdexcept>

static size_t count_emphasised(const std::vector<MessageLine> &lines)
{
    size_t result = 0;
    for (const MessageLine &line: lines) {
        result += line.emphasis ? 1 : 0;
    }
    return result;
}

static ExpectimaxParams quick_params(uint64_t seed)
{
    ExpectimaxParams params;
    params.tree_depth = 1;
    params.num_tiles = 2;
    params.heuristic_sims = 2;
    params.max_evals = 40;
    params.parallel = false;
    params.has_seed = true;
    params.seed = seed;
    return params;
}

static GameBoard stuck_board()
{
    return board_from_rows({
        {1, 2, 1, 2},
        {2, 1, 2, 1},
        {1, 2, 1, 2},
        {2, 1, 2, 1}});
}

TEST_CASE("agents play through the common interface")
{
    const GameBoard start = GameBoard::new_seeded(404);

    std::vector<std::unique_ptr<Agent>> agents;
    agents.push_back(std::unique_ptr<Agent>(new RandomAgent(start, 1)));
    agents.push_back(std::unique_ptr<Agent>(
        new RandomTreeAgent(start, 2, 8, METRIC_AVG_SCORE, false)));
    agents.push_back(std::unique_ptr<Agent>(
        new RandomTreeAgent(start, 3, 8, METRIC_AVG_MOVES, true)));
    agents.push_back(std::unique_ptr<Agent>(
        new ExpectimaxAgent(start, quick_params(4))));

    for (auto &agent: agents) {
        CHECK(agent->get_game() == start);
        // random moves can be no-ops, searched moves never are
        for (int i = 0; i < 100 && agent->get_game().num_moves < 3; i++) {
            agent->make_move();
        }
        CHECK(agent->get_game().num_moves > 0);
        CHECK_FALSE(agent->messages().empty());
        CHECK(agent->get_input(InputEvent::character('x')) == INPUT_CONTINUE);
    }
}

TEST_CASE("next_move is pure and matches the committed move")
{
    const GameBoard start = GameBoard::new_seeded(31);

    SUBCASE("random") {
        RandomAgent agent(start, 9);
        const Direction predicted = agent.next_move();
        CHECK(agent.next_move() == predicted);
        CHECK(agent.get_game() == start);

        GameBoard expected(start);
        rng_t rng(9);
        const Direction drawn = random_direction(rng);
        CHECK(drawn == predicted);
        expected.make_move(drawn, rng);
        agent.make_move();
        CHECK(agent.get_game() == expected);
    }

    SUBCASE("random tree") {
        RandomTreeAgent agent(start, 10, 12, METRIC_AVG_SCORE, false);
        const Direction predicted = agent.next_move();
        CHECK(agent.next_move() == predicted);
        CHECK(agent.get_game() == start);

        agent.make_move();
        CHECK(agent.last_scores().max_move() == predicted);
        CHECK(agent.get_game().num_moves == 1);
        CHECK(agent.get_game().score >= start.shifted(predicted).score);
    }

    SUBCASE("expectimax") {
        ExpectimaxAgent agent(start, quick_params(11));
        const Direction predicted = agent.next_move();
        CHECK(agent.next_move() == predicted);
        CHECK(agent.get_game() == start);

        agent.make_move();
        CHECK(agent.last_scores().max_move() == predicted);
        CHECK(agent.get_game().num_moves == 1);
    }
}

TEST_CASE("search agents leave finished games alone")
{
    const GameBoard stuck = stuck_board();

    RandomTreeAgent tree(stuck, 1, 4);
    tree.make_move();
    CHECK(tree.get_game() == stuck);

    ExpectimaxAgent expectimax(stuck, quick_params(1));
    expectimax.make_move();
    CHECK(expectimax.get_game() == stuck);

    RandomAgent random(stuck, 1);
    random.make_move();
    CHECK(random.get_game() == stuck);
}

TEST_CASE("random tree needs at least one simulation")
{
    CHECK_THROWS_AS(RandomTreeAgent(GameBoard(), 1, 0), std::invalid_argument);
}

TEST_CASE("random tree messages")
{
    const GameBoard board = board_from_rows({{1, 2, 3, 4}});
    RandomTreeAgent agent(board, 5, 10, METRIC_AVG_MOVES, false);
    agent.make_move();

    const std::vector<MessageLine> lines = agent.messages();
    REQUIRE(lines.size() == 7);
    CHECK(lines[0].text == "Random Tree Search");
    CHECK(lines[0].emphasis);
    CHECK(lines[1].text.find("10 simulations") != std::string::npos);
    CHECK(lines[1].text.find("number of moves") != std::string::npos);
    CHECK(lines[2].text.empty());
    CHECK(lines[3].text == "Up: -");
    CHECK(lines[4].text.find("Down: ") == 0);
    CHECK(lines[4].emphasis);
    CHECK(count_emphasised(lines) == 2);
}

TEST_CASE("expectimax messages")
{
    ExpectimaxAgent agent(GameBoard::new_seeded(3), quick_params(3));
    agent.make_move();

    const std::vector<MessageLine> lines = agent.messages();
    REQUIRE(lines.size() == 8);
    CHECK(lines[0].text == "Expectimax");
    CHECK(lines[1].text.find("1 levels deep") != std::string::npos);
    CHECK(lines[2].text.find("Evaluations last move: ") == 0);
    CHECK(count_emphasised(lines) == 2);
}

TEST_CASE("score lines")
{
    MoveScores scores;
    scores.set(DIR_LEFT, 300);
    scores.set(DIR_RIGHT, 900);

    const std::vector<MessageLine> lines = score_messages(scores, 3);
    REQUIRE(lines.size() == direction_count);
    CHECK(lines[0].text == "Up: -");
    CHECK(lines[2].text == "Left: 100");
    CHECK(lines[3].text == "Right: 300");
    CHECK(lines[3].emphasis);
    CHECK(count_emphasised(lines) == 1);

    CHECK(count_emphasised(score_messages(MoveScores(), 0)) == 0);
}

TEST_CASE("keyboard input")
{
    const GameBoard board = board_from_rows({{0}, {1}});

    SUBCASE("letters") {
        UserAgent agent(board, 1);
        CHECK(agent.get_input(InputEvent::character('d')) == INPUT_CONTINUE);
        CHECK(agent.next_move() == DIR_RIGHT);
        CHECK(agent.get_game().get_tile(3, 1) == 1);
        CHECK(agent.get_game().num_moves == 1);
    }

    SUBCASE("arrows") {
        UserAgent agent(board, 1);
        CHECK(agent.get_input(InputEvent::key(InputEvent::KEY_UP)) == INPUT_CONTINUE);
        CHECK(agent.next_move() == DIR_UP);
        CHECK(agent.get_game().get_tile(0, 0) == 1);
    }

    SUBCASE("all bindings") {
        const std::vector<std::pair<InputEvent, Direction>> bindings{
            {InputEvent::character('w'), DIR_UP},
            {InputEvent::character('s'), DIR_DOWN},
            {InputEvent::character('a'), DIR_LEFT},
            {InputEvent::character('d'), DIR_RIGHT},
            {InputEvent::key(InputEvent::KEY_UP), DIR_UP},
            {InputEvent::key(InputEvent::KEY_DOWN), DIR_DOWN},
            {InputEvent::key(InputEvent::KEY_LEFT), DIR_LEFT},
            {InputEvent::key(InputEvent::KEY_RIGHT), DIR_RIGHT}};
        for (const auto &binding: bindings) {
            UserAgent agent(board, 1);
            agent.get_input(binding.first);
            CHECK(agent.next_move() == binding.second);
        }
    }

    SUBCASE("q exits") {
        UserAgent agent(board, 1);
        CHECK(agent.get_input(InputEvent::character('q')) == INPUT_EXIT);
        CHECK(agent.get_game() == board);
    }

    SUBCASE("unknown input is ignored") {
        UserAgent agent(board, 1);
        CHECK(agent.get_input(InputEvent::character('x')) == INPUT_CONTINUE);
        CHECK(agent.get_input(InputEvent::key(InputEvent::KEY_ENTER)) == INPUT_CONTINUE);
        CHECK(agent.get_input(InputEvent::non_key(InputEvent::RESIZE)) == INPUT_CONTINUE);
        CHECK(agent.get_input(InputEvent::non_key(InputEvent::MOUSE)) == INPUT_CONTINUE);
        CHECK(agent.get_game() == board);
    }

    SUBCASE("make_move does nothing") {
        UserAgent agent(board, 1);
        agent.make_move();
        CHECK(agent.get_game() == board);
        CHECK(agent.messages().size() == 1);
    }

    SUBCASE("next_move reports the last key, not a pending move") {
        UserAgent agent(board, 1);
        CHECK(agent.next_move() == DIR_UP);
        agent.get_input(InputEvent::character('d'));
        const GameBoard after = agent.get_game();
        agent.make_move();
        CHECK(agent.next_move() == DIR_RIGHT);
        CHECK(agent.get_game() == after);
    }
}
