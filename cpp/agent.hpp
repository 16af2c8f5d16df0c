#ifndef AI2048_AGENT_HPP
#define AI2048_AGENT_HPP

#include "expectimax.hpp"
#include "game.hpp"
#include "move_scores.hpp"
#include "random_tree.hpp"

#include <string>
#include <vector>

struct MessageLine {
    std::string text;
    bool emphasis;
};

enum InputAction {
    INPUT_CONTINUE,
    INPUT_EXIT
};

struct InputEvent {
    enum Kind {
        KEY,
        RESIZE,
        MOUSE
    };

    enum KeyCode {
        KEY_CHAR,
        KEY_UP,
        KEY_DOWN,
        KEY_LEFT,
        KEY_RIGHT,
        KEY_ENTER,
        KEY_ESCAPE,
        KEY_OTHER
    };

    Kind kind;
    KeyCode code;
    char ch;

    static InputEvent character(char ch);
    static InputEvent key(KeyCode code);
    static InputEvent non_key(Kind kind);
};

/**
 * Something that owns a game and decides its moves. The front end drives
 * every variant through this interface alone.
 */
class Agent {
public:
    explicit Agent(const GameBoard &game);
    virtual ~Agent();
    Agent(const Agent &ref) = delete;
    Agent &operator=(const Agent &ref) = delete;

protected:
    GameBoard _game;

public:
    inline const GameBoard &get_game() const
    {
        return _game;
    };

    // the move this agent would play now; changes nothing. For the
    // search agents this is the move make_move() commits, UserAgent
    // reports the last key entered instead
    virtual Direction next_move() const = 0;
    virtual void make_move() = 0;
    virtual std::vector<MessageLine> messages() const = 0;
    virtual InputAction get_input(const InputEvent &event);

};

class RandomAgent: public Agent {
public:
    RandomAgent(const GameBoard &game, uint64_t seed);

private:
    rng_t _prng;

public:
    Direction next_move() const override;
    void make_move() override;
    std::vector<MessageLine> messages() const override;

};

class RandomTreeAgent: public Agent {
public:
    RandomTreeAgent(const GameBoard &game,
                    uint64_t seed,
                    size_t sim_count = 1000,
                    RandomTreeMetric metric = METRIC_AVG_SCORE,
                    bool parallel = true);

private:
    rng_t _prng;
    size_t _sim_count;
    RandomTreeMetric _metric;
    bool _parallel;
    MoveScores _last_scores;

public:
    inline const MoveScores &last_scores() const
    {
        return _last_scores;
    };

    Direction next_move() const override;
    void make_move() override;
    std::vector<MessageLine> messages() const override;

};

class ExpectimaxAgent: public Agent {
public:
    explicit ExpectimaxAgent(const GameBoard &game,
                             const ExpectimaxParams &params = ExpectimaxParams());

private:
    Expectimax _search;
    rng_t _prng;
    MoveScores _last_scores;
    size_t _last_evals;

public:
    inline const MoveScores &last_scores() const
    {
        return _last_scores;
    };

    Direction next_move() const override;
    void make_move() override;
    std::vector<MessageLine> messages() const override;

};

/**
 * Keyboard player. Moves are committed as soon as a key arrives, so
 * make_move() has nothing left to do.
 */
class UserAgent: public Agent {
public:
    UserAgent(const GameBoard &game, uint64_t seed);

private:
    rng_t _prng;
    Direction _last_move;

public:
    Direction next_move() const override;
    void make_move() override;
    std::vector<MessageLine> messages() const override;
    InputAction get_input(const InputEvent &event) override;

};

std::vector<MessageLine> score_messages(const MoveScores &scores,
                                        score_t divisor);

#endif
