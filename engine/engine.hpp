#ifndef ENGINE_HPP
#define ENGINE_HPP

#include <random>
#include <string>
#include <utility>
#include <vector>

#define BOARD_SIZE 4
#define N_ACTIONS 4
#define NO_ACTION (-1)

typedef std::vector<std::vector<int>> Board;
typedef std::vector<int> Row;
typedef std::pair<int, int> Cell;

// Fixed action space order, 0..3
enum Action {Up, Down, Left, Right};

typedef struct {
    Board board;         // Board after sliding/merging, before spawn
    int score_delta;     // Sum of the values produced by merges
    int merge_count;
    double merge_log2;   // Sum of log2 of every merged value
    bool moved;
} TransitionResult;

/*
 * Pure board mechanics. None of these own randomness; spawn_tile takes the
 * generator from the caller. Malformed input throws std::invalid_argument.
 */
TransitionResult apply_move(const Board &board, const int action);
Board spawn_tile(const Board &board, std::mt19937 &rng);
bool is_terminal(const Board &board);
std::vector<int> legal_moves(const Board &board);

// Same as above without validation. For search loops whose boards were
// produced by the engine from an already validated board.
TransitionResult apply_move_unchecked(const Board &board, const int action);
Board spawn_tile_unchecked(const Board &board, std::mt19937 &rng);
std::vector<int> legal_moves_unchecked(const Board &board);

void validate_board(const Board &board);
void validate_action(const int action);
Board empty_board();
std::vector<Cell> empty_cells(const Board &board);
int count_tiles(const Board &board);
int max_tile(const Board &board);
const char *action_name(const int action);
std::string board_to_string(const Board &board);

void board_rot90(Board &board);
void board_rot180(Board &board);
void board_rot270(Board &board);

#endif
