#include "engine.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

static Row compress(const Row &row)
{
    Row new_row;
    new_row.reserve(BOARD_SIZE);
    for(int i = 0; i < BOARD_SIZE; i++) {
        if(row[i] != 0) {
            new_row.push_back(row[i]);
        }
    }
    while(new_row.size() < BOARD_SIZE) {
        new_row.push_back(0);
    }
    return new_row;
}

// Expects a compressed row. A merged tile is followed by a 0, so it is never
// merged a second time in the same pass.
static Row merge(const Row &row, TransitionResult &result)
{
    Row new_row = row;
    for(int i = 0; i < BOARD_SIZE - 1; i++) {
        if(new_row[i] != 0 && new_row[i] == new_row[i + 1]) {
            new_row[i] *= 2;
            new_row[i + 1] = 0;
            result.score_delta += new_row[i];
            result.merge_count += 1;
            result.merge_log2 += std::log2(static_cast<double>(new_row[i]));
        }
    }
    return new_row;
}

static void move_left(Board &board, TransitionResult &result)
{
    for(int i = 0; i < BOARD_SIZE; i++) {
        Row new_row = compress(board[i]);
        new_row = merge(new_row, result);
        new_row = compress(new_row);
        if(new_row != board[i]) {
            result.moved = true;
            board[i] = new_row;
        }
    }
}

static bool is_power_of_two_tile(const int value)
{
    return value >= 2 && (value & (value - 1)) == 0;
}

void validate_board(const Board &board)
{
    if(board.size() != BOARD_SIZE) {
        throw std::invalid_argument("Board must have " + std::to_string(BOARD_SIZE)
                                    + " rows, got " + std::to_string(board.size()));
    }
    for(int i = 0; i < BOARD_SIZE; i++) {
        if(board[i].size() != BOARD_SIZE) {
            throw std::invalid_argument("Board row " + std::to_string(i) + " must have "
                                        + std::to_string(BOARD_SIZE) + " cells, got "
                                        + std::to_string(board[i].size()));
        }
        for(int j = 0; j < BOARD_SIZE; j++) {
            const int tile = board[i][j];
            if(tile != 0 && !is_power_of_two_tile(tile)) {
                throw std::invalid_argument("Invalid tile " + std::to_string(tile) + " at ("
                                            + std::to_string(i) + ", " + std::to_string(j) + ")");
            }
        }
    }
}

void validate_action(const int action)
{
    if(action < 0 || action >= N_ACTIONS) {
        throw std::invalid_argument("Invalid action " + std::to_string(action));
    }
}

TransitionResult apply_move(const Board &board, const int action)
{
    validate_board(board);
    validate_action(action);
    return apply_move_unchecked(board, action);
}

TransitionResult apply_move_unchecked(const Board &board, const int action)
{
    TransitionResult result = {board, 0, 0, 0.0, false};
    Board &b = result.board;
    // Rotate so that the move direction slides toward column 0
    switch(action) {
        case Up:
            board_rot90(b);
            move_left(b, result);
            board_rot270(b);
            break;
        case Down:
            board_rot270(b);
            move_left(b, result);
            board_rot90(b);
            break;
        case Left:
            move_left(b, result);
            break;
        case Right:
            board_rot180(b);
            move_left(b, result);
            board_rot180(b);
            break;
    }
    return result;
}

Board spawn_tile(const Board &board, std::mt19937 &rng)
{
    validate_board(board);
    return spawn_tile_unchecked(board, rng);
}

Board spawn_tile_unchecked(const Board &board, std::mt19937 &rng)
{
    std::vector<Cell> empty_tiles = empty_cells(board);
    Board new_board = board;
    if(empty_tiles.empty())
        return new_board;
    std::uniform_int_distribution<> cell_dis(0, empty_tiles.size() - 1);
    std::uniform_int_distribution<> value_dis(0, 9);
    const Cell &cell = empty_tiles[cell_dis(rng)];
    new_board[cell.first][cell.second] = (value_dis(rng) == 0) ? 4 : 2;
    return new_board;
}

bool is_terminal(const Board &board)
{
    validate_board(board);
    for(int i = 0; i < BOARD_SIZE; i++) {
        for(int j = 0; j < BOARD_SIZE; j++) {
            if(board[i][j] == 0) {
                return false;
            }
            if(i < BOARD_SIZE - 1 && board[i][j] == board[i + 1][j]) {
                return false;
            }
            if(j < BOARD_SIZE - 1 && board[i][j] == board[i][j + 1]) {
                return false;
            }
        }
    }
    return true;
}

std::vector<int> legal_moves(const Board &board)
{
    validate_board(board);
    return legal_moves_unchecked(board);
}

std::vector<int> legal_moves_unchecked(const Board &board)
{
    std::vector<int> legal_actions;
    for(int action = 0; action < N_ACTIONS; action++) {
        if(apply_move_unchecked(board, action).moved) {
            legal_actions.push_back(action);
        }
    }
    return legal_actions;
}

Board empty_board()
{
    return Board(BOARD_SIZE, Row(BOARD_SIZE, 0));
}

std::vector<Cell> empty_cells(const Board &board)
{
    std::vector<Cell> cells;
    for(int i = 0; i < static_cast<int>(board.size()); i++) {
        for(int j = 0; j < static_cast<int>(board[i].size()); j++) {
            if(board[i][j] == 0) {
                cells.emplace_back(i, j);
            }
        }
    }
    return cells;
}

int count_tiles(const Board &board)
{
    int count = 0;
    for(const auto &row : board) {
        count += std::count_if(row.begin(), row.end(), [](int tile) { return tile != 0; });
    }
    return count;
}

int max_tile(const Board &board)
{
    int highest = 0;
    for(const auto &row : board) {
        for(const auto &tile : row) {
            highest = std::max(highest, tile);
        }
    }
    return highest;
}

const char *action_name(const int action)
{
    switch(action) {
        case Up:
            return "Up";
        case Down:
            return "Down";
        case Left:
            return "Left";
        case Right:
            return "Right";
        default:
            return "None";
    }
}

std::string board_to_string(const Board &board)
{
    std::ostringstream oss;
    for(const auto &row : board) {
        for(size_t j = 0; j < row.size(); j++) {
            oss << row[j];
            if(j + 1 < row.size())
                oss << "\t";
        }
        oss << "\n";
    }
    return oss.str();
}

void board_rot90(Board &board)
{
    int size = board.size();
    Board temp(size, Row(size, 0));
    for(int i = 0; i < size; i++) {
        for(int j = 0; j < size; j++) {
            temp[size - 1 - j][i] = board[i][j];
        }
    }
    board = temp;
    return;
}

void board_rot180(Board &board)
{
    int size = board.size();
    Board temp(size, Row(size, 0));
    for(int i = 0; i < size; i++) {
        for(int j = 0; j < size; j++) {
            temp[size - 1 - i][size - 1 - j] = board[i][j];
        }
    }
    board = temp;
    return;
}

void board_rot270(Board &board)
{
    int size = board.size();
    Board temp(size, Row(size, 0));
    for(int i = 0; i < size; i++) {
        for(int j = 0; j < size; j++) {
            temp[j][size - 1 - i] = board[i][j];
        }
    }
    board = temp;
    return;
}
