#include "core/Board.hpp"
#include "core/GameError.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace {
bool InRange(char value, char minValue, char maxValue) {
    return value >= minValue && value <= maxValue;
}
} // namespace

Board::Board() {
    clear();
}

Board::Board(Notifier notifier) : notifier_(std::move(notifier)) {
    clear();
}

Board::Board(const Board& other)
    : board_(other.board_),
      numPieces_(other.numPieces_),
      whoseMove_(other.whoseMove_),
      numJumps_(other.numJumps_),
      winner_(other.winner_),
      forkedMoves_(other.forkedMoves_ + other.numMoves()) {}

bool Board::onBoard(char col, char row) {
    return InRange(col, 'a', 'g') && InRange(row, '1', '7');
}

void Board::clear() {
    board_.fill(PieceColor::BLOCKED);
    for (char col = 'a'; col <= 'g'; ++col) {
        for (char row = '1'; row <= '7'; ++row) {
            board_[index(col, row)] = PieceColor::EMPTY;
        }
    }
    board_[index('a', '1')] = PieceColor::RED;
    board_[index('g', '7')] = PieceColor::RED;
    board_[index('a', '7')] = PieceColor::BLUE;
    board_[index('g', '1')] = PieceColor::BLUE;

    numPieces_.fill(0);
    numPieces_[static_cast<int>(PieceColor::RED)] = 2;
    numPieces_[static_cast<int>(PieceColor::BLUE)] = 2;
    numPieces_[static_cast<int>(PieceColor::EMPTY)] = AREA - 4;

    whoseMove_ = PieceColor::RED;
    numJumps_ = 0;
    winner_.reset();
    forkedMoves_ = 0;
    allMoves_.clear();
    undoLog_.clear();
    announce();
}

bool Board::legal(const Move& move) const {
    if (move.isPass()) {
        return !canMove(whoseMove_);
    }
    if (!onBoard(move.col0(), move.row0()) || !onBoard(move.col1(), move.row1())) {
        return false;
    }
    if (get(move.fromIndex()) != whoseMove_ || get(move.toIndex()) != PieceColor::EMPTY) {
        return false;
    }
    return std::abs(move.col1() - move.col0()) <= 2
        && std::abs(move.row1() - move.row0()) <= 2;
}

bool Board::legal(char c0, char r0, char c1, char r1) const {
    return legal(Move::move(c0, r0, c1, r1));
}

bool Board::canMove(PieceColor who) const {
    for (char col = 'a'; col <= 'g'; ++col) {
        for (char row = '1'; row <= '7'; ++row) {
            const int sq = index(col, row);
            if (board_[sq] != who) {
                continue;
            }
            for (int dc = -2; dc <= 2; ++dc) {
                for (int dr = -2; dr <= 2; ++dr) {
                    if (board_[neighbor(sq, dc, dr)] == PieceColor::EMPTY) {
                        return true;
                    }
                }
            }
        }
    }
    return false;
}

void Board::makeMove(const Move& move) {
    if (!legal(move)) {
        throw IllegalMove("Illegal move: " + move.toString());
    }
    if (move.isPass()) {
        pass();
        return;
    }

    const PieceColor mover = whoseMove_;
    const PieceColor opponent = opposite(mover);
    undoLog_.push_back({move, numJumps_, winner_, {}});
    allMoves_.push_back(move);

    const int to = move.toIndex();
    set(to, mover);
    if (move.isJump()) {
        set(move.fromIndex(), PieceColor::EMPTY);
        numJumps_ += 1;
    } else {
        numJumps_ = 0;
    }

    // Capture every adjacent opponent piece.
    for (int dc = -1; dc <= 1; ++dc) {
        for (int dr = -1; dr <= 1; ++dr) {
            const int sq = neighbor(to, dc, dr);
            if (board_[sq] == opponent) {
                set(sq, mover);
            }
        }
    }

    whoseMove_ = opponent;
    updateWinner();
    announce();
}

void Board::makeMove(const std::string& text) {
    makeMove(Move::parse(text));
}

void Board::pass() {
    if (canMove(whoseMove_)) {
        throw IllegalMove("Illegal move: - (" + colorName(whoseMove_) + " can move)");
    }
    undoLog_.push_back({Move::pass(), numJumps_, winner_, {}});
    allMoves_.push_back(Move::pass());
    whoseMove_ = opposite(whoseMove_);
    announce();
}

void Board::undo() {
    if (undoLog_.empty()) {
        throw GameError("No move to undo");
    }
    const UndoGroup group = std::move(undoLog_.back());
    undoLog_.pop_back();

    for (auto it = group.changes.rbegin(); it != group.changes.rend(); ++it) {
        assign(it->square, it->previous);
    }
    numJumps_ = group.jumps;
    winner_ = group.winner;
    whoseMove_ = opposite(whoseMove_);
    allMoves_.pop_back();
    announce();
}

// Square COL ROW plus its mirror images across the middle row, the middle
// column and the center point, without duplicates.
std::vector<int> Board::blockSquares(char col, char row) const {
    const char mirrorCol = static_cast<char>('a' + 'g' - col);
    const char mirrorRow = static_cast<char>('1' + '7' - row);
    std::vector<int> squares{
        index(col, row),
        index(col, mirrorRow),
        index(mirrorCol, row),
        index(mirrorCol, mirrorRow)};
    std::sort(squares.begin(), squares.end());
    squares.erase(std::unique(squares.begin(), squares.end()), squares.end());
    return squares;
}

bool Board::legalBlock(char col, char row) const {
    if (forkedMoves_ + numMoves() != 0 || !onBoard(col, row)) {
        return false;
    }
    for (int sq : blockSquares(col, row)) {
        if (board_[sq] != PieceColor::EMPTY) {
            return false;
        }
    }
    return true;
}

bool Board::legalBlock(const std::string& square) const {
    return square.size() == 2 && legalBlock(square[0], square[1]);
}

void Board::setBlock(char col, char row) {
    if (!legalBlock(col, row)) {
        throw IllegalBlock(std::string("Illegal block placement: ") + col + row);
    }
    for (int sq : blockSquares(col, row)) {
        assign(sq, PieceColor::BLOCKED);
    }
    updateWinner();
    announce();
}

void Board::setBlock(const std::string& square) {
    if (square.size() != 2) {
        throw IllegalBlock("Illegal block placement: " + square);
    }
    setBlock(square[0], square[1]);
}

std::string Board::toString(bool legend) const {
    std::ostringstream out;
    for (char row = '7'; row >= '1'; --row) {
        if (legend) {
            out << row;
        }
        out << ' ';
        for (char col = 'a'; col <= 'g'; ++col) {
            out << ' ' << colorSymbol(get(col, row));
        }
        out << '\n';
    }
    if (legend) {
        out << "   a b c d e f g";
    }
    return out.str();
}

void Board::setNotifier(Notifier notifier) {
    notifier_ = std::move(notifier);
    announce();
}

// Recorded write: the previous contents go into the open undo group.
void Board::set(int sq, PieceColor value) {
    undoLog_.back().changes.push_back({sq, board_[sq]});
    assign(sq, value);
}

void Board::assign(int sq, PieceColor value) {
    numPieces_[static_cast<int>(board_[sq])] -= 1;
    numPieces_[static_cast<int>(value)] += 1;
    board_[sq] = value;
}

void Board::updateWinner() {
    const int red = redPieces();
    const int blue = bluePieces();
    if (red + blue == totalOpen()) {
        winner_ = majority();
    } else if (red == 0) {
        winner_ = PieceColor::BLUE;
    } else if (blue == 0) {
        winner_ = PieceColor::RED;
    } else if (numJumps_ >= JUMP_LIMIT) {
        winner_ = majority();
    } else if (!canMove(PieceColor::RED) && !canMove(PieceColor::BLUE)) {
        winner_ = majority();
    } else {
        winner_.reset();
    }
}

PieceColor Board::majority() const {
    if (redPieces() > bluePieces()) {
        return PieceColor::RED;
    }
    if (bluePieces() > redPieces()) {
        return PieceColor::BLUE;
    }
    return PieceColor::EMPTY;
}

void Board::announce() {
    if (notifier_) {
        notifier_(*this);
    }
}
