#include "core/MoveStrategy.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

int ValidateDepth(int depth) {
    if (depth <= 0 || depth > MinimaxStrategy::MAX_DEPTH) {
        throw std::invalid_argument("Search depth must be in [1, "
                                    + std::to_string(MinimaxStrategy::MAX_DEPTH) + "]");
    }
    return depth;
}

// Moves to try at a node; a side with no move still has to pass.
std::vector<Move> candidateMoves(const Board& board) {
    std::vector<Move> moves = GameState::LegalMoves(board);
    if (moves.empty()) {
        moves.push_back(Move::pass());
    }
    return moves;
}

} // namespace

RandomStrategy::RandomStrategy(std::uint64_t seed) : rng(seed) {}

//Uniform choice over the legal moves
Move RandomStrategy::select(const GameState& state) {
    std::vector<Move> moves = state.GetAvailableMoves();
    if (moves.empty()) return Move::pass();
    std::uniform_int_distribution<std::size_t> pick(0, moves.size() - 1);
    return moves[pick(rng)];
}

MinimaxStrategy::MinimaxStrategy(int maxDepth, bool pruning)
    : maxDepth(ValidateDepth(maxDepth)), pruning(pruning) {}

int MinimaxStrategy::getMaxDepth() const {
    return maxDepth;
}

void MinimaxStrategy::setLogUsage(bool enable) {
    logUsage = enable;
}

Move MinimaxStrategy::select(const GameState& state) {
    const Board& live = state.GetBoard();
    if (live.winner()) {
        // Nothing left to search; still hand back a move the board accepts.
        std::vector<Move> moves = state.GetAvailableMoves();
        return moves.empty() ? Move::pass() : moves.front();
    }
    if (!live.canMove(live.whoseMove())) {
        if (logUsage) {
            std::cout << "[Minimax] " << colorName(live.whoseMove()) << " has no move, passing\n";
        }
        return Move::pass();
    }

    Board board(live); // private fork, mutated only by make/undo below
    SearchResult res = search(board, maxDepth);
    if (logUsage) {
        std::cout << "[Minimax] " << colorName(live.whoseMove())
                  << " depth=" << maxDepth
                  << " move=" << (res.bestMove ? res.bestMove->toString() : "none")
                  << " score=" << res.score
                  << " nodes=" << res.nodes
                  << (pruning ? "" : " (no pruning)") << "\n";
    }
    return res.bestMove ? *res.bestMove : Move::pass();
}

SearchResult MinimaxStrategy::search(Board& board, int depth) const {
    SearchResult result;
    const int sense = (board.whoseMove() == PieceColor::RED) ? 1 : -1;
    result.score = minMax(board, ValidateDepth(depth), true, sense, -INFTY, INFTY, result);
    return result;
}

// Value of BOARD searched DEPTH plies deep, maximizing when SENSE is 1 and
// minimizing when it is -1. Only the root call (SAVEMOVE) records a move.
int MinimaxStrategy::minMax(Board& board, int depth, bool saveMove, int sense, int alpha, int beta,
                            SearchResult& result) const {
    result.nodes += 1;
    if (depth == 0 || board.winner()) {
        return staticScore(board, WINNING_VALUE + depth);
    }

    int bestScore = -INFTY * sense;
    for (const Move& move : candidateMoves(board)) {
        board.makeMove(move);
        const int response = minMax(board, depth - 1, false, -sense, alpha, beta, result);
        board.undo();

        // Strict improvement only: a pruned sibling returns a bound, never a better exact value.
        if (sense == 1 ? response > bestScore : response < bestScore) {
            bestScore = response;
            if (saveMove) {
                result.bestMove = move;
            }
        }
        if (!pruning) {
            continue;
        }
        if (sense == 1) {
            alpha = std::max(alpha, bestScore);
        } else {
            beta = std::min(beta, bestScore);
        }
        if (alpha >= beta) {
            break;
        }
    }
    return bestScore;
}

int MinimaxStrategy::staticScore(const Board& board, int winningValue) {
    const auto& winner = board.winner();
    if (winner) {
        switch (*winner) {
        case PieceColor::RED:
            return winningValue;
        case PieceColor::BLUE:
            return -winningValue;
        default:
            return 0;
        }
    }
    return board.redPieces() - board.bluePieces();
}
