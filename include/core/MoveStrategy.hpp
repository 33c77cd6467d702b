#pragma once
#include <cstdint>
#include <limits>
#include <optional>
#include <random>

#include "core/Board.hpp"
#include "core/GameState.hpp"
#include "core/Move.hpp"

/**
 *Strategy interface for selecting a move.
 */
class IMoveStrategy{
    public:
        /// Returns a legal move (possibly a pass) for the side to move in state.
        virtual Move select(const GameState& state) = 0;
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~IMoveStrategy() = default;
};

/**
 *  Random move selection strategy.
 *
 *  Identical seeds produce identical choices.
 */
class RandomStrategy : public IMoveStrategy {
public:
    /// Creates a strategy drawing from a generator seeded with seed.
    explicit RandomStrategy(std::uint64_t seed);
    /// Selects a random legal move, or a pass when there is none.
    Move select(const GameState& state) override;

private:
    std::mt19937_64 rng;
};

/**
 *  Minimax search result container.
 */
struct SearchResult {
    std::optional<Move> bestMove;
    int score{0};
    long nodes{0};
};

/**
 * Depth-limited minimax search with alpha-beta pruning.
 *
 * Scores are from Red's point of view: Red maximizes, Blue minimizes.
 * Leaves score Red pieces minus Blue pieces; decided games score
 * +/-(WINNING_VALUE + remaining depth) so quicker wins rank higher.
 */
class MinimaxStrategy : public IMoveStrategy {
public:
    /// A score magnitude above any material difference.
    static constexpr int WINNING_VALUE = std::numeric_limits<int>::max() - 20;
    /// A magnitude greater than any score.
    static constexpr int INFTY = std::numeric_limits<int>::max();
    /// Deepest supported search (keeps WINNING_VALUE + depth below INFTY).
    static constexpr int MAX_DEPTH = 16;

    /// Creates a search of maxDepth plies; pruning=false gives plain minimax.
    explicit MinimaxStrategy(int maxDepth, bool pruning = true);
    /// Passes when the side to move cannot move, otherwise searches a fork of the board.
    /// On a finished game returns the first legal move (or a pass) without searching.
    Move select(const GameState& state) override;
    /// Searches board to depth plies; board is restored before returning.
    SearchResult search(Board& board, int depth) const;
    /// Returns the configured search depth.
    int getMaxDepth() const;
    /// Enables or disables console logging.
    void setLogUsage(bool enable);

private:
    int minMax(Board& board, int depth, bool saveMove, int sense, int alpha, int beta,
               SearchResult& result) const;
    static int staticScore(const Board& board, int winningValue);

    int maxDepth;
    bool pruning;
    bool logUsage{true};
};
