#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>

#include "GameRunner.hpp"
#include "core/Board.hpp"
#include "core/MoveStrategy.hpp"

namespace {

// Depth 0 selects the random strategy
std::unique_ptr<IMoveStrategy> makeStrategy(int depth, std::uint64_t seed) {
    if (depth <= 0) {
        return std::make_unique<RandomStrategy>(seed);
    }
    auto strategy = std::make_unique<MinimaxStrategy>(depth);
    strategy->setLogUsage(false);
    return strategy;
}

} // namespace

int main(int argc, char** argv) {
    int games = 10;
    int redDepth = 3;
    int blueDepth = 2;
    int blocks = 0;
    std::uint64_t seed = static_cast<std::uint64_t>(std::time(nullptr));

    if (argc > 1) games = std::atoi(argv[1]);
    if (argc > 2) redDepth = std::atoi(argv[2]);
    if (argc > 3) blueDepth = std::atoi(argv[3]);
    if (argc > 4) blocks = std::atoi(argv[4]);
    if (argc > 5) seed = std::strtoull(argv[5], nullptr, 10);

    if (games < 1) games = 1;

    std::unique_ptr<IMoveStrategy> redStrategy;
    std::unique_ptr<IMoveStrategy> blueStrategy;
    try {
        redStrategy = makeStrategy(redDepth, seed);
        blueStrategy = makeStrategy(blueDepth, seed + 1);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Selfplay] " << e.what() << "\n";
        return 1;
    }

    std::mt19937_64 rng(seed);
    GameRunner runner(*redStrategy, *blueStrategy);
    int redWins = 0, blueWins = 0, draws = 0;
    auto start = std::chrono::steady_clock::now();

    std::cout << "[Selfplay] Red depth " << redDepth << " vs Blue depth " << blueDepth
              << " | blocks: " << blocks << " | seed: " << seed << "\n";

    for (int i = 0; i < games; ++i) {
        Board board;
        int placed = GameRunner::placeRandomBlocks(board, blocks, rng);

        GameOutcome outcome = runner.playOne(&board);
        if (outcome.winner == PieceColor::RED) redWins++;
        else if (outcome.winner == PieceColor::BLUE) blueWins++;
        else draws++;

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - start).count();
        std::cout << "[Selfplay] Game " << (i + 1) << "/" << games
                  << " winner: " << (outcome.winner == PieceColor::EMPTY ? "draw" : colorName(outcome.winner))
                  << " | pieces: " << outcome.redPieces << "-" << outcome.bluePieces
                  << " | plies: " << outcome.moves.size()
                  << " | block groups: " << placed
                  << " | elapsed: " << elapsed << "s"
                  << "\n";
    }

    std::cout << "[Selfplay] Red " << redWins << " | Blue " << blueWins << " | Draw " << draws << "\n";
    return 0;
}
