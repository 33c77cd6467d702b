#include "core/Board.hpp"
#include "core/GameError.hpp"
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"
#include "core/Player.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

void printResult(const Board& board) {
    const PieceColor winner = *board.winner();
    if (winner == PieceColor::EMPTY) {
        std::cout << "Draw.\n";
    } else {
        std::cout << colorName(winner) << " wins.\n";
    }
}

void printHelp() {
    std::cout << "Commands:\n"
              << "  c0r0-c1r1   move, e.g. a1-a2 (extend) or a1-a3 (jump)\n"
              << "  -           pass (only when you have no move)\n"
              << "  block c3    block c3 and its mirror squares (before the first move)\n"
              << "  undo        take back your last move\n"
              << "  new         start a new game\n"
              << "  dump        print the board\n"
              << "  quit        leave\n";
}

} // namespace

// Usage: ataxx_cli [depth=4] [human=r|b|none]
int main(int argc, char** argv) {
    int depth = 4;
    std::string human = "r";
    if (argc > 1) depth = std::atoi(argv[1]);
    if (argc > 2) human = argv[2];

    std::unique_ptr<AIPlayer> redAI;
    std::unique_ptr<AIPlayer> blueAI;
    try {
        if (human != "r") {
            redAI = std::make_unique<AIPlayer>(PieceColor::RED, std::make_unique<MinimaxStrategy>(depth));
        }
        if (human != "b") {
            blueAI = std::make_unique<AIPlayer>(PieceColor::BLUE, std::make_unique<MinimaxStrategy>(depth));
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    printHelp();
    Board board([](const Board& b) { std::cout << "\n" << b.toString(true) << "\n"; });
    auto aiFor = [&](PieceColor color) {
        return color == PieceColor::RED ? redAI.get() : blueAI.get();
    };

    bool reported = false;
    std::string line;
    while (true) {
        if (board.winner()) {
            if (!reported) {
                printResult(board);
                reported = true;
            }
        } else if (AIPlayer* ai = aiFor(board.whoseMove())) {
            Move move = ai->ChooseMove(GameState(board));
            std::cout << colorName(ai->Id()) << " moves " << move.toString() << ".\n";
            board.makeMove(move);
            continue;
        } else {
            std::cout << colorName(board.whoseMove()) << "> " << std::flush;
        }

        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream words(line);
        std::string cmd;
        words >> cmd;
        if (cmd.empty()) {
            continue;
        }

        try {
            if (cmd == "quit") {
                break;
            } else if (cmd == "help") {
                printHelp();
            } else if (cmd == "new") {
                board.clear();
                reported = false;
            } else if (cmd == "dump") {
                std::cout << "===\n" << board.toString() << "===\n";
            } else if (cmd == "undo") {
                board.undo();
                // Also take back the AI replies so the human is to move again.
                while (board.numMoves() > 0 && aiFor(board.whoseMove()) != nullptr) {
                    board.undo();
                }
                reported = false;
            } else if (cmd == "block") {
                std::string square;
                words >> square;
                board.setBlock(square);
            } else if (board.winner()) {
                std::cout << "Game over: use new or undo.\n";
            } else {
                board.makeMove(cmd);
            }
        } catch (const GameError& e) {
            std::cerr << e.what() << "\n";
        }
    }
    return 0;
}
