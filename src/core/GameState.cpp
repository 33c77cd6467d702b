#include "core/GameState.hpp"

GameState::GameState() : Position() {}
GameState::GameState(const Board& b) : Position(b) {}
GameState::GameState(const GameState& other) : Position(other.Position) {}

const Board& GameState::GetBoard() const {
    return Position;
}

PieceColor GameState::WhoseMove() const {
    return Position.whoseMove();
}

std::vector<Move> GameState::GetAvailableMoves() const {
    return LegalMoves(Position);
}

bool GameState::IsTerminal() const {
    return Position.winner().has_value();
}

std::optional<PieceColor> GameState::Winner() const {
    return Position.winner();
}

//Every destination in the 5x5 window around each piece of the side to move
std::vector<Move> GameState::LegalMoves(const Board& b) {
    std::vector<Move> moves;
    const PieceColor mover = b.whoseMove();
    for (char col = 'a'; col <= 'g'; ++col) {
        for (char row = '1'; row <= '7'; ++row) {
            if (b.get(col, row) != mover) {
                continue;
            }
            for (int dc = -2; dc <= 2; ++dc) {
                for (int dr = -2; dr <= 2; ++dr) {
                    const char toCol = static_cast<char>(col + dc);
                    const char toRow = static_cast<char>(row + dr);
                    if (b.legal(col, row, toCol, toRow)) {
                        moves.push_back(Move::move(col, row, toCol, toRow));
                    }
                }
            }
        }
    }
    return moves;
}
