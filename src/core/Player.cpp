#include "core/Player.hpp"

#include <stdexcept>

AIPlayer::AIPlayer(PieceColor id, std::unique_ptr<IMoveStrategy> s)
    : playerId(id), strategy(std::move(s)) {
    if (!strategy) {
        throw std::invalid_argument("AIPlayer requires a strategy");
    }
}

PieceColor AIPlayer::Id() const {
    return playerId;
}

// Delegate to configured strategy
Move AIPlayer::ChooseMove(const GameState& state) {
    return strategy->select(state);
}
