#pragma once
#include <memory>

#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"

/**
 * Player base interface.
 */
class Player {
    public:
        /// Chooses a move for the current state.
        virtual Move ChooseMove(const GameState& state) = 0;
        /// Returns the color this player plays.
        virtual PieceColor Id() const = 0;
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~Player() = default;
};

/**
 * AI player driven by a move strategy.
 */
class AIPlayer : public Player {
    PieceColor playerId;
    std::unique_ptr<IMoveStrategy> strategy;
public:
    /// Creates an AI player with a provided strategy.
    AIPlayer(PieceColor id, std::unique_ptr<IMoveStrategy> s);
    /// Delegates move selection to the strategy.
    Move ChooseMove(const GameState& state) override;
    /// Returns the player color.
    PieceColor Id() const override;
};
