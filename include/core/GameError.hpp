#pragma once
#include <stdexcept>
#include <string>

/**
 * Base class for rule violations reported by the Board.
 */
class GameError : public std::runtime_error {
public:
    explicit GameError(const std::string& what) : std::runtime_error(what) {}
};

/// Raised when a move fails the legality check or cannot be parsed.
class IllegalMove : public GameError {
public:
    explicit IllegalMove(const std::string& what) : GameError(what) {}
};

/// Raised when a block is placed after the first move or on a non-empty square.
class IllegalBlock : public GameError {
public:
    explicit IllegalBlock(const std::string& what) : GameError(what) {}
};
