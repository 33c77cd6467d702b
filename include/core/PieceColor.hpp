#pragma once
#include <string>

/**
 * Contents of a board square.
 *
 * BLOCKED is permanent for a game: the border ring and player-placed blocks.
 */
enum class PieceColor {
    EMPTY,
    RED,
    BLUE,
    BLOCKED
};

/// Returns the other player for RED/BLUE, and the color itself otherwise.
PieceColor opposite(PieceColor color);
/// Returns true for RED and BLUE.
bool isPiece(PieceColor color);
/// Returns "Red", "Blue", "Empty" or "Blocked".
std::string colorName(PieceColor color);
/// Returns the board glyph: 'r', 'b', '-' or 'X'.
char colorSymbol(PieceColor color);
