#include "core/PieceColor.hpp"

PieceColor opposite(PieceColor color) {
    switch (color) {
    case PieceColor::RED:
        return PieceColor::BLUE;
    case PieceColor::BLUE:
        return PieceColor::RED;
    default:
        return color;
    }
}

bool isPiece(PieceColor color) {
    return color == PieceColor::RED || color == PieceColor::BLUE;
}

std::string colorName(PieceColor color) {
    switch (color) {
    case PieceColor::RED:
        return "Red";
    case PieceColor::BLUE:
        return "Blue";
    case PieceColor::BLOCKED:
        return "Blocked";
    default:
        return "Empty";
    }
}

char colorSymbol(PieceColor color) {
    switch (color) {
    case PieceColor::RED:
        return 'r';
    case PieceColor::BLUE:
        return 'b';
    case PieceColor::BLOCKED:
        return 'X';
    default:
        return '-';
    }
}
