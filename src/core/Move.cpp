#include "core/Move.hpp"
#include "core/GameError.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

Move::Move() : pass_(true), col0_(0), row0_(0), col1_(0), row1_(0) {}

Move::Move(char c0, char r0, char c1, char r1)
    : pass_(false), col0_(c0), row0_(r0), col1_(c1), row1_(r1) {}

Move Move::pass() {
    return Move();
}

Move Move::move(char c0, char r0, char c1, char r1) {
    return Move(c0, r0, c1, r1);
}

Move Move::parse(const std::string& text) {
    if (text == "-") {
        return pass();
    }
    const auto isCol = [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; };
    const auto isRow = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
    if (text.size() != 5 || text[2] != '-'
        || !isCol(text[0]) || !isRow(text[1]) || !isCol(text[3]) || !isRow(text[4])) {
        throw IllegalMove("Malformed move: \"" + text + "\"");
    }
    return move(text[0], text[1], text[3], text[4]);
}

int Move::index(char col, char row) {
    return (row - '1' + 2) * EXTENDED_SIDE + (col - 'a' + 2);
}

int Move::distance() const {
    return std::max(std::abs(col1_ - col0_), std::abs(row1_ - row0_));
}

bool Move::isExtend() const {
    return !pass_ && distance() == 1;
}

bool Move::isJump() const {
    return !pass_ && distance() == 2;
}

int Move::fromIndex() const {
    return index(col0_, row0_);
}

int Move::toIndex() const {
    return index(col1_, row1_);
}

std::string Move::toString() const {
    if (pass_) {
        return "-";
    }
    return std::string{col0_, row0_, '-', col1_, row1_};
}

bool Move::operator==(const Move& other) const {
    if (pass_ || other.pass_) {
        return pass_ == other.pass_;
    }
    return col0_ == other.col0_ && row0_ == other.row0_
        && col1_ == other.col1_ && row1_ == other.row1_;
}
