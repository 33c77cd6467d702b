#include "ui/BoardTile.hpp"

BoardTile::BoardTile(const sf::Vector2f& topLeft, float size)
    : shape_(sf::Vector2f(size, size)), size_(size) {
    shape_.setPosition(topLeft);
    shape_.setOutlineColor(sf::Color::Black);
    shape_.setOutlineThickness(-1.0f); // draw the outline inside the square
}

void BoardTile::setFillColor(const sf::Color& color) {
    shape_.setFillColor(color);
}

void BoardTile::setOutline(const sf::Color& color, float thickness) {
    shape_.setOutlineColor(color);
    shape_.setOutlineThickness(-thickness);
}

sf::Vector2f BoardTile::getCenter() const {
    const sf::Vector2f pos = shape_.getPosition();
    return sf::Vector2f(pos.x + size_ / 2.0f, pos.y + size_ / 2.0f);
}

float BoardTile::getSize() const {
    return size_;
}

bool BoardTile::contains(const sf::Vector2f& point) const {
    return shape_.getGlobalBounds().contains(point);
}

void BoardTile::draw(sf::RenderTarget& target) const {
    target.draw(shape_);
}
