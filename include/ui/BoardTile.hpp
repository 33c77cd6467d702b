#pragma once

#include <SFML/Graphics.hpp>

class BoardTile {
public:
    BoardTile(const sf::Vector2f& topLeft, float size);

    void setFillColor(const sf::Color& color);
    void setOutline(const sf::Color& color, float thickness);

    sf::Vector2f getCenter() const;
    float getSize() const;
    bool contains(const sf::Vector2f& point) const;

    void draw(sf::RenderTarget& target) const;

private:
    sf::RectangleShape shape_;
    float size_ = 0.0f;
};
