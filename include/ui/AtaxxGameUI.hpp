#pragma once

#include <SFML/Graphics.hpp>
#include <string>
#include <vector>

#include "core/Board.hpp"
#include "core/Player.hpp"
#include "ui/BoardTile.hpp"

class AtaxxGameUI {
public:
    explicit AtaxxGameUI(int aiDepth);

    int run();

private:
    struct Tile {
        BoardTile square;
        char col;
        char row;

        Tile(const sf::Vector2f& topLeft, float size, char c, char r);
    };

    void buildLayout();
    void updateTileColors();
    void onBoardChanged(const Board& board);
    void handleClick(const sf::Vector2f& pos);
    bool applyMove(const std::string& text);
    void playAiMove();
    void undoTurn();
    void resetGame();
    int pickTileIndex(const sf::Vector2f& pos) const;
    std::string squareName(int tileIndex) const;
    void updateWindowTitle(sf::RenderWindow& window) const;
    void updateHover(const sf::RenderWindow& window);
    void drawPieces(sf::RenderTarget& target) const;
    void drawBlock(sf::RenderTarget& target, const sf::Vector2f& center, float size) const;
    void printBoardStatus() const;

    int aiDepth_ = 0;
    Board board_;
    AIPlayer blueAI_;
    bool dirty_ = true;
    bool blockMode_ = false;
    int selectedIndex_ = -1;
    int hoveredIndex_ = -1;
    sf::Vector2u windowSize_{0, 0};

    std::vector<Tile> tiles_;
};
