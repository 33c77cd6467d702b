#include "ui/AtaxxGameUI.hpp"

#include "core/GameError.hpp"
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"

#include <iostream>
#include <memory>

constexpr float kWindowMargin = 24.0f;
constexpr float kSquareSize = 60.0f;
constexpr float kPieceRadius = 20.0f;
constexpr float kBlockBarThickness = 5.0f;
constexpr sf::Uint8 kHoverAlpha = 180;

const sf::Color kBlankColor(235, 235, 235);
const sf::Color kSelectedColor(150, 150, 150);
const sf::Color kBlockColor(60, 60, 60);
const sf::Color kRedColor(210, 50, 50);
const sf::Color kBlueColor(50, 90, 210);

AtaxxGameUI::Tile::Tile(const sf::Vector2f& topLeft, float size, char c, char r)
    : square(topLeft, size), col(c), row(r) {}

AtaxxGameUI::AtaxxGameUI(int aiDepth)
    : aiDepth_(aiDepth),
      blueAI_(PieceColor::BLUE, std::make_unique<MinimaxStrategy>(aiDepth)) {
    buildLayout();
    board_.setNotifier([this](const Board& board) { onBoardChanged(board); });
}

void AtaxxGameUI::buildLayout() {
    tiles_.clear();
    tiles_.reserve(static_cast<std::size_t>(Board::AREA));
    // Row 7 at the top, column a on the left.
    for (char row = '7'; row >= '1'; --row) {
        for (char col = 'a'; col <= 'g'; ++col) {
            const sf::Vector2f topLeft(
                kWindowMargin + static_cast<float>(col - 'a') * kSquareSize,
                kWindowMargin + static_cast<float>('7' - row) * kSquareSize);
            tiles_.emplace_back(topLeft, kSquareSize, col, row);
        }
    }
    const float side = static_cast<float>(Board::SIDE) * kSquareSize + 2.0f * kWindowMargin;
    windowSize_ = sf::Vector2u(static_cast<unsigned int>(side), static_cast<unsigned int>(side));
}

// Notifier target: only marks the view stale, never touches the board.
void AtaxxGameUI::onBoardChanged(const Board&) {
    dirty_ = true;
}

void AtaxxGameUI::updateTileColors() {
    for (std::size_t i = 0; i < tiles_.size(); ++i) {
        auto& tile = tiles_[i];
        sf::Color color = kBlankColor;
        if (board_.get(tile.col, tile.row) == PieceColor::BLOCKED) {
            color = kBlockColor;
        } else if (static_cast<int>(i) == selectedIndex_) {
            color = kSelectedColor;
        }
        color.a = (static_cast<int>(i) == hoveredIndex_) ? kHoverAlpha : 255;
        tile.square.setFillColor(color);
        tile.square.setOutline(blockMode_ ? kBlockColor : sf::Color::Black, blockMode_ ? 2.0f : 1.0f);
    }
    dirty_ = false;
}

std::string AtaxxGameUI::squareName(int tileIndex) const {
    const Tile& tile = tiles_[static_cast<std::size_t>(tileIndex)];
    return std::string{tile.col, tile.row};
}

bool AtaxxGameUI::applyMove(const std::string& text) {
    try {
        board_.makeMove(text);
    } catch (const IllegalMove& e) {
        std::cerr << "[UI] " << e.what() << "\n";
        return false;
    }
    printBoardStatus();
    return true;
}

// First click picks a source square, a click elsewhere sends "c0r0-c1r1".
void AtaxxGameUI::handleClick(const sf::Vector2f& pos) {
    const int idx = pickTileIndex(pos);
    if (idx < 0) {
        return;
    }
    if (blockMode_) {
        try {
            board_.setBlock(squareName(idx));
            printBoardStatus();
        } catch (const IllegalBlock& e) {
            std::cerr << "[UI] " << e.what() << "\n";
        }
        return;
    }
    // Clicking one of your own pieces (re)selects it as the source.
    const Tile& tile = tiles_[static_cast<std::size_t>(idx)];
    if (board_.get(tile.col, tile.row) == board_.whoseMove()) {
        selectedIndex_ = (idx == selectedIndex_) ? -1 : idx;
        dirty_ = true;
        return;
    }
    if (selectedIndex_ < 0) {
        return;
    }
    const std::string text = squareName(selectedIndex_) + "-" + squareName(idx);
    selectedIndex_ = -1;
    dirty_ = true;
    applyMove(text);
}

void AtaxxGameUI::playAiMove() {
    GameState state(board_);
    Move move = blueAI_.ChooseMove(state);
    std::cout << "[UI] Blue plays " << move.toString() << "\n";
    applyMove(move.toString());
}

void AtaxxGameUI::undoTurn() {
    try {
        board_.undo();
        // Back to Red so the human is to move.
        while (board_.numMoves() > 0 && board_.whoseMove() == PieceColor::BLUE) {
            board_.undo();
        }
    } catch (const GameError& e) {
        std::cerr << "[UI] " << e.what() << "\n";
    }
    selectedIndex_ = -1;
    printBoardStatus();
}

void AtaxxGameUI::resetGame() {
    board_.clear();
    selectedIndex_ = -1;
    blockMode_ = false;
    printBoardStatus();
}

int AtaxxGameUI::pickTileIndex(const sf::Vector2f& pos) const {
    for (std::size_t i = 0; i < tiles_.size(); ++i) {
        if (tiles_[i].square.contains(pos)) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void AtaxxGameUI::updateWindowTitle(sf::RenderWindow& window) const {
    std::string title = "Ataxx - ";
    if (board_.winner()) {
        const PieceColor winner = *board_.winner();
        title += (winner == PieceColor::EMPTY) ? "Draw" : colorName(winner) + " wins";
    } else {
        title += colorName(board_.whoseMove()) + " to move";
    }
    title += " (Red " + std::to_string(board_.redPieces())
           + " / Blue " + std::to_string(board_.bluePieces()) + ")";
    if (blockMode_) {
        title += " [block mode]";
    }
    window.setTitle(title);
}

void AtaxxGameUI::updateHover(const sf::RenderWindow& window) {
    sf::Vector2i pixelPos = sf::Mouse::getPosition(window);
    if (pixelPos.x < 0 || pixelPos.y < 0 ||
        pixelPos.x >= static_cast<int>(window.getSize().x) ||
        pixelPos.y >= static_cast<int>(window.getSize().y)) {
        if (hoveredIndex_ != -1) {
            hoveredIndex_ = -1;
            dirty_ = true;
        }
        return;
    }

    int idx = pickTileIndex(window.mapPixelToCoords(pixelPos));
    if (idx != hoveredIndex_) {
        hoveredIndex_ = idx;
        dirty_ = true;
    }
}

void AtaxxGameUI::drawPieces(sf::RenderTarget& target) const {
    sf::CircleShape piece(kPieceRadius);
    piece.setOrigin(kPieceRadius, kPieceRadius);
    for (const auto& tile : tiles_) {
        const PieceColor contents = board_.get(tile.col, tile.row);
        const sf::Vector2f center = tile.square.getCenter();
        if (contents == PieceColor::BLOCKED) {
            drawBlock(target, center, tile.square.getSize());
        } else if (isPiece(contents)) {
            piece.setFillColor(contents == PieceColor::RED ? kRedColor : kBlueColor);
            piece.setPosition(center);
            target.draw(piece);
        }
    }
}

// A cross over the square, like a boarded-up window.
void AtaxxGameUI::drawBlock(sf::RenderTarget& target, const sf::Vector2f& center, float size) const {
    sf::RectangleShape bar(sf::Vector2f(size * 0.9f, kBlockBarThickness));
    bar.setOrigin(size * 0.45f, kBlockBarThickness / 2.0f);
    bar.setPosition(center);
    bar.setFillColor(sf::Color::Black);
    bar.setRotation(45.0f);
    target.draw(bar);
    bar.setRotation(-45.0f);
    target.draw(bar);
}

void AtaxxGameUI::printBoardStatus() const {
    std::cout << "\n" << board_.toString(true) << "\n";
    if (board_.winner()) {
        const PieceColor winner = *board_.winner();
        if (winner == PieceColor::EMPTY) {
            std::cout << "Draw.\n";
        } else {
            std::cout << colorName(winner) << " wins.\n";
        }
        return;
    }
    std::cout << colorName(board_.whoseMove()) << " to move\n";
}

int AtaxxGameUI::run() {
    sf::RenderWindow window(
        sf::VideoMode(windowSize_.x, windowSize_.y),
        "Ataxx");
    window.setFramerateLimit(60);
    std::cout << "[UI] Click a piece then a destination. B: block mode, U: undo, "
              << "P: pass, R: new game, Esc: quit. Blue is played at depth " << aiDepth_ << ".\n";
    printBoardStatus();

    while (window.isOpen()) {
        bool humanMovedThisFrame = false;
        sf::Event event;
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed ||
                (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape)) {
                window.close();
            }
            if (event.type == sf::Event::KeyPressed) {
                switch (event.key.code) {
                case sf::Keyboard::R:
                    resetGame();
                    break;
                case sf::Keyboard::U:
                    undoTurn();
                    break;
                case sf::Keyboard::B:
                    blockMode_ = !blockMode_;
                    selectedIndex_ = -1;
                    dirty_ = true;
                    break;
                case sf::Keyboard::P:
                    humanMovedThisFrame = applyMove("-");
                    break;
                default:
                    break;
                }
            }
            if (!board_.winner() &&
                board_.whoseMove() == PieceColor::RED &&
                event.type == sf::Event::MouseButtonPressed &&
                event.mouseButton.button == sf::Mouse::Left) {
                handleClick(window.mapPixelToCoords(
                    sf::Vector2i(event.mouseButton.x, event.mouseButton.y)));
                humanMovedThisFrame = humanMovedThisFrame || board_.whoseMove() == PieceColor::BLUE;
            }
        }

        updateHover(window);

        if (!board_.winner() && board_.whoseMove() == PieceColor::BLUE && !humanMovedThisFrame) {
            blockMode_ = false;
            playAiMove();
        }

        if (dirty_) {
            updateTileColors();
        }
        updateWindowTitle(window);

        window.clear(sf::Color(30, 30, 40));
        for (const auto& tile : tiles_) {
            tile.square.draw(window);
        }
        drawPieces(window);
        window.display();
    }
    return 0;
}
