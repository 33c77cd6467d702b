#include "ui/AtaxxGameUI.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

// Usage: ataxx_ui [depth=3]
int main(int argc, char** argv) {
    int depth = 3;
    if (argc > 1) depth = std::atoi(argv[1]);

    try {
        AtaxxGameUI game(depth);
        return game.run();
    } catch (const std::invalid_argument& e) {
        std::cerr << "[UI] " << e.what() << "\n";
        return 1;
    }
}
