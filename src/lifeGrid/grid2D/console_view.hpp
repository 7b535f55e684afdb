#pragma once

#include <chrono>
#include <ostream>

#include "grid.hpp"

// ---- ConsoleView ---- //
// Text renderer. Reads snapshots only; the grid knows nothing about it.
class ConsoleView {
private:
    std::ostream& out;
    char aliveGlyph;
    char deadGlyph;

public:
    explicit ConsoleView(std::ostream& os, char alive = 'o', char dead = '.')
        : out(os), aliveGlyph(alive), deadGlyph(dead) {}

    void render(const Snapshot& snap);
};

// Renders `frames` frames, stepping the grid between consecutive frames.
void animate(Grid& grid, ConsoleView& view, int frames,
             std::chrono::milliseconds delay);
