#include "console_view.hpp"
#include <string>
#include <thread>

void ConsoleView::render(const Snapshot& snap)
{
    out << "Generation " << snap.generation << ":\n";

    std::string line(snap.cols, deadGlyph);
    for (std::size_t i = 0; i < snap.rows; ++i)
    {
        for (std::size_t j = 0; j < snap.cols; ++j)
            line[j] = snap.alive(i, j) ? aliveGlyph : deadGlyph;
        out << line << "\n";
    }
    out << "\n";
}

void animate(Grid& grid, ConsoleView& view, int frames,
             std::chrono::milliseconds delay)
{
    if (frames < 0)
        throw InvalidParameter("frame count must be non-negative, got " +
                               std::to_string(frames));

    for (int frame = 0; frame < frames; ++frame)
    {
        view.render(grid.snapshot());

        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);

        if (frame < frames - 1)
            grid.step();
    }
}
