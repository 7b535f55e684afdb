#include "patterns.hpp"
#include <stdexcept>

namespace {

std::vector<Coord> pulsar_cells()
{
    // 13x13, mirror symmetric about row 6 and column 6
    const int arms[] = {2, 3, 4, 8, 9, 10};
    const int bars[] = {0, 5, 7, 12};

    std::vector<Coord> cells;
    for (int b : bars)
        for (int a : arms)
        {
            cells.emplace_back(b, a);
            cells.emplace_back(a, b);
        }
    return cells;
}

std::vector<Pattern> build_catalog()
{
    std::vector<Pattern> catalog;

    catalog.push_back({"block", "2x2 still life",
                       {{0, 0}, {0, 1}, {1, 0}, {1, 1}}});
    catalog.push_back({"blinker", "period 2 oscillator",
                       {{0, 0}, {0, 1}, {0, 2}}});
    catalog.push_back({"beacon", "period 2 oscillator",
                       {{0, 0}, {0, 1}, {1, 0}, {2, 3}, {3, 2}, {3, 3}}});
    catalog.push_back({"glider", "moves one cell diagonally every 4 generations",
                       {{1, 0}, {2, 1}, {0, 2}, {1, 2}, {2, 2}}});
    catalog.push_back({"lwss", "lightweight spaceship, moves horizontally",
                       {{0, 1}, {0, 4}, {1, 0}, {2, 0}, {2, 4},
                        {3, 0}, {3, 1}, {3, 2}, {3, 3}}});
    catalog.push_back({"pulsar", "period 3 oscillator",
                       pulsar_cells()});
    catalog.push_back({"r-pentomino", "methuselah, stabilises after 1103 generations",
                       {{0, 1}, {0, 2}, {1, 0}, {1, 1}, {2, 1}}});

    return catalog;
}

}

const std::vector<Pattern>& pattern_catalog()
{
    static const std::vector<Pattern> catalog = build_catalog();
    return catalog;
}

const Pattern& find_pattern(const std::string& name)
{
    for (const auto& p : pattern_catalog())
        if (p.name == name)
            return p;

    throw std::out_of_range("unknown pattern: " + name);
}

std::vector<Coord> place_pattern(const Pattern& pattern,
                                 int row_offset, int col_offset)
{
    std::vector<Coord> placed;
    placed.reserve(pattern.cells.size());
    for (const auto& rc : pattern.cells)
        placed.emplace_back(rc.first + row_offset, rc.second + col_offset);
    return placed;
}

void list_patterns(std::ostream& out)
{
    for (const auto& p : pattern_catalog())
        out << p.name << ": " << p.description << "\n";
}
