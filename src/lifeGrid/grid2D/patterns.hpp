#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "grid.hpp"

// ---- Patterns ---- //
// Cells are relative to the pattern's own top-left corner.
struct Pattern {
    std::string name;
    std::string description;
    std::vector<Coord> cells;
};

const std::vector<Pattern>& pattern_catalog();

// throws std::out_of_range for an unknown name
const Pattern& find_pattern(const std::string& name);

// Translated copy of the cells; nothing is clipped, populate() drops
// whatever falls off the grid.
std::vector<Coord> place_pattern(const Pattern& pattern,
                                 int row_offset, int col_offset);

void list_patterns(std::ostream& out);
