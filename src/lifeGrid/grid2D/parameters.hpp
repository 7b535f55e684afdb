#pragma once

#include <cstdint>
#include <string>
#include <vector>

// ---- Parameters ---- //
// Demo driver settings, read from positional command-line arguments:
//   rows cols frames delay_ms random density [seed]
//   rows cols frames delay_ms pattern name [row col]
struct Parameters {
    int rows{0};
    int cols{0};
    int frames{0};
    int delay_ms{0};

    bool random{false};
    double density{0.0};
    bool has_seed{false};
    uint32_t seed{0};

    std::string pattern;
    int row_offset{0};
    int col_offset{0};
};

// `args` excludes the program name. Throws InvalidParameter.
Parameters parse_parameters(const std::vector<std::string>& args);

const char* usage();
