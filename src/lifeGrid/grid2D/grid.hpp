#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---- Errors ---- //
class InvalidDimension : public std::invalid_argument {
public:
    explicit InvalidDimension(const std::string& what)
        : std::invalid_argument(what) {}
};

class InvalidParameter : public std::invalid_argument {
public:
    explicit InvalidParameter(const std::string& what)
        : std::invalid_argument(what) {}
};

// ---- Cell States ---- //
enum CellState : uint8_t {
    STATE_DEAD  = 0,
    STATE_ALIVE = 1
};

// row-major, one byte per cell
using CellMatrix =
    Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// (row, col); signed so callers may pass off-grid pattern cells
using Coord = std::pair<int, int>;

// ---- Snapshot ---- //
// Value copy of the grid at one generation. Owns its cells.
struct Snapshot {
    std::size_t rows{0};
    std::size_t cols{0};
    std::size_t generation{0};
    CellMatrix cells;

    bool alive(std::size_t i, std::size_t j) const {
        return cells(Eigen::Index(i), Eigen::Index(j)) == STATE_ALIVE;
    }
};

// ---- Grid ---- //
// Bounded Game of Life board (B3/S23, no wraparound).
class Grid {
private:
    std::size_t rows{0}, cols{0};
    std::size_t generation{0};

    CellMatrix data;
    // scratch buffers reused by every step()
    CellMatrix counts;
    CellMatrix next;

    static void checkDensity(double density);
    void checkCell(int i, int j) const;

public:
    Grid(int rows, int cols);

    // Each cell becomes alive with probability `density`, drawn from `gen`
    // in row-major order. Resets the generation counter.
    template <typename URBG>
    void randomize(double density, URBG& gen)
    {
        checkDensity(density);

        std::uniform_real_distribution<double> dist{0.0, 1.0};
        for (std::size_t i = 0; i < rows; ++i)
            for (std::size_t j = 0; j < cols; ++j)
                data(Eigen::Index(i), Eigen::Index(j)) =
                    dist(gen) < density ? STATE_ALIVE : STATE_DEAD;

        generation = 0;
    }

    // Seeds a std::mt19937 with `seed`.
    void randomize(double density, uint32_t seed);

    // Additive: sets listed cells alive, ignores cells outside the grid.
    void populate(const std::vector<Coord>& coords);

    void clear();

    void step();
    void stepN(int n);

    // ---- Accessors ---- //
    std::size_t getRows() const noexcept { return rows; }
    std::size_t getCols() const noexcept { return cols; }
    std::size_t getGeneration() const noexcept { return generation; }

    bool isAlive(int i, int j) const;
    int liveNeighbors(int i, int j) const;
    std::size_t population() const;

    Snapshot snapshot() const;
};
