#include "grid.hpp"
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <algorithm>

namespace {

// B3/S23
const uint8_t BIRTH_COUNT   = 3;
const uint8_t SURVIVE_COUNT = 2;

}

Grid::Grid(int r, int c)
{
    if (r <= 0 || c <= 0)
        throw InvalidDimension("Grid dimensions must be positive, got " +
                               std::to_string(r) + " x " + std::to_string(c));

    rows = static_cast<std::size_t>(r);
    cols = static_cast<std::size_t>(c);

    data   = CellMatrix::Zero(r, c);
    counts = CellMatrix::Zero(r, c);
    next   = CellMatrix::Zero(r, c);
}

void Grid::checkDensity(double density)
{
    // NaN fails both comparisons
    if (!(density >= 0.0 && density <= 1.0))
        throw InvalidParameter("density must lie in [0, 1], got " +
                               std::to_string(density));
}

void Grid::checkCell(int i, int j) const
{
    if (i < 0 || j < 0 || i >= int(rows) || j >= int(cols))
        throw std::out_of_range("cell (" + std::to_string(i) + ", " +
                                std::to_string(j) + ") is outside the grid");
}

void Grid::randomize(double density, uint32_t seed)
{
    std::mt19937 rng(seed);
    randomize(density, rng);
}

void Grid::populate(const std::vector<Coord>& coords)
{
    for (const auto& rc : coords)
    {
        const int i = rc.first;
        const int j = rc.second;
        if (i >= 0 && j >= 0 && i < int(rows) && j < int(cols))
            data(i, j) = STATE_ALIVE;
    }

    generation = 0;
}

void Grid::clear()
{
    data.setZero();
    generation = 0;
}

void Grid::step()
{
    const Eigen::Index R = data.rows();
    const Eigen::Index C = data.cols();

    // Sum the eight shifted copies of the board over the region where each
    // shift overlaps it, so off-grid neighbours are never read.
    counts.setZero();
    for (int di = -1; di <= 1; ++di)
    for (int dj = -1; dj <= 1; ++dj)
    {
        if (di == 0 && dj == 0) continue;

        const Eigen::Index h = R - std::abs(di);
        const Eigen::Index w = C - std::abs(dj);
        if (h <= 0 || w <= 0) continue;

        const Eigen::Index ti = std::max(0, -di);
        const Eigen::Index tj = std::max(0, -dj);
        const Eigen::Index si = std::max(0, di);
        const Eigen::Index sj = std::max(0, dj);

        counts.block(ti, tj, h, w) += data.block(si, sj, h, w);
    }

    next = ((counts.array() == BIRTH_COUNT) ||
            ((data.array() == uint8_t(STATE_ALIVE)) &&
             (counts.array() == SURVIVE_COUNT)))
               .cast<uint8_t>()
               .matrix();

    data.swap(next);
    ++generation;
}

void Grid::stepN(int n)
{
    if (n < 0)
        throw InvalidParameter("step count must be non-negative, got " +
                               std::to_string(n));

    for (int t = 0; t < n; ++t)
        step();
}

bool Grid::isAlive(int i, int j) const
{
    checkCell(i, j);
    return data(i, j) == STATE_ALIVE;
}

int Grid::liveNeighbors(int i, int j) const
{
    checkCell(i, j);

    int count = 0;
    for (int di = -1; di <= 1; ++di)
    for (int dj = -1; dj <= 1; ++dj)
    {
        if (di == 0 && dj == 0) continue;
        const int ni = i + di;
        const int nj = j + dj;
        if (ni >= 0 && nj >= 0 &&
            ni < int(rows) && nj < int(cols))
        {
            count += data(ni, nj);
        }
    }
    return count;
}

std::size_t Grid::population() const
{
    return static_cast<std::size_t>((data.array() == uint8_t(STATE_ALIVE)).count());
}

Snapshot Grid::snapshot() const
{
    Snapshot s;
    s.rows = rows;
    s.cols = cols;
    s.generation = generation;
    s.cells = data;
    return s;
}
