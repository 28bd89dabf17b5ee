#include "maze_grid.hpp"

const char* gridStateName(GridState s) {
    switch (s) {
        case GridState::Closed: return "closed";
        case GridState::Open:   return "open";
        case GridState::Carved: return "carved";
    }
    return "unknown";
}

Cell::Cell(int row, int column, int index) : row_(row), column_(column), index_(index) {}

bool Cell::dirTo(const Cell& other, Dir& out) const {
    for (Dir d : ALL_DIRS) {
        if (nb_[static_cast<size_t>(d)] == other.index_) {
            out = d;
            return true;
        }
    }
    return false;
}

void Cell::link(Cell* other, bool bidirectional) {
    if (!other) return;
    Dir d{};
    if (!dirTo(*other, d)) return;
    links_ = static_cast<uint8_t>(links_ | bit(d));
    if (bidirectional) {
        other->links_ = static_cast<uint8_t>(other->links_ | bit(opposite(d)));
    }
}

void Cell::unlink(Cell* other, bool bidirectional) {
    if (!other) return;
    Dir d{};
    if (!dirTo(*other, d)) return;
    links_ = static_cast<uint8_t>(links_ & ~bit(d));
    if (bidirectional) {
        other->links_ = static_cast<uint8_t>(other->links_ & ~bit(opposite(d)));
    }
}

bool Cell::isLinked(const Cell* other) const {
    if (!other) return false;
    Dir d{};
    if (!dirTo(*other, d)) return false;
    return isLinked(d);
}

int Cell::linkCount() const {
    int n = 0;
    for (Dir d : ALL_DIRS) {
        if (isLinked(d)) ++n;
    }
    return n;
}

Grid::Grid(int rows, int columns, GridState initial)
    : rows_(clampi(rows, 1, MAX_DIM)), columns_(clampi(columns, 1, MAX_DIM)), state_(initial) {
    cells_.reserve(static_cast<size_t>(rows_) * static_cast<size_t>(columns_));
    for (int r = 0; r < rows_; ++r) {
        for (int c = 0; c < columns_; ++c) {
            cells_.emplace_back(r, c, r * columns_ + c);
        }
    }

    auto idx = [&](int r, int c) { return r * columns_ + c; };

    for (Cell& cell : cells_) {
        const int r = cell.row_;
        const int c = cell.column_;
        cell.nb_[static_cast<size_t>(Dir::North)] = (r > 0) ? idx(r - 1, c) : -1;
        cell.nb_[static_cast<size_t>(Dir::South)] = (r < rows_ - 1) ? idx(r + 1, c) : -1;
        cell.nb_[static_cast<size_t>(Dir::East)]  = (c < columns_ - 1) ? idx(r, c + 1) : -1;
        cell.nb_[static_cast<size_t>(Dir::West)]  = (c > 0) ? idx(r, c - 1) : -1;
    }

    if (initial == GridState::Open) {
        for (Cell& cell : cells_) {
            for (Dir d : ALL_DIRS) {
                if (cell.hasNeighbor(d)) cell.links_ = static_cast<uint8_t>(cell.links_ | Cell::bit(d));
            }
        }
    }
}

Grid Grid::closed(int rows, int columns) {
    return Grid(rows, columns, GridState::Closed);
}

Grid Grid::open(int rows, int columns) {
    return Grid(rows, columns, GridState::Open);
}

Cell* Grid::at(int row, int column) {
    if (!inBounds(row, column)) return nullptr;
    return &cells_[static_cast<size_t>(row * columns_ + column)];
}

const Cell* Grid::at(int row, int column) const {
    if (!inBounds(row, column)) return nullptr;
    return &cells_[static_cast<size_t>(row * columns_ + column)];
}

Cell* Grid::neighbor(const Cell& c, Dir d) {
    const int i = c.neighborIndex(d);
    return (i >= 0 && i < size()) ? &cells_[static_cast<size_t>(i)] : nullptr;
}

const Cell* Grid::neighbor(const Cell& c, Dir d) const {
    const int i = c.neighborIndex(d);
    return (i >= 0 && i < size()) ? &cells_[static_cast<size_t>(i)] : nullptr;
}

std::vector<Cell*> Grid::neighbors(const Cell& c) {
    std::vector<Cell*> out;
    out.reserve(DIR_COUNT);
    for (Dir d : ALL_DIRS) {
        if (Cell* n = neighbor(c, d)) out.push_back(n);
    }
    return out;
}

std::vector<const Cell*> Grid::neighbors(const Cell& c) const {
    std::vector<const Cell*> out;
    out.reserve(DIR_COUNT);
    for (Dir d : ALL_DIRS) {
        if (const Cell* n = neighbor(c, d)) out.push_back(n);
    }
    return out;
}

std::vector<const Cell*> Grid::links(const Cell& c) const {
    std::vector<const Cell*> out;
    out.reserve(DIR_COUNT);
    for (Dir d : ALL_DIRS) {
        if (!c.isLinked(d)) continue;
        if (const Cell* n = neighbor(c, d)) out.push_back(n);
    }
    return out;
}

std::vector<Cell*> Grid::deadEnds() {
    std::vector<Cell*> out;
    for (Cell& c : cells_) {
        if (c.linkCount() == 1) out.push_back(&c);
    }
    return out;
}

std::vector<const Cell*> Grid::deadEnds() const {
    std::vector<const Cell*> out;
    for (const Cell& c : cells_) {
        if (c.linkCount() == 1) out.push_back(&c);
    }
    return out;
}

Cell& Grid::randomCell(RNG& rng) {
    return cells_[static_cast<size_t>(rng.range(0, size() - 1))];
}
