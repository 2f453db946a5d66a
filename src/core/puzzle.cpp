#include "crossfill/puzzle.hpp"
#include <algorithm>
#include <stdexcept>
#include <sstream>

namespace crossfill {

namespace {

/// cell が slot の何文字目か（含まれなければ std::nullopt）
std::optional<size_t> offset_of(const Slot& slot, const Cell& cell) {
    if (slot.direction == Direction::Across) {
        if (cell.row != slot.row || cell.col < slot.col) return std::nullopt;
        size_t k = cell.col - slot.col;
        return k < slot.length ? std::optional<size_t>(k) : std::nullopt;
    }
    if (cell.col != slot.col || cell.row < slot.row) return std::nullopt;
    size_t k = cell.row - slot.row;
    return k < slot.length ? std::optional<size_t>(k) : std::nullopt;
}

}  // namespace

std::vector<Cell> Slot::cells() const {
    std::vector<Cell> result;
    result.reserve(length);
    for (size_t k = 0; k < length; ++k) {
        result.push_back(cell(k));
    }
    return result;
}

std::string Slot::name() const {
    std::ostringstream oss;
    oss << "(" << row << "," << col << ") "
        << (direction == Direction::Across ? "across" : "down") << " " << length;
    return oss.str();
}

Puzzle::Puzzle(std::vector<Slot> slots, Vocabulary vocabulary)
    : slots_(std::move(slots))
    , vocabulary_(std::move(vocabulary)) {
    for (const auto& s : slots_) {
        if (s.length == 0) {
            throw std::invalid_argument("Slot has zero length: " + s.name());
        }
        Cell last = s.cell(s.length - 1);
        height_ = std::max(height_, last.row + 1);
        width_ = std::max(width_, last.col + 1);
    }
    open_.assign(height_ * width_, false);
    for (const auto& s : slots_) {
        for (size_t k = 0; k < s.length; ++k) {
            Cell c = s.cell(k);
            open_[c.row * width_ + c.col] = true;
        }
    }
    build_overlaps();
}

Puzzle::Puzzle(std::vector<Slot> slots, Vocabulary vocabulary,
               size_t height, size_t width, std::vector<bool> open)
    : slots_(std::move(slots))
    , vocabulary_(std::move(vocabulary))
    , height_(height)
    , width_(width)
    , open_(std::move(open)) {
    build_overlaps();
}

Puzzle Puzzle::from_grid(const std::vector<std::vector<bool>>& open, Vocabulary vocabulary) {
    size_t height = open.size();
    size_t width = 0;
    for (const auto& row : open) {
        width = std::max(width, row.size());
    }

    // 短い行は閉じたマスで埋める
    std::vector<bool> cells(height * width, false);
    for (size_t i = 0; i < height; ++i) {
        for (size_t j = 0; j < open[i].size(); ++j) {
            cells[i * width + j] = open[i][j];
        }
    }
    auto is_open = [&](size_t i, size_t j) {
        return i < height && j < width && cells[i * width + j];
    };

    std::vector<Slot> slots;
    for (size_t i = 0; i < height; ++i) {
        for (size_t j = 0; j < width; ++j) {
            if (!is_open(i, j)) continue;

            // 縦方向の単語の先頭
            if (i == 0 || !is_open(i - 1, j)) {
                size_t length = 1;
                while (is_open(i + length, j)) ++length;
                if (length > 1) {
                    slots.push_back({i, j, Direction::Down, length});
                }
            }

            // 横方向の単語の先頭
            if (j == 0 || !is_open(i, j - 1)) {
                size_t length = 1;
                while (is_open(i, j + length)) ++length;
                if (length > 1) {
                    slots.push_back({i, j, Direction::Across, length});
                }
            }
        }
    }

    return Puzzle(std::move(slots), std::move(vocabulary), height, width, std::move(cells));
}

const Slot& Puzzle::slot(SlotId id) const {
    if (id >= slots_.size()) {
        throw std::out_of_range("Slot ID out of range: " + std::to_string(id));
    }
    return slots_[id];
}

bool Puzzle::is_open(size_t row, size_t col) const {
    if (row >= height_ || col >= width_) return false;
    return open_[row * width_ + col];
}

void Puzzle::build_overlaps() {
    const size_t n = slots_.size();
    overlaps_.assign(n * n, std::nullopt);
    neighbors_.assign(n, {});
    arcs_.clear();

    for (SlotId x = 0; x < n; ++x) {
        for (SlotId y = x + 1; y < n; ++y) {
            std::optional<Overlap> found;
            size_t shared = 0;
            for (size_t k = 0; k < slots_[x].length; ++k) {
                auto ky = offset_of(slots_[y], slots_[x].cell(k));
                if (ky) {
                    ++shared;
                    found = Overlap{k, *ky};
                }
            }
            if (shared > 1) {
                throw std::invalid_argument("Slots share more than one cell: " +
                                            slots_[x].name() + " and " + slots_[y].name());
            }
            if (found) {
                overlaps_[x * n + y] = found;
                overlaps_[y * n + x] = Overlap{found->second, found->first};
                neighbors_[x].push_back(y);
                neighbors_[y].push_back(x);
            }
        }
    }

    // y の昇順に push されているので neighbors_ はソート済み
    for (SlotId x = 0; x < n; ++x) {
        for (SlotId y : neighbors_[x]) {
            arcs_.push_back({x, y});
        }
    }
}

} // namespace crossfill
