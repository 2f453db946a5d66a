/**
 * @file puzzle.hpp
 * @brief パズルモデル（スロット、重なり、隣接関係）
 */
#ifndef CROSSFILL_PUZZLE_HPP
#define CROSSFILL_PUZZLE_HPP

#include "crossfill/vocabulary.hpp"
#include <vector>
#include <string>
#include <optional>
#include <utility>
#include <cstddef>

namespace crossfill {

/**
 * @brief スロットID（Puzzle 内のインデックス）
 */
using SlotId = size_t;

/**
 * @brief スロットの向き
 */
enum class Direction {
    Across,  // 横
    Down     // 縦
};

/**
 * @brief 盤面上のマス (row, col)
 */
struct Cell {
    size_t row;
    size_t col;

    bool operator==(const Cell& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

/**
 * @brief 単語を入れるマスの連なり（CSP変数）
 */
struct Slot {
    size_t row;
    size_t col;
    Direction direction;
    size_t length;

    /**
     * @brief k 文字目のマス
     */
    Cell cell(size_t k) const {
        return direction == Direction::Down ? Cell{row + k, col} : Cell{row, col + k};
    }

    /**
     * @brief スロットが覆うマスの列
     */
    std::vector<Cell> cells() const;

    /**
     * @brief 表示用の名前（例: "(0,1) down 5"）
     */
    std::string name() const;

    bool operator==(const Slot& other) const {
        return row == other.row && col == other.col &&
               direction == other.direction && length == other.length;
    }
};

/**
 * @brief 重なり制約: first 文字目と second 文字目が一致すること
 */
using Overlap = std::pair<size_t, size_t>;

/**
 * @brief 有向アーク (x, y)
 */
struct Arc {
    SlotId x;
    SlotId y;

    bool operator==(const Arc& other) const {
        return x == other.x && y == other.y;
    }
};

/**
 * @brief パズルモデル
 *
 * 構築後は不変。スロット間の重なりは構築時に幾何情報から一度だけ計算する。
 */
class Puzzle {
public:
    /**
     * @brief スロットリストからパズルを作成
     *
     * 盤面サイズはスロットの範囲から求め、スロットが覆うマスを開いたマスとする。
     *
     * @throws std::invalid_argument 長さ0のスロット、
     *         または2マス以上を共有するスロット対がある場合
     */
    Puzzle(std::vector<Slot> slots, Vocabulary vocabulary);

    /**
     * @brief 開閉マスの盤面からパズルを作成
     *
     * 長さ2以上の開いたマスの極大な連なりをスロットとする。
     * 行優先で走査し、同じマスから始まる場合は Down を Across より先に並べる。
     *
     * @param open open[row][col] が true なら開いたマス（行の長さは不揃いでもよい）
     * @param vocabulary 語彙
     */
    static Puzzle from_grid(const std::vector<std::vector<bool>>& open, Vocabulary vocabulary);

    // ===== スロット =====

    size_t slot_count() const { return slots_.size(); }
    const std::vector<Slot>& slots() const { return slots_; }

    /**
     * @throws std::out_of_range id が範囲外
     */
    const Slot& slot(SlotId id) const;

    size_t length(SlotId id) const { return slots_[id].length; }

    // ===== 重なり・隣接 =====

    /**
     * @brief (x, y) の重なり（無ければ std::nullopt）
     */
    const std::optional<Overlap>& overlap(SlotId x, SlotId y) const {
        return overlaps_[x * slots_.size() + y];
    }

    /**
     * @brief x の隣接スロット（昇順）
     */
    const std::vector<SlotId>& neighbors(SlotId x) const { return neighbors_[x]; }

    /**
     * @brief 隣接スロット数（次数）
     */
    size_t degree(SlotId x) const { return neighbors_[x].size(); }

    /**
     * @brief 重なりを持つ全ての有向アーク（スロット順）
     */
    const std::vector<Arc>& arcs() const { return arcs_; }

    // ===== 語彙・盤面 =====

    const Vocabulary& vocabulary() const { return vocabulary_; }

    size_t height() const { return height_; }
    size_t width() const { return width_; }

    /**
     * @brief マスが開いているか（盤面外は false）
     */
    bool is_open(size_t row, size_t col) const;

private:
    Puzzle(std::vector<Slot> slots, Vocabulary vocabulary,
           size_t height, size_t width, std::vector<bool> open);

    void build_overlaps();

    std::vector<Slot> slots_;
    Vocabulary vocabulary_;
    size_t height_ = 0;
    size_t width_ = 0;
    std::vector<bool> open_;  // open_[row * width_ + col]

    std::vector<std::optional<Overlap>> overlaps_;  // overlaps_[x * n + y]
    std::vector<std::vector<SlotId>> neighbors_;
    std::vector<Arc> arcs_;
};

} // namespace crossfill

#endif // CROSSFILL_PUZZLE_HPP
