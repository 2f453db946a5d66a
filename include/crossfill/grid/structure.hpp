/**
 * @file structure.hpp
 * @brief 盤面構造ファイル・単語ファイルの読み込みと盤面の文字表示
 */
#ifndef CROSSFILL_GRID_STRUCTURE_HPP
#define CROSSFILL_GRID_STRUCTURE_HPP

#include "crossfill/puzzle.hpp"
#include "crossfill/assignment.hpp"
#include <vector>
#include <string>
#include <optional>
#include <istream>
#include <ostream>

namespace crossfill {
namespace grid {

/**
 * @brief 盤面構造（開いたマス / 閉じたマス）
 *
 * 行の長さは揃えてある（短い行は閉じたマスで埋める）。
 */
struct Structure {
    std::vector<std::vector<bool>> cells;

    size_t height() const { return cells.size(); }
    size_t width() const { return cells.empty() ? 0 : cells.front().size(); }
    bool is_open(size_t row, size_t col) const {
        return row < cells.size() && col < cells[row].size() && cells[row][col];
    }
};

/**
 * @brief 盤面構造ファイルをパース
 *
 * 1行が盤面の1行。'_' が開いたマス、それ以外の文字（UTF-8 の多バイト文字は1文字）は閉じたマス。
 *
 * @throws std::runtime_error ファイルが開けない、またはパースエラー時
 */
Structure parse_structure_file(const std::string& filename);

/**
 * @brief 盤面構造文字列をパース
 * @throws std::runtime_error パースエラー時
 */
Structure parse_structure_string(const std::string& input);

/**
 * @brief 単語リストを読み込む
 *
 * 1行1語。前後の空白は除去し、空行は無視し、大文字に変換する。
 *
 * @throws std::runtime_error 英字以外を含む単語があった場合
 */
std::vector<std::string> parse_words(std::istream& in);

/**
 * @brief 単語ファイルを読み込む
 * @throws std::runtime_error ファイルが開けない、または不正な単語があった場合
 */
std::vector<std::string> read_words_file(const std::string& filename);

/**
 * @brief 盤面構造ファイルと単語ファイルからパズルを作成
 */
Puzzle load_puzzle(const std::string& structure_file, const std::string& words_file);

/**
 * @brief 割当を盤面の文字配列にする（未記入のマスは std::nullopt）
 */
std::vector<std::vector<std::optional<char>>> letter_grid(const Puzzle& puzzle,
                                                          const Assignment& assignment);

/**
 * @brief 割当を盤面として出力
 *
 * 閉じたマスは block、開いた未記入のマスは空白。
 */
void print(std::ostream& out, const Puzzle& puzzle, const Assignment& assignment,
           const std::string& block = "█");

/**
 * @brief print() の結果を文字列で返す
 */
std::string render_text(const Puzzle& puzzle, const Assignment& assignment,
                        const std::string& block = "█");

/// 画像出力の1マスのピクセル数
constexpr int kImageCellSize = 100;

/**
 * @brief 割当を画像ファイルに保存
 *
 * 背景は黒、開いたマスは白（枠2ピクセル）で、記入済みのマスには文字を中央に描く。
 * 形式は filename の拡張子で決まる（.png など）。
 *
 * @throws std::runtime_error 盤面が空、または書き込みに失敗した場合
 */
void save_image(const Puzzle& puzzle, const Assignment& assignment, const std::string& filename);

} // namespace grid
} // namespace crossfill

#endif // CROSSFILL_GRID_STRUCTURE_HPP
