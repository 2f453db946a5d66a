/**
 * @file options.hpp
 * @brief コマンドライン引数
 */
#ifndef CROSSFILL_GRID_OPTIONS_HPP
#define CROSSFILL_GRID_OPTIONS_HPP

#include <string>

namespace crossfill {
namespace grid {

/**
 * @brief crossfill コマンドの設定
 */
struct Options {
    bool print_stats = false;      // -s
    bool verbose = false;          // -v
    int timeout_sec = 0;           // -t SEC（0 なら無制限）
    bool lcv = true;               // --no-lcv で無効
    bool degree = true;            // --no-degree で無効
    bool arc_consistency = true;   // --no-ac で無効
    bool show_help = false;        // -h / --help
    std::string structure_file;
    std::string words_file;
    std::string output_file;       // 空なら画像を保存しない
};

/**
 * @brief コマンドライン引数をパース
 *
 * -h / --help があればファイル指定は不要。
 *
 * @throws std::invalid_argument 不明なオプション、不正なタイムアウト値、ファイル指定の過不足
 */
Options parse_command_line(int argc, const char* const* argv);

} // namespace grid
} // namespace crossfill

#endif // CROSSFILL_GRID_OPTIONS_HPP
