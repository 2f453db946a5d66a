#include "crossfill/grid/structure.hpp"
#include <sstream>
#include <stdexcept>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

namespace crossfill {
namespace grid {

std::vector<std::vector<std::optional<char>>> letter_grid(const Puzzle& puzzle,
                                                          const Assignment& assignment) {
    std::vector<std::vector<std::optional<char>>> letters(
        puzzle.height(), std::vector<std::optional<char>>(puzzle.width()));

    const auto& vocabulary = puzzle.vocabulary();
    for (SlotId s = 0; s < puzzle.slot_count(); ++s) {
        const auto& w = assignment.word(s);
        if (!w) continue;
        const auto& slot = puzzle.slot(s);
        const auto& word = vocabulary.word(*w);
        for (size_t k = 0; k < word.size() && k < slot.length; ++k) {
            Cell c = slot.cell(k);
            letters[c.row][c.col] = word[k];
        }
    }
    return letters;
}

void print(std::ostream& out, const Puzzle& puzzle, const Assignment& assignment,
           const std::string& block) {
    auto letters = letter_grid(puzzle, assignment);
    for (size_t i = 0; i < puzzle.height(); ++i) {
        for (size_t j = 0; j < puzzle.width(); ++j) {
            if (!puzzle.is_open(i, j)) {
                out << block;
            } else if (letters[i][j]) {
                out << *letters[i][j];
            } else {
                out << ' ';
            }
        }
        out << '\n';
    }
}

std::string render_text(const Puzzle& puzzle, const Assignment& assignment,
                        const std::string& block) {
    std::ostringstream oss;
    print(oss, puzzle, assignment, block);
    return oss.str();
}

void save_image(const Puzzle& puzzle, const Assignment& assignment, const std::string& filename) {
    if (puzzle.height() == 0 || puzzle.width() == 0) {
        throw std::runtime_error("Cannot save an empty grid: " + filename);
    }

    const int cell_border = 2;
    const int interior_size = kImageCellSize - 2 * cell_border;
    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const double font_scale = 2.5;
    const int thickness = 5;

    auto letters = letter_grid(puzzle, assignment);
    cv::Mat img(static_cast<int>(puzzle.height()) * kImageCellSize,
                static_cast<int>(puzzle.width()) * kImageCellSize,
                CV_8UC3, cv::Scalar(0, 0, 0));

    for (size_t i = 0; i < puzzle.height(); ++i) {
        for (size_t j = 0; j < puzzle.width(); ++j) {
            if (!puzzle.is_open(i, j)) continue;

            int x0 = static_cast<int>(j) * kImageCellSize + cell_border;
            int y0 = static_cast<int>(i) * kImageCellSize + cell_border;
            cv::rectangle(img, cv::Rect(x0, y0, interior_size, interior_size),
                          cv::Scalar(255, 255, 255), cv::FILLED);

            if (!letters[i][j]) continue;
            std::string text(1, *letters[i][j]);
            int baseline = 0;
            cv::Size size = cv::getTextSize(text, font, font_scale, thickness, &baseline);
            cv::Point org(x0 + (interior_size - size.width) / 2,
                          y0 + (interior_size + size.height) / 2);
            cv::putText(img, text, org, font, font_scale, cv::Scalar(0, 0, 0), thickness, cv::LINE_AA);
        }
    }

    bool written = false;
    try {
        written = cv::imwrite(filename, img);
    } catch (const cv::Exception& e) {
        // 未対応の拡張子など
        throw std::runtime_error("Cannot write image " + filename + ": " + e.what());
    }
    if (!written) {
        throw std::runtime_error("Cannot write image: " + filename);
    }
}

} // namespace grid
} // namespace crossfill
