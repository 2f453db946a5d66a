#include "crossfill/grid/structure.hpp"
#include <fstream>
#include <stdexcept>
#include <cctype>

namespace crossfill {
namespace grid {

std::vector<std::string> parse_words(std::istream& in) {
    std::vector<std::string> words;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;

        // 前後の空白（\r を含む）を除去
        const char* ws = " \t\r\n\v\f";
        size_t first = line.find_first_not_of(ws);
        if (first == std::string::npos) {
            continue;  // 空行
        }
        size_t last = line.find_last_not_of(ws);
        std::string word = line.substr(first, last - first + 1);

        for (auto& ch : word) {
            auto c = static_cast<unsigned char>(ch);
            if (!std::isalpha(c)) {
                throw std::runtime_error("Invalid word at line " + std::to_string(line_no) +
                                         ": " + word);
            }
            ch = static_cast<char>(std::toupper(c));
        }
        words.push_back(std::move(word));
    }

    return words;
}

std::vector<std::string> read_words_file(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    try {
        return parse_words(in);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(filename + ": " + e.what());
    }
}

Puzzle load_puzzle(const std::string& structure_file, const std::string& words_file) {
    auto structure = parse_structure_file(structure_file);
    Vocabulary vocabulary(read_words_file(words_file));
    return Puzzle::from_grid(structure.cells, std::move(vocabulary));
}

} // namespace grid
} // namespace crossfill
