#include "crossfill/assignment.hpp"
#include <unordered_set>

namespace crossfill {

Assignment::Assignment(size_t slot_count)
    : words_(slot_count) {}

void Assignment::assign(SlotId slot, WordId word) {
    if (!words_[slot]) {
        assigned_count_++;
    }
    words_[slot] = word;
}

void Assignment::unassign(SlotId slot) {
    if (words_[slot]) {
        assigned_count_--;
        words_[slot].reset();
    }
}

bool Assignment::uses(WordId word, std::optional<SlotId> except) const {
    for (SlotId s = 0; s < words_.size(); ++s) {
        if (except && *except == s) continue;
        if (words_[s] && *words_[s] == word) {
            return true;
        }
    }
    return false;
}

bool AssignmentChecker::consistent(const Assignment& assignment) const {
    const auto& words = puzzle_.vocabulary().words();
    const size_t n = puzzle_.slot_count();

    // 単語の重複
    std::unordered_set<WordId> used;
    for (SlotId s = 0; s < n; ++s) {
        const auto& w = assignment.word(s);
        if (w && !used.insert(*w).second) {
            return false;
        }
    }

    // 重なり位置の文字
    for (SlotId x = 0; x < n; ++x) {
        const auto& wx = assignment.word(x);
        if (!wx) continue;
        for (SlotId y : puzzle_.neighbors(x)) {
            if (y < x) continue;  // 各ペアは1回だけ
            const auto& wy = assignment.word(y);
            if (!wy) continue;
            const auto& overlap = *puzzle_.overlap(x, y);
            const auto& sx = words[*wx];
            const auto& sy = words[*wy];
            if (overlap.first >= sx.size() || overlap.second >= sy.size()) {
                return false;
            }
            if (sx[overlap.first] != sy[overlap.second]) {
                return false;
            }
        }
    }
    return true;
}

bool AssignmentChecker::complete(const Assignment& assignment) const {
    return assignment.size() == puzzle_.slot_count();
}

Solution AssignmentChecker::to_solution(const Assignment& assignment) const {
    Solution sol;
    for (SlotId s = 0; s < puzzle_.slot_count(); ++s) {
        const auto& w = assignment.word(s);
        if (w) {
            sol[puzzle_.slot(s).name()] = puzzle_.vocabulary().word(*w);
        }
    }
    return sol;
}

} // namespace crossfill
