#include "crossfill/propagator.hpp"
#include <bitset>
#include <deque>

namespace crossfill {

Propagator::Propagator(const Puzzle& puzzle)
    : puzzle_(puzzle)
    , in_queue_(puzzle.slot_count() * puzzle.slot_count(), 0) {}

void Propagator::enforce_node_consistency(DomainStore& domains) {
    const auto& vocabulary = puzzle_.vocabulary();
    for (SlotId s = 0; s < puzzle_.slot_count(); ++s) {
        size_t length = puzzle_.length(s);
        stats_.words_removed += domains.retain_if(s, [&vocabulary, length](WordId w) {
            return vocabulary.word(w).size() == length;
        });
    }
}

bool Propagator::revise(DomainStore& domains, SlotId x, SlotId y) {
    stats_.revise_count++;
    const auto& overlap = puzzle_.overlap(x, y);
    if (!overlap) {
        return false;
    }
    const size_t ox = overlap->first;
    const size_t oy = overlap->second;
    const auto& words = puzzle_.vocabulary().words();

    // domain(y) が重なり位置に持つ文字の集合
    std::bitset<256> support;
    for (auto wy : domains.domain(y)) {
        const auto& word = words[wy];
        if (oy < word.size()) {
            support.set(static_cast<unsigned char>(word[oy]));
        }
    }

    // 重なり位置に文字が無い（短すぎる）単語も支持されないので削除
    size_t removed = domains.retain_if(x, [&words, &support, ox](WordId wx) {
        const auto& word = words[wx];
        return ox < word.size() && support.test(static_cast<unsigned char>(word[ox]));
    });
    stats_.words_removed += removed;
    return removed > 0;
}

bool Propagator::ac3(DomainStore& domains) {
    return ac3(domains, puzzle_.arcs());
}

bool Propagator::ac3(DomainStore& domains, const std::vector<Arc>& arcs) {
    const size_t n = puzzle_.slot_count();
    std::deque<Arc> queue;

    auto enqueue = [&](const Arc& arc) {
        char& flag = in_queue_[arc.x * n + arc.y];
        if (!flag) {
            flag = 1;
            queue.push_back(arc);
        }
    };
    auto clear_queue = [&]() {
        for (const auto& arc : queue) {
            in_queue_[arc.x * n + arc.y] = 0;
        }
        queue.clear();
    };

    for (const auto& arc : arcs) {
        enqueue(arc);
    }

    while (!queue.empty()) {
        Arc arc = queue.front();
        queue.pop_front();
        in_queue_[arc.x * n + arc.y] = 0;
        stats_.arcs_processed++;

        if (!revise(domains, arc.x, arc.y)) {
            continue;
        }
        if (domains.domain(arc.x).empty()) {
            stats_.failures++;
            clear_queue();
            return false;
        }
        // domain(x) が縮んだので x に向かうアークを再検査
        for (SlotId z : puzzle_.neighbors(arc.x)) {
            if (z != arc.y) {
                enqueue({z, arc.x});
            }
        }
    }

    return true;
}

} // namespace crossfill
