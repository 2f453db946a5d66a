#include "crossfill/domain_store.hpp"
#include <stdexcept>
#include <string>
#include <cstdint>

namespace crossfill {

DomainStore::DomainStore(const Puzzle& puzzle)
    : DomainStore(puzzle.slot_count(), puzzle.vocabulary().size()) {}

DomainStore::DomainStore(size_t slot_count, size_t vocabulary_size)
    : domains_(slot_count, Domain(vocabulary_size))
    , last_saved_level_(slot_count, -1) {}

void DomainStore::save_state(SlotId slot) {
    if (last_saved_level_[slot] == level_) {
        return;
    }
    DomainTrailEntry entry;
    entry.slot = slot;
    entry.old_n = domains_[slot].n();
    entry.prev_saved_level = last_saved_level_[slot];
    trail_.push_back({level_, std::move(entry)});
    last_saved_level_[slot] = level_;
}

bool DomainStore::remove_word(SlotId slot, WordId word) {
    if (!domains_[slot].contains(word)) {
        return false;
    }
    save_state(slot);
    return domains_[slot].remove(word);
}

bool DomainStore::assign(SlotId slot, WordId word) {
    auto& domain = domains_[slot];
    if (!domain.contains(word)) {
        return false;
    }
    if (domain.is_singleton()) {
        return true;
    }
    save_state(slot);
    return domain.assign(word);
}

size_t DomainStore::retain_if(SlotId slot, const std::function<bool(WordId)>& pred) {
    auto& domain = domains_[slot];
    size_t removed = 0;
    size_t i = 0;
    while (i < domain.n()) {
        WordId w = domain.dense()[i];
        if (pred(w)) {
            ++i;
            continue;
        }
        if (removed == 0) {
            save_state(slot);
        }
        // swap 先を再チェックするので i は進めない
        domain.remove(w);
        ++removed;
    }
    return removed;
}

void DomainStore::set_domain(SlotId slot, const std::vector<WordId>& words) {
    auto& domain = domains_[slot];
    for (auto w : words) {
        if (w >= domain.capacity()) {
            throw std::out_of_range("WordId out of range: " + std::to_string(w));
        }
    }

    bool narrowing = true;
    for (auto w : words) {
        if (!domain.contains(w)) {
            narrowing = false;
            break;
        }
    }

    if (narrowing) {
        // 現在の定義域の部分集合: 有効範囲内のスワップだけで済む
        save_state(slot);
        size_t k = 0;
        for (auto w : words) {
            size_t idx = domain.index_of(w);
            if (idx == SIZE_MAX || idx < k) continue;  // 重複
            domain.swap_at(idx, k++);
        }
        domain.set_n(k);
        return;
    }

    // 定義域を広げる: 有効範囲外の値を前に出すと古いセーブポイントの
    // [0, old_n) が崩れるので、並びごと保存する
    DomainTrailEntry entry;
    entry.slot = slot;
    entry.old_n = domain.n();
    entry.prev_saved_level = last_saved_level_[slot];
    entry.old_dense = domain.dense();
    trail_.push_back({level_, std::move(entry)});
    last_saved_level_[slot] = level_;

    std::vector<Domain::value_type> dense;
    dense.reserve(domain.capacity());
    std::vector<bool> member(domain.capacity(), false);
    for (auto w : words) {
        if (!member[w]) {
            member[w] = true;
            dense.push_back(w);
        }
    }
    size_t n = dense.size();
    for (auto w : domain.dense()) {
        if (!member[w]) dense.push_back(w);
    }
    domain.restore_dense(std::move(dense), n);
}

Snapshot DomainStore::snapshot() {
    Snapshot s{level_};
    ++level_;
    return s;
}

void DomainStore::restore(const Snapshot& snapshot) {
    while (!trail_.empty() && trail_.back().first > snapshot.level) {
        auto& entry = trail_.back().second;
        auto& domain = domains_[entry.slot];
        if (!entry.old_dense.empty()) {
            domain.restore_dense(std::move(entry.old_dense), entry.old_n);
        } else {
            domain.set_n(entry.old_n);
        }
        last_saved_level_[entry.slot] = entry.prev_saved_level;
        trail_.pop_back();
    }
    // snapshot の内側に留まる（同じハンドルで再度 restore できるように）
    level_ = snapshot.level + 1;
}

} // namespace crossfill
