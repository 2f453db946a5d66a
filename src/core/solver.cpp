#include "crossfill/solver.hpp"
#include <algorithm>
#include <array>
#include <unordered_set>
#include <iostream>

namespace crossfill {

std::optional<Assignment> Solver::solve(const Puzzle& puzzle) {
    stats_ = SolverStats{};
    SearchContext ctx(puzzle);

    if (verbose_) {
        std::cerr << "[verbose] solve start: " << puzzle.slot_count() << " slots, "
                  << puzzle.vocabulary().size() << " words, "
                  << puzzle.arcs().size() << " arcs\n";
    }

    // ノード整合: 長さの合わない単語を除去
    ctx.propagator.enforce_node_consistency(ctx.domains);
    for (SlotId s = 0; s < puzzle.slot_count(); ++s) {
        if (ctx.domains.domain(s).empty()) {
            if (verbose_) {
                std::cerr << "[verbose] no word of length " << puzzle.length(s)
                          << " for slot " << puzzle.slot(s).name() << "\n";
            }
            stats_.propagation = ctx.propagator.stats();
            return std::nullopt;  // UNSAT
        }
    }

    // 全アークで AC-3
    if (!ctx.propagator.ac3(ctx.domains)) {
        if (verbose_) std::cerr << "[verbose] initial AC-3 failed\n";
        stats_.propagation = ctx.propagator.stats();
        return std::nullopt;  // UNSAT
    }
    if (verbose_) {
        const auto& ps = ctx.propagator.stats();
        std::cerr << "[verbose] presolve done: removed=" << ps.words_removed
                  << " revisions=" << ps.revise_count << "\n";
    }

    auto res = backtrack(ctx, 0);
    stats_.propagation = ctx.propagator.stats();

    if (verbose_) {
        std::cerr << "[verbose] search "
                  << (res == SearchResult::SAT ? "succeeded" :
                      res == SearchResult::UNSAT ? "exhausted" : "stopped")
                  << ": nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count
                  << " max_depth=" << stats_.max_depth << "\n";
    }

    if (res != SearchResult::SAT) {
        return std::nullopt;
    }
    return std::move(ctx.assignment);
}

SearchResult Solver::backtrack(SearchContext& ctx, size_t depth) {
    if (stopped_) {
        return SearchResult::UNKNOWN;
    }

    stats_.node_count++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    if (ctx.checker.complete(ctx.assignment)) {
        return SearchResult::SAT;
    }

    SlotId slot = select_unassigned_slot(ctx);

    std::vector<WordId> values;
    if (lcv_ordering_) {
        values = order_domain_values(ctx, slot);
    } else {
        for (auto w : ctx.domains.domain(slot).values()) {
            if (!ctx.assignment.uses(w, slot)) {
                values.push_back(w);
            }
        }
    }

    for (auto word : values) {
        stats_.assignment_count++;
        Snapshot snapshot = ctx.domains.snapshot();
        ctx.assignment.assign(slot, word);
        ctx.domains.assign(slot, word);

        // 新しい割当を隣接スロットへ伝播
        bool propagate_ok = true;
        if (maintain_arc_consistency_) {
            propagate_ok = ctx.propagator.ac3(ctx.domains, incoming_arcs(ctx, slot));
            if (!propagate_ok) {
                stats_.propagation_fail_count++;
            }
        }

        if (propagate_ok) {
            if (ctx.checker.consistent(ctx.assignment)) {
                auto res = backtrack(ctx, depth + 1);
                if (res != SearchResult::UNSAT) {
                    return res;  // SAT（最初の解で終了）または停止
                }
            } else {
                stats_.inconsistent_count++;
            }
        }

        ctx.domains.restore(snapshot);
        ctx.assignment.unassign(slot);
    }

    stats_.fail_count++;
    return SearchResult::UNSAT;
}

std::vector<Arc> Solver::incoming_arcs(const SearchContext& ctx, SlotId slot) const {
    std::vector<Arc> arcs;
    for (SlotId z : ctx.puzzle.neighbors(slot)) {
        if (!ctx.assignment.is_assigned(z)) {
            arcs.push_back({z, slot});
        }
    }
    return arcs;
}

SlotId Solver::select_unassigned_slot(const SearchContext& ctx) const {
    const auto& puzzle = ctx.puzzle;
    SlotId best = puzzle.slot_count();
    size_t best_size = 0;
    size_t best_degree = 0;

    for (SlotId s = 0; s < puzzle.slot_count(); ++s) {
        if (ctx.assignment.is_assigned(s)) continue;
        size_t size = ctx.domains.domain(s).size();
        size_t degree = puzzle.degree(s);

        bool better = false;
        if (best == puzzle.slot_count()) {
            better = true;
        } else if (size < best_size) {
            // MRV: 定義域が小さいものを優先
            better = true;
        } else if (size == best_size && degree_tiebreak_ && degree > best_degree) {
            // 同じなら次数が大きいものを優先
            better = true;
        }

        if (better) {
            best = s;
            best_size = size;
            best_degree = degree;
        }
    }
    return best;
}

std::vector<WordId> Solver::order_domain_values(const SearchContext& ctx, SlotId slot) const {
    const auto& puzzle = ctx.puzzle;
    const auto& words = puzzle.vocabulary().words();

    std::unordered_set<WordId> used;
    for (SlotId s = 0; s < puzzle.slot_count(); ++s) {
        if (s != slot && ctx.assignment.word(s)) {
            used.insert(*ctx.assignment.word(s));
        }
    }

    std::vector<WordId> candidates;
    for (auto w : ctx.domains.domain(slot).values()) {
        if (!used.count(w)) {
            candidates.push_back(w);
        }
    }

    // 隣接スロットごとに、重なり位置の文字ごとの単語数を数えておく
    struct NeighborProfile {
        SlotId slot;
        size_t offset;  // slot 側の重なり位置
        size_t domain_size;
        std::array<size_t, 256> letter_count;
    };
    std::vector<NeighborProfile> profiles;
    for (SlotId nb : puzzle.neighbors(slot)) {
        const auto& overlap = *puzzle.overlap(slot, nb);
        NeighborProfile p;
        p.slot = nb;
        p.offset = overlap.first;
        p.domain_size = ctx.domains.domain(nb).size();
        p.letter_count.fill(0);
        for (auto w : ctx.domains.domain(nb)) {
            const auto& word = words[w];
            if (overlap.second < word.size()) {
                p.letter_count[static_cast<unsigned char>(word[overlap.second])]++;
            }
        }
        profiles.push_back(p);
    }

    std::vector<std::pair<size_t, WordId>> costs;
    costs.reserve(candidates.size());
    for (auto w : candidates) {
        const auto& word = words[w];
        size_t cost = 0;
        for (const auto& p : profiles) {
            // 同じ単語は隣接スロットで使えなくなる
            if (ctx.domains.domain(p.slot).contains(w)) {
                cost++;
            }
            size_t compatible = p.offset < word.size()
                ? p.letter_count[static_cast<unsigned char>(word[p.offset])] : 0;
            cost += p.domain_size - compatible;
        }
        costs.push_back({cost, w});
    }

    // 同コストは語彙順（candidates は WordId 昇順）
    std::stable_sort(costs.begin(), costs.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<WordId> result;
    result.reserve(costs.size());
    for (const auto& c : costs) {
        result.push_back(c.second);
    }
    return result;
}

} // namespace crossfill
