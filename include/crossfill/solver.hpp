/**
 * @file solver.hpp
 * @brief 探索エンジン（MRV + 次数による変数選択、LCV による値順序、バックトラック）
 */
#ifndef CROSSFILL_SOLVER_HPP
#define CROSSFILL_SOLVER_HPP

#include "crossfill/puzzle.hpp"
#include "crossfill/domain_store.hpp"
#include "crossfill/propagator.hpp"
#include "crossfill/assignment.hpp"
#include <optional>
#include <vector>
#include <atomic>

namespace crossfill {

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった
    UNSAT,    // この枝に解が存在しない
    UNKNOWN   // 停止された
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;           // backtrack() の呼び出し回数
    size_t assignment_count = 0;     // 試した (スロット, 単語) の数
    size_t fail_count = 0;           // 候補を使い切った回数
    size_t propagation_fail_count = 0;  // 割当後の AC-3 失敗
    size_t inconsistent_count = 0;   // 割当後の整合性チェック失敗
    size_t max_depth = 0;
    PropagationStats propagation;
};

/**
 * @brief 1回の solve の探索状態
 *
 * 定義域と部分割当をまとめて再帰に渡す。solve ごとに作り直し、共有しない。
 */
struct SearchContext {
    const Puzzle& puzzle;
    DomainStore domains;
    Assignment assignment;
    Propagator propagator;
    AssignmentChecker checker;

    explicit SearchContext(const Puzzle& p)
        : puzzle(p)
        , domains(p)
        , assignment(p.slot_count())
        , propagator(p)
        , checker(p) {}
};

/**
 * @brief クロスワード CSP ソルバー
 *
 * - ノード整合 + AC-3 による前処理
 * - MRV（定義域最小）+ 次数最大による変数選択
 * - LCV（隣接スロットの候補を最も減らさない単語から）による値順序
 * - 割当ごとに AC-3 を局所的に再実行（Maintaining Arc Consistency）
 *
 * 最初に見つかった解を返す。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 解を探索
     * @param puzzle 解くパズル
     * @return 完全かつ矛盾の無い割当、解が無ければ（または停止されたら）std::nullopt
     */
    std::optional<Assignment> solve(const Puzzle& puzzle);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief LCV による値順序を有効/無効にする（無効なら語彙順）
     */
    void set_lcv_ordering(bool enabled) { lcv_ordering_ = enabled; }

    /**
     * @brief MRV の同点を次数で崩すかどうか
     */
    void set_degree_tiebreak(bool enabled) { degree_tiebreak_ = enabled; }

    /**
     * @brief 割当ごとの AC-3 を有効/無効にする
     */
    void set_maintain_arc_consistency(bool enabled) { maintain_arc_consistency_ = enabled; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    // ===== ヒューリスティック（テスト用に公開） =====

    /**
     * @brief 次に割り当てるスロットを選択
     *
     * 定義域が最小の未割当スロット。同点なら隣接数が最大のもの、
     * さらに同点ならスロットIDが最小のもの。
     *
     * @pre 未割当スロットが存在すること
     */
    SlotId select_unassigned_slot(const SearchContext& ctx) const;

    /**
     * @brief スロットの候補単語を LCV 順に並べる
     *
     * 他のスロットで使用中の単語は除く。コストは各隣接スロットについて
     * 「重なり位置で衝突する単語数 + 同じ単語が定義域にあれば1」の合計。
     * コスト昇順、同コストは語彙順。
     */
    std::vector<WordId> order_domain_values(const SearchContext& ctx, SlotId slot) const;

private:
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;

    /**
     * @brief 再帰的バックトラック探索
     */
    SearchResult backtrack(SearchContext& ctx, size_t depth);

    /**
     * @brief slot に向かうアーク (z, slot) を未割当の隣接スロット z について列挙
     */
    std::vector<Arc> incoming_arcs(const SearchContext& ctx, SlotId slot) const;

    // 設定
    bool lcv_ordering_ = true;
    bool degree_tiebreak_ = true;
    bool maintain_arc_consistency_ = true;

    // 統計
    SolverStats stats_;
};

} // namespace crossfill

#endif // CROSSFILL_SOLVER_HPP
