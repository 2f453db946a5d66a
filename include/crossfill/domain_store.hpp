/**
 * @file domain_store.hpp
 * @brief スロットごとの定義域と Trail（スナップショット / 復元）
 */
#ifndef CROSSFILL_DOMAIN_STORE_HPP
#define CROSSFILL_DOMAIN_STORE_HPP

#include "crossfill/domain.hpp"
#include "crossfill/puzzle.hpp"
#include <vector>
#include <functional>

namespace crossfill {

/**
 * @brief スナップショットのハンドル
 *
 * DomainStore::snapshot() で取得し、DomainStore::restore() に渡す。
 * 同じハンドルを何度でも restore できる。
 */
struct Snapshot {
    int level = 0;
};

/**
 * @brief 定義域用 Trail エントリ
 *
 * 通常は有効サイズ (old_n) のみ保存する。
 * set_domain で定義域を広げた場合のみ Dense 配列の並びを丸ごと保存する。
 */
struct DomainTrailEntry {
    SlotId slot;
    size_t old_n;
    int prev_saved_level;
    std::vector<Domain::value_type> old_dense;  // 空でなければ並びごと復元
};

/**
 * @brief スロット → 候補単語集合の可変マップ
 *
 * 集中型 Trail で変更を記録し、snapshot()/restore() で巻き戻す。
 * 観測上はディープコピーと同じ: snapshot 後に何を変更しても、
 * restore すれば snapshot 時点と同じ状態に戻る。
 */
class DomainStore {
public:
    /**
     * @brief 全スロットの定義域を語彙全体で初期化
     */
    explicit DomainStore(const Puzzle& puzzle);

    /**
     * @brief 語彙サイズとスロット数から初期化
     */
    DomainStore(size_t slot_count, size_t vocabulary_size);

    size_t slot_count() const { return domains_.size(); }

    /**
     * @brief 定義域を取得
     */
    const Domain& domain(SlotId slot) const { return domains_[slot]; }

    /**
     * @brief 定義域を置き換え
     * @throws std::out_of_range 語彙外の WordId を含む場合
     */
    void set_domain(SlotId slot, const std::vector<WordId>& words);

    /**
     * @brief 単語を削除
     * @return 削除されたらtrue
     */
    bool remove_word(SlotId slot, WordId word);

    /**
     * @brief 単一の単語に固定
     * @return 単語が定義域に含まれていればtrue
     */
    bool assign(SlotId slot, WordId word);

    /**
     * @brief pred を満たす単語だけを残す
     * @return 削除した単語数
     */
    size_t retain_if(SlotId slot, const std::function<bool(WordId)>& pred);

    // ===== Trail 管理 =====

    /**
     * @brief 現在の状態のスナップショットを取る
     */
    Snapshot snapshot();

    /**
     * @brief スナップショット時点の状態に戻す
     */
    void restore(const Snapshot& snapshot);

    /**
     * @brief Trail のサイズを取得
     */
    size_t trail_size() const { return trail_.size(); }

private:
    /**
     * @brief スロットの状態を Trail に保存（同じレベルで保存済みならスキップ）
     */
    void save_state(SlotId slot);

    std::vector<Domain> domains_;
    std::vector<int> last_saved_level_;
    std::vector<std::pair<int, DomainTrailEntry>> trail_;
    int level_ = 0;
};

} // namespace crossfill

#endif // CROSSFILL_DOMAIN_STORE_HPP
