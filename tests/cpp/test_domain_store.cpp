#include <catch2/catch_test_macros.hpp>
#include "crossfill/vocabulary.hpp"
#include "crossfill/domain.hpp"
#include "crossfill/domain_store.hpp"
#include <stdexcept>

using namespace crossfill;

// ============================================================================
// Vocabulary tests
// ============================================================================

TEST_CASE("Vocabulary sorts and deduplicates", "[vocabulary]") {
    Vocabulary vocab({"TAR", "CAT", "ART", "CAT", "CAR"});

    REQUIRE(vocab.size() == 4);
    REQUIRE(vocab.word(0) == "ART");
    REQUIRE(vocab.word(1) == "CAR");
    REQUIRE(vocab.word(2) == "CAT");
    REQUIRE(vocab.word(3) == "TAR");

    SECTION("lookup") {
        REQUIRE(vocab.id("CAT") == 2);
        REQUIRE(vocab.find("DOG") == std::nullopt);
        REQUIRE_THROWS_AS(vocab.id("DOG"), std::out_of_range);
        REQUIRE_THROWS_AS(vocab.word(4), std::out_of_range);
    }
}

// ============================================================================
// Domain (Sparse Set) tests
// ============================================================================

TEST_CASE("Domain basic operations", "[domain]") {
    Domain d(5);

    SECTION("initial state") {
        REQUIRE(d.size() == 5);
        REQUIRE(!d.empty());
        REQUIRE(d.capacity() == 5);
        REQUIRE(d.values() == std::vector<WordId>{0, 1, 2, 3, 4});
    }

    SECTION("contains") {
        REQUIRE(d.contains(0));
        REQUIRE(d.contains(4));
        REQUIRE(!d.contains(5));
    }

    SECTION("remove") {
        REQUIRE(d.remove(2));
        REQUIRE(d.size() == 4);
        REQUIRE(!d.contains(2));
        REQUIRE(d.contains(1));
        REQUIRE(d.contains(3));
    }

    SECTION("remove non-existent value") {
        REQUIRE(d.remove(2));
        REQUIRE(!d.remove(2));
        REQUIRE(!d.remove(10));
        REQUIRE(d.size() == 4);
    }

    SECTION("remove down to empty") {
        // 空の定義域は伝播失敗として上位で扱うので、最後の1値も削除できる
        for (WordId w = 0; w < 5; ++w) {
            REQUIRE(d.remove(w));
        }
        REQUIRE(d.empty());
    }
}

TEST_CASE("Domain assign", "[domain]") {
    Domain d(5);

    SECTION("assign to existing value") {
        REQUIRE(d.assign(3));
        REQUIRE(d.is_singleton());
        REQUIRE(d.contains(3));
        REQUIRE(!d.contains(1));
    }

    SECTION("assign to removed value") {
        d.remove(3);
        REQUIRE(!d.assign(3));
        REQUIRE(d.size() == 4);  // unchanged
    }
}

TEST_CASE("Domain set_n restores removed values", "[domain]") {
    Domain d(4);
    size_t n = d.n();
    d.remove(0);
    d.remove(3);
    REQUIRE(d.size() == 2);

    d.set_n(n);
    REQUIRE(d.values() == std::vector<WordId>{0, 1, 2, 3});
}

// ============================================================================
// DomainStore tests
// ============================================================================

TEST_CASE("DomainStore initial state", "[domain_store]") {
    DomainStore store(3, 4);

    REQUIRE(store.slot_count() == 3);
    for (SlotId s = 0; s < 3; ++s) {
        REQUIRE(store.domain(s).size() == 4);
    }
}

TEST_CASE("DomainStore mutations", "[domain_store]") {
    DomainStore store(2, 5);

    SECTION("remove_word touches one slot only") {
        REQUIRE(store.remove_word(0, 1));
        REQUIRE(!store.remove_word(0, 1));
        REQUIRE(!store.domain(0).contains(1));
        REQUIRE(store.domain(1).contains(1));
    }

    SECTION("assign") {
        REQUIRE(store.assign(1, 4));
        REQUIRE(store.domain(1).is_singleton());
        REQUIRE(store.domain(1).contains(4));
        REQUIRE(!store.assign(1, 3));
    }

    SECTION("retain_if") {
        size_t removed = store.retain_if(0, [](WordId w) { return w % 2 == 0; });
        REQUIRE(removed == 2);
        REQUIRE(store.domain(0).values() == std::vector<WordId>{0, 2, 4});
    }

    SECTION("set_domain narrowing") {
        store.set_domain(0, {3, 1, 3});
        REQUIRE(store.domain(0).values() == std::vector<WordId>{1, 3});
    }

    SECTION("set_domain widening") {
        store.set_domain(0, {2});
        store.set_domain(0, {0, 2, 4});
        REQUIRE(store.domain(0).values() == std::vector<WordId>{0, 2, 4});
    }

    SECTION("set_domain rejects unknown words") {
        REQUIRE_THROWS_AS(store.set_domain(0, {5}), std::out_of_range);
    }
}

TEST_CASE("DomainStore snapshot/restore", "[domain_store][trail]") {
    DomainStore store(3, 6);
    store.remove_word(2, 5);  // スナップショット前の変更は残る

    auto before = [&store]() {
        std::vector<std::vector<WordId>> state;
        for (SlotId s = 0; s < store.slot_count(); ++s) {
            state.push_back(store.domain(s).values());
        }
        return state;
    };
    auto initial = before();

    SECTION("restore after N mutations") {
        for (size_t n : {0u, 1u, 3u, 10u}) {
            auto snap = store.snapshot();
            for (size_t i = 0; i < n; ++i) {
                store.remove_word(i % 3, i % 6);
                if (i % 4 == 3) {
                    store.assign((i + 1) % 3, 2);
                }
            }
            store.restore(snap);
            REQUIRE(before() == initial);
        }
    }

    SECTION("restore the same snapshot twice") {
        auto snap = store.snapshot();
        store.remove_word(0, 0);
        store.restore(snap);
        REQUIRE(before() == initial);

        store.assign(0, 3);
        store.remove_word(1, 1);
        store.restore(snap);
        REQUIRE(before() == initial);
    }

    SECTION("nested snapshots") {
        auto outer = store.snapshot();
        store.remove_word(0, 0);
        auto middle = before();

        auto inner = store.snapshot();
        store.assign(0, 4);
        store.remove_word(1, 2);
        REQUIRE(store.domain(0).is_singleton());

        store.restore(inner);
        REQUIRE(before() == middle);

        store.restore(outer);
        REQUIRE(before() == initial);
    }

    SECTION("restore undoes widening set_domain") {
        store.set_domain(1, {0, 1});
        auto narrowed = before();

        auto snap = store.snapshot();
        store.remove_word(1, 0);
        store.set_domain(1, {0, 3, 4, 5});
        store.remove_word(1, 4);
        REQUIRE(store.domain(1).values() == std::vector<WordId>{0, 3, 5});

        store.restore(snap);
        REQUIRE(before() == narrowed);
    }

    SECTION("trail is popped on restore") {
        auto snap = store.snapshot();
        size_t trail_before = store.trail_size();
        store.remove_word(0, 0);
        store.remove_word(0, 1);  // 同じレベルで同じスロットは1回だけ記録
        REQUIRE(store.trail_size() == trail_before + 1);
        store.restore(snap);
        REQUIRE(store.trail_size() == trail_before);
    }
}
