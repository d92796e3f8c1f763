// test_frecency.cpp - Scoring, decay and eviction of visited directories

#include "test_framework.hpp"
#include "../src/cpp/frecency.hpp"

static const double DAY = 24 * 3600;
static const double NOW = 1700000000.0;

TEST(decay_multiplies_every_score) {
    std::map<std::string, double> scores = {{"/a", 2.0}, {"/b", 0.5}};
    auto decayed = decay(scores, 0.99);

    ASSERT_EQ(decayed.size(), 2u);
    ASSERT_NEAR(decayed["/a"], 1.98, 1e-12);
    ASSERT_NEAR(decayed["/b"], 0.495, 1e-12);
    // Input untouched
    ASSERT_NEAR(scores["/a"], 2.0, 1e-12);
}

TEST(decay_of_empty_map_is_empty) {
    ASSERT_TRUE(decay({}, 0.99).empty());
}

TEST(first_visit_counts_one) {
    Database db;
    record_visit(db, "/home/user", NOW);

    ASSERT_NEAR(db.frequency["/home/user"], 1.0, 1e-12);
    ASSERT_NEAR(db.last_visit["/home/user"], NOW, 1e-9);
}

TEST(two_visits_yield_one_point_nine_nine) {
    Database db;
    record_visit(db, "/d", NOW);
    record_visit(db, "/d", NOW + 10);

    ASSERT_NEAR(db.frequency["/d"], 1.99, 1e-12);
    ASSERT_NEAR(db.last_visit["/d"], NOW + 10, 1e-9);
}

TEST(visits_decay_other_directories) {
    Database db;
    record_visit(db, "/a", NOW);
    record_visit(db, "/b", NOW + 1);
    record_visit(db, "/b", NOW + 2);

    ASSERT_NEAR(db.frequency["/a"], 0.99 * 0.99, 1e-12);
    ASSERT_NEAR(db.frequency["/b"], 1.99, 1e-12);
    ASSERT_NEAR(db.last_visit["/a"], NOW, 1e-9);
}

TEST(custom_discount_factor) {
    FrecencyPolicy policy;
    policy.discount_factor = 0.5;

    Database db;
    record_visit(db, "/d", NOW, policy);
    record_visit(db, "/d", NOW, policy);
    record_visit(db, "/d", NOW, policy);

    ASSERT_NEAR(db.frequency["/d"], 1.75, 1e-12);
}

TEST(frequency_never_negative) {
    Database db;
    for (int i = 0; i < 500; ++i) {
        record_visit(db, i % 2 ? "/odd" : "/even", NOW + i);
    }
    for (const auto& entry : db.frequency) {
        ASSERT_TRUE(entry.second >= 0.0);
    }
}

TEST(evict_removes_entries_older_than_max_age) {
    Database db;
    db.frequency = {{"/old", 4.0}, {"/fresh", 1.0}};
    db.last_visit = {{"/old", NOW - 31 * DAY}, {"/fresh", NOW - DAY}};

    size_t removed = evict_stale(db, NOW, FrecencyPolicy::DEFAULT_MAX_AGE_SECONDS);

    ASSERT_EQ(removed, 1u);
    ASSERT_EQ(db.frequency.count("/old"), 0u);
    ASSERT_EQ(db.last_visit.count("/old"), 0u);
    ASSERT_EQ(db.frequency.count("/fresh"), 1u);
}

TEST(evict_keeps_entry_exactly_at_max_age) {
    Database db;
    db.frequency = {{"/edge", 1.0}};
    db.last_visit = {{"/edge", NOW - 2592000.0}};

    ASSERT_EQ(evict_stale(db, NOW, 2592000.0), 0u);
    ASSERT_EQ(db.frequency.count("/edge"), 1u);
}

TEST(evict_on_empty_database_is_noop) {
    Database db;
    ASSERT_EQ(evict_stale(db, NOW, 2592000.0), 0u);
    ASSERT_TRUE(db.empty());
}

TEST(evict_leaves_marks_and_ignores_alone) {
    Database db;
    db.marks = {{"proj", "/old"}};
    db.ignored = {"/tmp"};
    db.frequency = {{"/old", 1.0}};
    db.last_visit = {{"/old", NOW - 90 * DAY}};

    evict_stale(db, NOW, 30 * DAY);

    ASSERT_EQ(db.marks.size(), 1u);
    ASSERT_EQ(db.marks["proj"], std::string("/old"));
    ASSERT_EQ(db.ignored.count("/tmp"), 1u);
    ASSERT_TRUE(db.frequency.empty());
}

TEST(visit_prunes_stale_entries_immediately) {
    Database db;
    db.frequency = {{"/stale", 10.0}};
    db.last_visit = {{"/stale", NOW - 2592001.0}};

    visit(db, "/new", NOW);

    ASSERT_EQ(db.frequency.count("/stale"), 0u);
    ASSERT_EQ(db.last_visit.count("/stale"), 0u);
    ASSERT_EQ(db.frequency.count("/new"), 1u);
}

TEST(ranking_by_frequency_and_recency) {
    Database db;
    db.frequency = {{"/a", 5.0}, {"/b", 2.0}, {"/c", 7.0}};
    db.last_visit = {{"/a", NOW - 50}, {"/b", NOW}, {"/c", NOW - 100}};

    auto by_frequency = ranked_by_frequency(db);
    auto by_recency = ranked_by_recency(db);

    ASSERT_EQ(by_frequency, (std::vector<std::string>{"/c", "/a", "/b"}));
    ASSERT_EQ(by_recency, (std::vector<std::string>{"/b", "/a", "/c"}));
}

TEST(ranking_ties_keep_path_order) {
    Database db;
    db.frequency = {{"/z", 1.0}, {"/a", 1.0}, {"/m", 1.0}};

    ASSERT_EQ(ranked_by_frequency(db), (std::vector<std::string>{"/a", "/m", "/z"}));
}

int main() {
    return run_all_tests();
}
