#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <set>
#include <thread>
#include <unordered_set>
#include <string>
#include <vector>

#include "checkpoint.hpp"
#include "file_util.hpp"
#include "test_helpers.hpp"

using namespace prefixcrawl;
using namespace test_utils;

static CheckpointRecord sample_record() {
    CheckpointRecord r;
    r.discovered_names = {"ab", "abc", "b\"q"};
    r.explored_prefixes = {"a", "ab"};
    r.request_count = 42;
    r.timestamp = 1700000000.5;
    r.prefix_length_stats[1] = {3, 4};
    r.prefix_length_stats[2] = {0, 7};
    return r;
}

TEST(CheckpointCodecTest, DecodeRestoresEveryField) {
    CheckpointRecord in = sample_record();
    CheckpointRecord out;
    ASSERT_EQ(decode_checkpoint(encode_checkpoint(in), out), "");

    EXPECT_EQ(out.discovered_names, in.discovered_names);
    EXPECT_EQ(out.explored_prefixes, in.explored_prefixes);
    EXPECT_EQ(out.request_count, 42u);
    EXPECT_DOUBLE_EQ(out.timestamp, 1700000000.5);
    ASSERT_EQ(out.prefix_length_stats.size(), 2u);
    EXPECT_EQ(out.prefix_length_stats[1].success, 3u);
    EXPECT_EQ(out.prefix_length_stats[1].queries, 4u);
    EXPECT_EQ(out.prefix_length_stats[2].queries, 7u);
}

TEST(CheckpointCodecTest, StatsKeysAreStrings) {
    const std::string text = encode_checkpoint(sample_record());
    EXPECT_NE(text.find("\"prefix_length_stats\": {\"1\": {\"success\": 3, \"queries\": 4}"), std::string::npos);
}

TEST(CheckpointCodecTest, MissingOptionalFieldsDefault) {
    CheckpointRecord out;
    ASSERT_EQ(decode_checkpoint(R"({"discovered_names": ["x"], "explored_prefixes": []})", out), "");
    EXPECT_EQ(out.discovered_names.size(), 1u);
    EXPECT_EQ(out.request_count, 0u);
    EXPECT_TRUE(out.prefix_length_stats.empty());
}

TEST(CheckpointCodecTest, RejectsWrongShapes) {
    CheckpointRecord out;
    EXPECT_NE(decode_checkpoint("[]", out), "");
    EXPECT_NE(decode_checkpoint("{\"discovered_names\": \"abc\"}", out), "");
    EXPECT_NE(decode_checkpoint("{\"explored_prefixes\": [1]}", out), "");
    EXPECT_NE(decode_checkpoint("{\"prefix_length_stats\": {\"one\": {}}}", out), "");
    EXPECT_NE(decode_checkpoint("{\"discovered_names\": [", out), "");
}

TEST(ReconstructFrontierTest, QueuesUnexploredExtensions) {
    Charset cs("abc", "");
    auto children = reconstruct_frontier({"a", "ab"}, cs);

    // "a" -> aa, ac (ab is explored); "ab" -> aba, abb, abc.
    ASSERT_EQ(children.size(), 5u);
    std::set<std::string> prefixes;
    for (const auto& c : children) prefixes.insert(c.prefix);
    EXPECT_EQ(prefixes, (std::set<std::string>{"aa", "ac", "aba", "abb", "abc"}));

    EXPECT_EQ(children[0].prefix, "aa");
    EXPECT_EQ(children[0].priority, 2);
    EXPECT_EQ(children.back().priority, 3);
}

TEST(ReconstructFrontierTest, CountMatchesExploredTimesCharsetMinusExplored) {
    Charset cs = Charset::standard(true);
    std::vector<std::string> explored{"a", "b", "ab", "ab-", "zz"};
    auto children = reconstruct_frontier(explored, cs);

    // Extensions of explored prefixes that are explored themselves: ab (of a), ab- (of ab).
    EXPECT_EQ(children.size(), explored.size() * cs.size() - 2);
    EXPECT_TRUE(reconstruct_frontier({}, cs).empty());
}

TEST(CheckpointStateTest, SnapshotAndApply) {
    CrawlState src;
    src.names.insert_all({"bob", "alice"});
    src.explored.insert("b");
    src.requests.reset(9);
    src.stats.record(1, true);

    CheckpointRecord r = snapshot_state(src);
    EXPECT_EQ(r.discovered_names, (std::vector<std::string>{"alice", "bob"}));
    EXPECT_EQ(r.request_count, 9u);
    EXPECT_GT(r.timestamp, 0.0);

    CrawlState dst;
    dst.names.insert("carol");
    apply_checkpoint(r, dst);
    EXPECT_EQ(dst.names.size(), 3u);
    EXPECT_TRUE(dst.explored.contains("b"));
    EXPECT_EQ(dst.requests.value(), 9u);
    EXPECT_EQ(dst.stats.snapshot()[1].queries, 1u);
}

TEST(CheckpointStateTest, SnapshotNeverHasExploredPrefixWithoutItsNames) {
    CrawlState state;
    std::atomic<bool> done{false};

    // Same order as a worker: the page's names first, then the prefix.
    std::thread writer([&] {
        for (int i = 0; i < 20000; i++) {
            const std::string p = "p" + std::to_string(i);
            state.names.insert(p);
            state.explored.insert(p);
        }
        done.store(true);
    });

    size_t snapshots = 0;
    std::string orphan;
    while ((!done.load() || snapshots == 0) && orphan.empty()) {
        CheckpointRecord r = snapshot_state(state);
        const std::unordered_set<std::string> names(r.discovered_names.begin(), r.discovered_names.end());
        for (const auto& p : r.explored_prefixes) {
            if (!names.count(p)) {
                orphan = p;
                break;
            }
        }
        snapshots++;
    }
    writer.join();
    EXPECT_EQ(orphan, "") << "explored prefix stored without its name";
}

namespace {

struct CheckpointManagerFixture : public ::testing::Test {
    CapturedLog cl;
    TempDir dir;
    CrawlState state;

    void fill() {
        state.names.insert_all({"ann", "anna"});
        state.explored.insert_all({"a", "an"});
        state.requests.reset(17);
        state.stats.record(2, true);
    }
};

}  // namespace

TEST_F(CheckpointManagerFixture, SaveThenLoad) {
    fill();
    CheckpointManager m(dir.file("ckpt.json"), 200, 300.0, state, cl.log);
    ASSERT_EQ(m.save(), "");
    EXPECT_EQ(m.saves(), 1u);
    EXPECT_FALSE(file_exists(dir.file("ckpt.json.tmp")));

    CheckpointRecord r;
    bool found = false;
    ASSERT_EQ(m.load(r, found), "");
    ASSERT_TRUE(found);
    EXPECT_EQ(r.discovered_names, (std::vector<std::string>{"ann", "anna"}));
    EXPECT_EQ(r.explored_prefixes, (std::vector<std::string>{"a", "an"}));
    EXPECT_EQ(r.request_count, 17u);
}

TEST_F(CheckpointManagerFixture, GzipPathIsCompressed) {
    fill();
    const std::string path = dir.file("ckpt.json.gz");
    CheckpointManager m(path, 200, 300.0, state, cl.log);
    ASSERT_EQ(m.save(), "");

    {
        FILE* f = std::fopen(path.c_str(), "rb");
        ASSERT_NE(f, nullptr);
        unsigned char magic[2] = {0, 0};
        ASSERT_EQ(std::fread(magic, 1, 2, f), 2u);
        std::fclose(f);
        EXPECT_EQ(magic[0], 0x1f);
        EXPECT_EQ(magic[1], 0x8b);
    }

    CheckpointRecord r;
    bool found = false;
    ASSERT_EQ(m.load(r, found), "");
    ASSERT_TRUE(found);
    EXPECT_EQ(r.discovered_names.size(), 2u);
}

TEST_F(CheckpointManagerFixture, MissingFileIsNotAnError) {
    CheckpointManager m(dir.file("none.json"), 200, 300.0, state, cl.log);
    CheckpointRecord r;
    bool found = true;
    EXPECT_EQ(m.load(r, found), "");
    EXPECT_FALSE(found);
}

TEST_F(CheckpointManagerFixture, CorruptFileIsReported) {
    const std::string path = dir.file("bad.json");
    ASSERT_EQ(write_text_file_atomic(path, "{\"discovered_names\": [\"x\""), "");
    CheckpointManager m(path, 200, 300.0, state, cl.log);

    CheckpointRecord r;
    bool found = true;
    EXPECT_NE(m.load(r, found), "");
    EXPECT_FALSE(found);
}

TEST_F(CheckpointManagerFixture, SavesWhenRequestThresholdIsReached) {
    CheckpointManager m(dir.file("ckpt.json"), 5, 3600.0, state, cl.log);
    m.reset_schedule();

    state.requests.reset(4);
    m.maybe_save();
    EXPECT_EQ(m.saves(), 0u);

    state.requests.reset(5);
    m.maybe_save();
    EXPECT_EQ(m.saves(), 1u);

    m.maybe_save();
    EXPECT_EQ(m.saves(), 1u);
}

TEST_F(CheckpointManagerFixture, TwoFailuresMarkStorageFailed) {
    const std::string blocker = dir.file("blocker");
    ASSERT_EQ(write_text_file_atomic(blocker, "x"), "");
    CheckpointManager m(blocker + "/ckpt.json", 1, 3600.0, state, cl.log);

    EXPECT_NE(m.save(), "");
    EXPECT_FALSE(m.storage_failed());

    EXPECT_NE(m.save_or_retry(), "");
    EXPECT_TRUE(m.storage_failed());
    EXPECT_NE(cl.text().find("Checkpoint storage failed twice"), std::string::npos);
}

TEST_F(CheckpointManagerFixture, CreatesMissingDirectories) {
    fill();
    const std::string path = dir.file("runs/day1/ckpt.json");
    CheckpointManager m(path, 200, 300.0, state, cl.log);

    ASSERT_EQ(m.save(), "");
    EXPECT_TRUE(file_exists(path));
    EXPECT_FALSE(file_exists(dir.file("runs/day1")));
}
