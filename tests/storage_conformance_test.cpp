// Behaviour every SyncStorage backend must share, run once per backend.

#include "storage/memory_storage.hpp"
#include "storage/sqlite_storage.hpp"
#include "storage/storage_error.hpp"
#ifdef TASKSYNC_WITH_ROCKSDB
#include "storage/rocksdb_storage.hpp"
#endif

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <latch>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace tsync {

using test::id;

// ── Backends ──────────────────────────────────────────────────────────────────

struct Backend {
    std::string name;
    std::function<std::unique_ptr<SyncStorage>(const std::filesystem::path&, const Clock&)> open;
};

std::vector<Backend> all_backends() {
    std::vector<Backend> backends{
        {"Memory",
         [](const std::filesystem::path&, const Clock& clock) -> std::unique_ptr<SyncStorage> {
             return std::make_unique<MemoryStorage>(clock);
         }},
        {"Sqlite",
         [](const std::filesystem::path& dir, const Clock& clock) -> std::unique_ptr<SyncStorage> {
             return std::make_unique<SqliteStorage>(dir, clock);
         }},
    };
#ifdef TASKSYNC_WITH_ROCKSDB
    backends.push_back(
        {"RocksDB",
         [](const std::filesystem::path& dir, const Clock& clock) -> std::unique_ptr<SyncStorage> {
             return std::make_unique<RocksDBStorage>(dir / "rocksdb", clock);
         }});
#endif
    return backends;
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class StorageConformanceTest : public ::testing::TestWithParam<Backend> {
protected:
    void SetUp() override { storage_ = GetParam().open(dir_.path(), clock_); }

    void TearDown() override { storage_.reset(); }

    // Creates `client` and appends `count` versions with ids base+1..base+count.
    std::vector<VersionId> make_chain(const ClientId& client, int count, std::uint64_t base = 100) {
        EXPECT_TRUE(std::holds_alternative<Client>(storage_->create_client(client)));
        std::vector<VersionId> ids;
        VersionId parent = kNilVersionId;
        for (int i = 1; i <= count; ++i) {
            const VersionId vid = id(base + i);
            auto result = storage_->add_version(client, parent, vid, "segment " + std::to_string(i));
            EXPECT_TRUE(std::holds_alternative<Committed>(result));
            ids.push_back(vid);
            parent = vid;
        }
        return ids;
    }

    test::TempDir dir_{"tasksync_conformance"};
    test::ManualClock clock_;
    std::unique_ptr<SyncStorage> storage_;
};

// ── Clients ───────────────────────────────────────────────────────────────────

TEST_P(StorageConformanceTest, GetClientReturnsNulloptForUnknownClient) {
    EXPECT_FALSE(storage_->get_client(id(1)).has_value());
}

TEST_P(StorageConformanceTest, CreateClientStartsEmpty) {
    auto created = storage_->create_client(id(1));
    ASSERT_TRUE(std::holds_alternative<Client>(created));
    EXPECT_EQ(std::get<Client>(created).client_id, id(1));

    auto client = storage_->get_client(id(1));
    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client->client_id, id(1));
    EXPECT_EQ(client->latest_version_id, kNilVersionId);
    EXPECT_EQ(client->versions_since_snapshot, 0u);
    EXPECT_FALSE(client->snapshot.has_value());
}

TEST_P(StorageConformanceTest, CreateExistingClientIsAlreadyExistsAndChangesNothing) {
    const auto chain = make_chain(id(1), 2);

    auto again = storage_->create_client(id(1));
    EXPECT_TRUE(std::holds_alternative<AlreadyExists>(again));

    auto client = storage_->get_client(id(1));
    ASSERT_TRUE(client.has_value());
    EXPECT_EQ(client->latest_version_id, chain.back());
    EXPECT_EQ(client->versions_since_snapshot, 2u);
}

TEST_P(StorageConformanceTest, ClientsAreIndependent) {
    make_chain(id(1), 3, 100);
    make_chain(id(2), 1, 200);

    EXPECT_EQ(storage_->get_client(id(1))->latest_version_id, id(103));
    EXPECT_EQ(storage_->get_client(id(2))->latest_version_id, id(201));
    EXPECT_FALSE(storage_->get_version(id(2), id(101)).has_value());
    EXPECT_FALSE(storage_->get_version_by_parent(id(2), id(101)).has_value());
}

// ── add_version ───────────────────────────────────────────────────────────────

TEST_P(StorageConformanceTest, AddVersionToUnknownClientThrows) {
    EXPECT_THROW((void)storage_->add_version(id(1), kNilVersionId, id(2), "x"), StorageError);
}

TEST_P(StorageConformanceTest, AddVersionBuildsLinearChain) {
    ASSERT_TRUE(std::holds_alternative<Client>(storage_->create_client(id(1))));

    VersionId parent = kNilVersionId;
    for (std::uint32_t i = 1; i <= 3; ++i) {
        const VersionId vid = id(100 + i);
        auto result = storage_->add_version(id(1), parent, vid, "seg" + std::to_string(i));
        ASSERT_TRUE(std::holds_alternative<Committed>(result));
        EXPECT_EQ(std::get<Committed>(result).versions_since_snapshot, i);
        EXPECT_FALSE(std::get<Committed>(result).snapshot.has_value());
        parent = vid;
    }

    // Walk the chain from nil.
    VersionId cursor = kNilVersionId;
    for (std::uint32_t i = 1; i <= 3; ++i) {
        auto child = storage_->get_version_by_parent(id(1), cursor);
        ASSERT_TRUE(child.has_value());
        EXPECT_EQ(child->version_id, id(100 + i));
        EXPECT_EQ(child->parent_version_id, cursor);
        EXPECT_EQ(child->history_segment, "seg" + std::to_string(i));
        cursor = child->version_id;
    }
    EXPECT_FALSE(storage_->get_version_by_parent(id(1), cursor).has_value());

    auto v2 = storage_->get_version(id(1), id(102));
    ASSERT_TRUE(v2.has_value());
    EXPECT_EQ(v2->parent_version_id, id(101));

    auto client = storage_->get_client(id(1));
    EXPECT_EQ(client->latest_version_id, id(103));
    EXPECT_EQ(client->versions_since_snapshot, 3u);
}

TEST_P(StorageConformanceTest, AddVersionWithStaleParentConflictsAndWritesNothing) {
    const auto chain = make_chain(id(1), 2);

    auto result = storage_->add_version(id(1), chain[0], id(999), "late");
    ASSERT_TRUE(std::holds_alternative<Conflict>(result));
    EXPECT_EQ(std::get<Conflict>(result).latest_version_id, chain[1]);

    EXPECT_FALSE(storage_->get_version(id(1), id(999)).has_value());
    auto client = storage_->get_client(id(1));
    EXPECT_EQ(client->latest_version_id, chain[1]);
    EXPECT_EQ(client->versions_since_snapshot, 2u);
    auto child = storage_->get_version_by_parent(id(1), chain[0]);
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->version_id, chain[1]);
}

TEST_P(StorageConformanceTest, AddVersionToEmptyChainRequiresNilParent) {
    ASSERT_TRUE(std::holds_alternative<Client>(storage_->create_client(id(1))));

    auto result = storage_->add_version(id(1), id(42), id(101), "x");
    ASSERT_TRUE(std::holds_alternative<Conflict>(result));
    EXPECT_EQ(std::get<Conflict>(result).latest_version_id, kNilVersionId);
    EXPECT_EQ(storage_->get_client(id(1))->latest_version_id, kNilVersionId);
}

TEST_P(StorageConformanceTest, HistorySegmentBytesRoundTrip) {
    ASSERT_TRUE(std::holds_alternative<Client>(storage_->create_client(id(1))));

    std::string segment;
    for (int i = 0; i < 256; ++i) {
        segment.push_back(static_cast<char>(i));
    }
    segment += std::string(64 * 1024, '\0');

    ASSERT_TRUE(std::holds_alternative<Committed>(
        storage_->add_version(id(1), kNilVersionId, id(101), segment)));
    auto child = storage_->get_version_by_parent(id(1), kNilVersionId);
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->history_segment, segment);
}

// ── Concurrency ───────────────────────────────────────────────────────────────

TEST_P(StorageConformanceTest, ConcurrentAddVersionFromSameHeadHasExactlyOneWinner) {
    constexpr int kThreads = 8;
    ASSERT_TRUE(std::holds_alternative<Client>(storage_->create_client(id(1))));

    std::vector<AddVersionResult> results(kThreads);
    std::latch start{kThreads};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            start.arrive_and_wait();
            results[t] = storage_->add_version(id(1), kNilVersionId, id(100 + t),
                                               "from thread " + std::to_string(t));
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    int winners = 0;
    VersionId winner{};
    for (int t = 0; t < kThreads; ++t) {
        if (std::holds_alternative<Committed>(results[t])) {
            ++winners;
            winner = id(100 + t);
        }
    }
    ASSERT_EQ(winners, 1);
    for (const auto& r : results) {
        if (const auto* conflict = std::get_if<Conflict>(&r)) {
            EXPECT_EQ(conflict->latest_version_id, winner);
        }
    }

    auto client = storage_->get_client(id(1));
    EXPECT_EQ(client->latest_version_id, winner);
    EXPECT_EQ(client->versions_since_snapshot, 1u);
    auto child = storage_->get_version_by_parent(id(1), kNilVersionId);
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->version_id, winner);
}

TEST_P(StorageConformanceTest, ConcurrentWritersNeverFork) {
    constexpr int kThreads = 4;
    constexpr int kVersionsPerThread = 100;
    ASSERT_TRUE(std::holds_alternative<Client>(storage_->create_client(id(1))));

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kVersionsPerThread; ++i) {
                const VersionId vid = id(1000 * (t + 1) + i);
                for (;;) {
                    const auto head = storage_->get_client(id(1))->latest_version_id;
                    auto r = storage_->add_version(id(1), head, vid, "t" + std::to_string(t));
                    if (std::holds_alternative<Committed>(r)) {
                        break;
                    }
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    constexpr int kTotal = kThreads * kVersionsPerThread;
    auto client = storage_->get_client(id(1));
    EXPECT_EQ(client->versions_since_snapshot, static_cast<std::uint32_t>(kTotal));

    // Exactly one path from nil to the head, covering every version.
    std::set<VersionId> seen;
    VersionId cursor = kNilVersionId;
    while (auto child = storage_->get_version_by_parent(id(1), cursor)) {
        ASSERT_TRUE(seen.insert(child->version_id).second);
        cursor = child->version_id;
    }
    EXPECT_EQ(seen.size(), static_cast<std::size_t>(kTotal));
    EXPECT_EQ(cursor, client->latest_version_id);
}

// ── Snapshots ─────────────────────────────────────────────────────────────────

TEST_P(StorageConformanceTest, SnapshotAtHeadIsStored) {
    const auto chain = make_chain(id(1), 3);

    auto result = storage_->add_snapshot(id(1), chain.back(), "snapshot bytes");
    ASSERT_TRUE(std::holds_alternative<SnapshotStored>(result));

    auto client = storage_->get_client(id(1));
    ASSERT_TRUE(client->snapshot.has_value());
    EXPECT_EQ(client->snapshot->version_id, chain.back());
    EXPECT_EQ(client->snapshot->timestamp, clock_.now());
    EXPECT_EQ(client->versions_since_snapshot, 0u);

    auto snapshot = storage_->get_snapshot(id(1));
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->version_id, chain.back());
    EXPECT_EQ(snapshot->data, "snapshot bytes");
}

TEST_P(StorageConformanceTest, StaleSnapshotIsRejectedAndChangesNothing) {
    const auto chain = make_chain(id(1), 2);
    ASSERT_TRUE(std::holds_alternative<SnapshotStored>(
        storage_->add_snapshot(id(1), chain[1], "good")));
    ASSERT_TRUE(std::holds_alternative<Committed>(
        storage_->add_version(id(1), chain[1], id(500), "more")));

    clock_.advance(std::chrono::seconds(60));
    auto result = storage_->add_snapshot(id(1), chain[1], "stale");
    ASSERT_TRUE(std::holds_alternative<VersionMismatch>(result));
    EXPECT_EQ(std::get<VersionMismatch>(result).latest_version_id, id(500));

    auto client = storage_->get_client(id(1));
    EXPECT_EQ(client->versions_since_snapshot, 1u);
    EXPECT_EQ(client->snapshot->version_id, chain[1]);
    EXPECT_EQ(client->snapshot->timestamp, clock_.now() - std::chrono::seconds(60));
    EXPECT_EQ(storage_->get_snapshot(id(1))->data, "good");
}

TEST_P(StorageConformanceTest, SnapshotOnEmptyChainIsRejected) {
    ASSERT_TRUE(std::holds_alternative<Client>(storage_->create_client(id(1))));

    auto nil = storage_->add_snapshot(id(1), kNilVersionId, "x");
    ASSERT_TRUE(std::holds_alternative<VersionMismatch>(nil));
    EXPECT_EQ(std::get<VersionMismatch>(nil).latest_version_id, kNilVersionId);
    EXPECT_TRUE(std::holds_alternative<VersionMismatch>(
        storage_->add_snapshot(id(1), id(7), "x")));
    EXPECT_FALSE(storage_->get_snapshot(id(1)).has_value());
}

TEST_P(StorageConformanceTest, SnapshotForUnknownClientThrows) {
    EXPECT_THROW((void)storage_->add_snapshot(id(1), id(2), "x"), StorageError);
}

TEST_P(StorageConformanceTest, GetSnapshotIsNulloptWithoutOne) {
    EXPECT_FALSE(storage_->get_snapshot(id(1)).has_value());
    make_chain(id(1), 1);
    EXPECT_FALSE(storage_->get_snapshot(id(1)).has_value());
}

TEST_P(StorageConformanceTest, NewerSnapshotReplacesOlder) {
    const auto chain = make_chain(id(1), 1);
    ASSERT_TRUE(std::holds_alternative<SnapshotStored>(
        storage_->add_snapshot(id(1), chain[0], "first")));
    ASSERT_TRUE(std::holds_alternative<Committed>(
        storage_->add_version(id(1), chain[0], id(600), "next")));
    ASSERT_TRUE(std::holds_alternative<SnapshotStored>(
        storage_->add_snapshot(id(1), id(600), "second")));

    auto snapshot = storage_->get_snapshot(id(1));
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->version_id, id(600));
    EXPECT_EQ(snapshot->data, "second");
}

TEST_P(StorageConformanceTest, CommittedCarriesSnapshotInfo) {
    const auto chain = make_chain(id(1), 1);
    ASSERT_TRUE(std::holds_alternative<SnapshotStored>(
        storage_->add_snapshot(id(1), chain[0], "s")));

    auto result = storage_->add_version(id(1), chain[0], id(700), "after");
    ASSERT_TRUE(std::holds_alternative<Committed>(result));
    const auto& committed = std::get<Committed>(result);
    EXPECT_EQ(committed.versions_since_snapshot, 1u);
    ASSERT_TRUE(committed.snapshot.has_value());
    EXPECT_EQ(committed.snapshot->version_id, chain[0]);
    EXPECT_EQ(committed.snapshot->timestamp, clock_.now());
}

TEST_P(StorageConformanceTest, ConcreteScenario) {
    const ClientId c = id(1);
    const VersionId v1 = id(11);
    const VersionId v2 = id(12);
    const VersionId v_stale = id(13);
    ASSERT_TRUE(std::holds_alternative<Client>(storage_->create_client(c)));

    ASSERT_TRUE(std::holds_alternative<Committed>(
        storage_->add_version(c, kNilVersionId, v1, "a")));

    auto stale = storage_->add_version(c, kNilVersionId, v_stale, "b");
    ASSERT_TRUE(std::holds_alternative<Conflict>(stale));
    EXPECT_EQ(std::get<Conflict>(stale).latest_version_id, v1);

    ASSERT_TRUE(std::holds_alternative<Committed>(storage_->add_version(c, v1, v2, "c")));
    EXPECT_EQ(storage_->get_client(c)->versions_since_snapshot, 2u);

    EXPECT_TRUE(std::holds_alternative<VersionMismatch>(storage_->add_snapshot(c, v1, "s1")));
    EXPECT_TRUE(std::holds_alternative<SnapshotStored>(storage_->add_snapshot(c, v2, "s2")));

    auto client = storage_->get_client(c);
    EXPECT_EQ(client->latest_version_id, v2);
    EXPECT_EQ(client->versions_since_snapshot, 0u);
    EXPECT_EQ(client->snapshot->version_id, v2);
}

// ── prune_versions ────────────────────────────────────────────────────────────

TEST_P(StorageConformanceTest, PruneRemovesVersionAndAncestorsOnly) {
    const auto chain = make_chain(id(1), 4);

    EXPECT_EQ(storage_->prune_versions(id(1), chain[2]), 3u);

    for (int i = 0; i < 3; ++i) {
        EXPECT_FALSE(storage_->get_version(id(1), chain[i]).has_value());
    }
    EXPECT_FALSE(storage_->get_version_by_parent(id(1), kNilVersionId).has_value());

    auto next = storage_->get_version_by_parent(id(1), chain[2]);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->version_id, chain[3]);
    EXPECT_EQ(storage_->get_client(id(1))->latest_version_id, chain[3]);

    // The chain keeps growing after a prune.
    EXPECT_TRUE(std::holds_alternative<Committed>(
        storage_->add_version(id(1), chain[3], id(900), "more")));
    EXPECT_EQ(storage_->prune_versions(id(1), chain[2]), 0u);
    EXPECT_EQ(storage_->prune_versions(id(1), chain[3]), 1u);
}

TEST_P(StorageConformanceTest, PruneUnknownClientRemovesNothing) {
    EXPECT_EQ(storage_->prune_versions(id(1), id(2)), 0u);
}

// ── delete_client ─────────────────────────────────────────────────────────────

TEST_P(StorageConformanceTest, DeleteClientCascades) {
    const auto chain = make_chain(id(1), 3);
    make_chain(id(2), 1, 200);
    ASSERT_TRUE(std::holds_alternative<SnapshotStored>(
        storage_->add_snapshot(id(1), chain.back(), "s")));

    EXPECT_TRUE(storage_->delete_client(id(1)));

    EXPECT_FALSE(storage_->get_client(id(1)).has_value());
    EXPECT_FALSE(storage_->get_snapshot(id(1)).has_value());
    for (const auto& vid : chain) {
        EXPECT_FALSE(storage_->get_version(id(1), vid).has_value());
    }
    EXPECT_FALSE(storage_->delete_client(id(1)));

    // A re-created client starts from scratch.
    ASSERT_TRUE(std::holds_alternative<Client>(storage_->create_client(id(1))));
    EXPECT_FALSE(storage_->get_version_by_parent(id(1), kNilVersionId).has_value());
    EXPECT_TRUE(std::holds_alternative<Committed>(
        storage_->add_version(id(1), kNilVersionId, chain[0], "again")));

    // Other clients are untouched.
    EXPECT_EQ(storage_->get_client(id(2))->latest_version_id, id(201));
}

INSTANTIATE_TEST_SUITE_P(
    AllBackends, StorageConformanceTest, ::testing::ValuesIn(all_backends()),
    [](const ::testing::TestParamInfo<Backend>& info) { return info.param.name; });

} // namespace tsync
