#include <gtest/gtest.h>

#include "core/orchestrator/archive_orchestrator.hpp"
#include "infra/interrupt.hpp"
#include "test_support.hpp"

using discpack::core::ArchiveOrchestrator;
using discpack::core::CatalogItem;
using discpack::extensions::ProgressState;
using discpack::extensions::ProgressStore;
using discpack::infra::Config;
using discpack::infra::ErrorCode;
using discpack::infra::OversizePolicy;
using discpack::testing::FakeCatalog;
using discpack::testing::FakeFetcher;
using discpack::testing::make_item;
using discpack::testing::snapshot_tree;
using discpack::testing::TempDir;

namespace {

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.api_key = "test-key";
        config.backup_dir = dir / "backup";
        config.state_file = dir / "state.json";
        config.capacity_bytes = 10;
        config.page_size = 2;
    }

    void TearDown() override {
        discpack::infra::g_interrupted.store(false);
    }

    auto run(FakeCatalog& catalog, discpack::core::ItemFetcher& fetcher) {
        ProgressStore store{config.state_file};
        ArchiveOrchestrator orchestrator{config, catalog, fetcher, store};
        return orchestrator.run();
    }

    auto saved_state() -> ProgressState {
        auto state = ProgressStore{config.state_file}.load();
        EXPECT_TRUE(state.has_value());
        return state.value_or(ProgressState{});
    }

    static auto example_items() -> std::vector<CatalogItem> {
        return {make_item("a1", 4, "one.jpg"), make_item("a2", 4, "two.jpg"),
                make_item("a3", 4, "three.jpg"), make_item("a4", 7, "four.jpg")};
    }

    TempDir dir;
    Config config;
};

// Sets the interrupt flag once the wrapped fetcher has stored `limit` items.
class InterruptingFetcher final : public discpack::core::ItemFetcher {
public:
    explicit InterruptingFetcher(std::size_t limit) : limit_(limit) {}

    auto fetch(std::string_view item_id, const std::filesystem::path& destination)
        -> discpack::infra::VoidResult override
    {
        auto result = inner.fetch(item_id, destination);
        if (inner.fetched.size() >= limit_) {
            discpack::infra::g_interrupted.store(true);
        }
        return result;
    }

    FakeFetcher inner;

private:
    std::size_t limit_;
};

} // namespace

TEST_F(OrchestratorTest, PacksExampleIntoChunks)
{
    FakeCatalog catalog{example_items()};
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;

    EXPECT_EQ(snapshot_tree(config.backup_dir), (std::map<std::string, std::string>{
        {"Chunk_1/one.jpg", FakeFetcher::content_for("a1")},
        {"Chunk_1/two.jpg", FakeFetcher::content_for("a2")},
        {"Chunk_2/three.jpg", FakeFetcher::content_for("a3")},
        {"Chunk_3/four.jpg", FakeFetcher::content_for("a4")},
    }));
    EXPECT_EQ(stats->items_archived, 4u);
    EXPECT_EQ(stats->bytes_archived, 19u);
    EXPECT_EQ(stats->chunks_opened, 2u);
    EXPECT_EQ(stats->final_state, (ProgressState{"a4", 3, 7}));
    EXPECT_EQ(saved_state(), (ProgressState{"a4", 3, 7}));
    EXPECT_EQ(catalog.pings, 1);
}

TEST_F(OrchestratorTest, EmptyCatalogCreatesOnlyBackupDir)
{
    FakeCatalog catalog;
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->items_archived, 0u);
    EXPECT_TRUE(std::filesystem::is_directory(config.backup_dir));
    EXPECT_TRUE(snapshot_tree(config.backup_dir).empty());
    EXPECT_FALSE(std::filesystem::exists(config.state_file));
}

TEST_F(OrchestratorTest, SecondRunIsANoOp)
{
    FakeCatalog catalog{example_items()};
    FakeFetcher first;
    ASSERT_TRUE(run(catalog, first).has_value());
    const auto tree = snapshot_tree(config.backup_dir);
    const auto state = saved_state();

    FakeFetcher second;
    auto stats = run(catalog, second);
    ASSERT_TRUE(stats.has_value());
    EXPECT_TRUE(second.fetched.empty());
    EXPECT_EQ(stats->items_skipped, 4u);
    EXPECT_EQ(stats->items_archived, 0u);
    EXPECT_EQ(snapshot_tree(config.backup_dir), tree);
    EXPECT_EQ(saved_state(), state);
}

TEST_F(OrchestratorTest, ResumeContinuesWithNewItems)
{
    FakeCatalog catalog{example_items()};
    FakeFetcher first;
    ASSERT_TRUE(run(catalog, first).has_value());

    catalog.items().push_back(make_item("a5", 3, "five.jpg"));
    catalog.items().push_back(make_item("a6", 1, "six.jpg"));
    FakeFetcher second;
    auto stats = run(catalog, second);
    ASSERT_TRUE(stats.has_value());

    EXPECT_EQ(second.fetched, (std::vector<std::string>{"a5", "a6"}));
    EXPECT_EQ(saved_state(), (ProgressState{"a6", 4, 1}));
    const auto tree = snapshot_tree(config.backup_dir);
    EXPECT_TRUE(tree.contains("Chunk_3/five.jpg"));
    EXPECT_TRUE(tree.contains("Chunk_4/six.jpg"));
}

TEST_F(OrchestratorTest, FailedFetchThenRerunMatchesUninterruptedRun)
{
    TempDir reference_dir;
    Config reference = config;
    reference.backup_dir = reference_dir / "backup";
    reference.state_file = reference_dir / "state.json";
    {
        FakeCatalog catalog{example_items()};
        FakeFetcher fetcher;
        ProgressStore store{reference.state_file};
        ArchiveOrchestrator orchestrator{reference, catalog, fetcher, store};
        ASSERT_TRUE(orchestrator.run().has_value());
    }

    FakeCatalog catalog{example_items()};
    FakeFetcher failing;
    failing.fail_on_id = "a3";
    auto failed = run(catalog, failing);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::ItemFetchFailed);
    // The chunk transition for a3 was recorded, a3 itself was not.
    EXPECT_EQ(saved_state(), (ProgressState{"a2", 2, 0}));

    FakeFetcher retry;
    ASSERT_TRUE(run(catalog, retry).has_value());
    EXPECT_EQ(retry.fetched, (std::vector<std::string>{"a3", "a4"}));

    EXPECT_EQ(snapshot_tree(config.backup_dir), snapshot_tree(reference.backup_dir));
    EXPECT_EQ(saved_state(), ProgressStore{reference.state_file}.load().value());
}

TEST_F(OrchestratorTest, DownloadsGoToHiddenStagingFiles)
{
    FakeCatalog catalog{example_items()};
    FakeFetcher fetcher;
    ASSERT_TRUE(run(catalog, fetcher).has_value());

    ASSERT_EQ(fetcher.destinations.size(), 4u);
    EXPECT_EQ(fetcher.destinations[0], config.backup_dir / "Chunk_1" / ".a1.part");
    EXPECT_EQ(fetcher.destinations[2], config.backup_dir / "Chunk_2" / ".a3.part");
}

TEST_F(OrchestratorTest, StoppedBeforeRenameMatchesUninterruptedRun)
{
    TempDir reference_dir;
    Config reference = config;
    reference.backup_dir = reference_dir / "backup";
    reference.state_file = reference_dir / "state.json";
    {
        FakeCatalog catalog{example_items()};
        FakeFetcher fetcher;
        ProgressStore store{reference.state_file};
        ArchiveOrchestrator orchestrator{reference, catalog, fetcher, store};
        ASSERT_TRUE(orchestrator.run().has_value());
    }

    // a1 and a2 archived; a3 transferred and committed, then the process died
    // before its staging file was renamed.
    FakeCatalog first_two{{example_items()[0], example_items()[1]}};
    FakeFetcher first;
    ASSERT_TRUE(run(first_two, first).has_value());
    std::filesystem::create_directories(config.backup_dir / "Chunk_2");
    discpack::testing::write_file(config.backup_dir / "Chunk_2" / ".a3.part",
                                  FakeFetcher::content_for("a3"));
    ASSERT_TRUE(ProgressStore{config.state_file}.save(ProgressState{"a3", 2, 4}).has_value());

    FakeCatalog catalog{example_items()};
    FakeFetcher resumed;
    auto stats = run(catalog, resumed);
    ASSERT_TRUE(stats.has_value()) << stats.error().message;

    EXPECT_EQ(resumed.fetched, (std::vector<std::string>{"a4"}));
    EXPECT_EQ(stats->name_collisions, 0u);
    EXPECT_EQ(snapshot_tree(config.backup_dir), snapshot_tree(reference.backup_dir));
    EXPECT_EQ(saved_state(), ProgressStore{reference.state_file}.load().value());
}

TEST_F(OrchestratorTest, StagedItemStillYieldsToEarlierSameName)
{
    FakeCatalog catalog{{make_item("a1", 1, "IMG_0001.JPG", "JPG"),
                         make_item("a2", 1, "IMG_0001.JPG", "JPG")}};
    FakeCatalog first_only{{catalog.items()[0]}};
    FakeFetcher first;
    ASSERT_TRUE(run(first_only, first).has_value());
    discpack::testing::write_file(config.backup_dir / "Chunk_1" / ".a2.part",
                                  FakeFetcher::content_for("a2"));
    ASSERT_TRUE(ProgressStore{config.state_file}.save(ProgressState{"a2", 1, 2}).has_value());

    FakeFetcher resumed;
    auto stats = run(catalog, resumed);
    ASSERT_TRUE(stats.has_value());
    EXPECT_TRUE(resumed.fetched.empty());
    EXPECT_EQ(stats->name_collisions, 1u);
    EXPECT_EQ(snapshot_tree(config.backup_dir), (std::map<std::string, std::string>{
        {"Chunk_1/IMG_0001.JPG", FakeFetcher::content_for("a1")},
        {"Chunk_1/IMG_0001_a2.JPG", FakeFetcher::content_for("a2")},
    }));
}

TEST_F(OrchestratorTest, NameCollisionGetsIdSuffix)
{
    FakeCatalog catalog{{make_item("a1", 1, "IMG_0001.JPG", "JPG"),
                         make_item("a2", 1, "IMG_0001.JPG", "JPG")}};
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->name_collisions, 1u);
    EXPECT_EQ(snapshot_tree(config.backup_dir), (std::map<std::string, std::string>{
        {"Chunk_1/IMG_0001.JPG", FakeFetcher::content_for("a1")},
        {"Chunk_1/IMG_0001_a2.JPG", FakeFetcher::content_for("a2")},
    }));
}

TEST_F(OrchestratorTest, SameNameInDifferentChunksDoesNotCollide)
{
    FakeCatalog catalog{{make_item("a1", 8, "same.jpg"), make_item("a2", 8, "same.jpg")}};
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->name_collisions, 0u);
    const auto tree = snapshot_tree(config.backup_dir);
    EXPECT_TRUE(tree.contains("Chunk_1/same.jpg"));
    EXPECT_TRUE(tree.contains("Chunk_2/same.jpg"));
}

TEST_F(OrchestratorTest, MissingResumeMarkerStopsWithoutTouchingState)
{
    const ProgressState stale{"deleted-asset", 2, 5};
    ASSERT_TRUE(ProgressStore{config.state_file}.save(stale).has_value());

    FakeCatalog catalog{example_items()};
    FakeFetcher fetcher;
    auto stats = run(catalog, fetcher);

    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::ResumeMarkerNotFound);
    EXPECT_TRUE(fetcher.fetched.empty());
    EXPECT_EQ(saved_state(), stale);
}

TEST_F(OrchestratorTest, UnreachableServerDoesNoWork)
{
    FakeCatalog catalog{example_items()};
    catalog.reachable = false;
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::ProbeFailed);
    EXPECT_TRUE(catalog.requested_pages.empty());
    EXPECT_FALSE(std::filesystem::exists(config.backup_dir));
    EXPECT_FALSE(std::filesystem::exists(config.state_file));
}

TEST_F(OrchestratorTest, PageFailureKeepsCommittedProgress)
{
    FakeCatalog catalog{example_items()};
    catalog.fail_on_page = 2;
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::CatalogFetchFailed);
    EXPECT_EQ(saved_state(), (ProgressState{"a2", 1, 8}));
}

TEST_F(OrchestratorTest, CorruptStateIsFatal)
{
    discpack::testing::write_file(config.state_file, "garbage");
    FakeCatalog catalog{example_items()};
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::StateCorrupt);
    EXPECT_TRUE(fetcher.fetched.empty());
}

TEST_F(OrchestratorTest, RejectPolicyStopsBeforeOversizedItem)
{
    config.oversize_policy = OversizePolicy::Reject;
    FakeCatalog catalog{{make_item("a1", 4, "ok.jpg"), make_item("big", 11, "big.mov", "mov")}};
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::OversizedItem);
    EXPECT_NE(stats.error().message.find("big"), std::string::npos);
    EXPECT_EQ(fetcher.fetched, (std::vector<std::string>{"a1"}));
    EXPECT_EQ(saved_state(), (ProgressState{"a1", 1, 4}));
}

TEST_F(OrchestratorTest, AllowPolicyStoresOversizedItemAlone)
{
    FakeCatalog catalog{{make_item("a1", 4, "ok.jpg"), make_item("big", 11, "big.mov", "mov"),
                         make_item("a3", 1, "after.jpg")}};
    FakeFetcher fetcher;

    auto stats = run(catalog, fetcher);
    ASSERT_TRUE(stats.has_value());
    const auto tree = snapshot_tree(config.backup_dir);
    EXPECT_TRUE(tree.contains("Chunk_1/ok.jpg"));
    EXPECT_TRUE(tree.contains("Chunk_2/big.mov"));
    EXPECT_TRUE(tree.contains("Chunk_3/after.jpg"));
}

TEST_F(OrchestratorTest, InterruptStopsBetweenItems)
{
    FakeCatalog catalog{example_items()};
    InterruptingFetcher fetcher{2};

    auto stats = run(catalog, fetcher);
    ASSERT_FALSE(stats.has_value());
    EXPECT_EQ(stats.error().code, ErrorCode::Interrupted);
    EXPECT_EQ(stats.error().to_exit_code(), 130);
    EXPECT_EQ(fetcher.inner.fetched, (std::vector<std::string>{"a1", "a2"}));
    EXPECT_EQ(saved_state(), (ProgressState{"a2", 1, 8}));

    discpack::infra::g_interrupted.store(false);
    FakeFetcher rest;
    ASSERT_TRUE(run(catalog, rest).has_value());
    EXPECT_EQ(rest.fetched, (std::vector<std::string>{"a3", "a4"}));
    EXPECT_EQ(saved_state(), (ProgressState{"a4", 3, 7}));
}
