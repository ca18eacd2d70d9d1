#include <gtest/gtest.h>
#include "stats/Aggregator.hpp"
#include "MemoryRepository.hpp"

using namespace dm;
using namespace dm::types;

namespace {

db::DocumentPtr doc(const Lifecycle lifecycle, const uintmax_t size,
                    const std::optional<Advisory> advisory = std::nullopt,
                    const std::optional<std::string> error = std::nullopt) {
    auto d = std::make_shared<Document>();
    d->state = DocumentState(lifecycle, advisory);
    d->size = size;
    d->error = error;
    return d;
}

}

TEST(StatsAggregatorTest, CountsByLifecycle) {
    const auto stats = stats::Aggregator::compute({
        doc(Lifecycle::Active, 10),
        doc(Lifecycle::Active, 20),
        doc(Lifecycle::Pending, 5),
        doc(Lifecycle::Failed, 1, std::nullopt, "timeout"),
    });

    EXPECT_EQ(stats.active, 2u);
    EXPECT_EQ(stats.pending, 1u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.size_bytes, 36u);
}

TEST(StatsAggregatorTest, ErrorWinsOverActive) {
    const auto stats = stats::Aggregator::compute({doc(Lifecycle::Active, 1, std::nullopt, "late failure")});
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.active, 0u);
}

TEST(StatsAggregatorTest, OverlaysCountUnderTheirLifecycle) {
    const auto stats = stats::Aggregator::compute({
        doc(Lifecycle::Active, 1, Advisory::DuplicateFile),
        doc(Lifecycle::Pending, 1, Advisory::MissingFromRemote),
    });
    EXPECT_EQ(stats.active, 1u);
    EXPECT_EQ(stats.pending, 1u);
    EXPECT_EQ(stats.failed, 0u);
}

TEST(StatsAggregatorTest, EmptyFilestoreIsAllZero) {
    EXPECT_EQ(stats::Aggregator::compute({}), FilestoreStats{});
}

TEST(StatsAggregatorTest, RecomputeWritesCountersAndIsIdempotent) {
    auto repo = std::make_shared<test::MemoryRepository>();
    Filestore f;
    f.name = "fileSearchStores/s";
    f.display_name = "s";
    const auto filestore = repo->createFilestore(f);

    for (int i = 0; i < 3; ++i) {
        Document d;
        d.filestore_id = filestore->id;
        d.hash = "h" + std::to_string(i);
        d.display_name = d.hash + ".md";
        d.size = 100;
        d.state = DocumentState(i == 0 ? Lifecycle::Active : Lifecycle::Pending);
        repo->insertDocument(d);
    }

    const stats::Aggregator aggregator(repo);
    const auto first = aggregator.recompute(filestore->id);
    const auto second = aggregator.recompute(filestore->id);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first.active, 1u);
    EXPECT_EQ(first.pending, 2u);
    EXPECT_EQ(first.size_bytes, 300u);
    EXPECT_EQ(repo->getFilestore(filestore->id)->stats, first);
}
