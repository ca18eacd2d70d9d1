#include <gtest/gtest.h>
#include "sync/Planner.hpp"

#include <nlohmann/json.hpp>

using namespace dm;
using namespace dm::types;
using RemoteDoc = dm::remote::model::Document;

namespace {

constexpr std::time_t NOW = 1'700'000'000;

CustomMetadata metadataFor(const Document& d);

// A document whose previous sync already recorded the remote copy
db::DocumentPtr local(const unsigned int id, const std::string& hash, const std::string& displayName,
                      const std::optional<std::string>& category = std::nullopt) {
    auto d = std::make_shared<Document>();
    d->id = id;
    d->filestore_id = 1;
    d->hash = hash;
    d->display_name = displayName;
    d->category = category;
    d->size = 100;
    d->mime_type = "text/markdown";
    d->name = "stores/s/documents/" + hash;
    d->started_at = NOW - 60;
    d->uploaded_at = NOW - 30;
    d->size_bytes = d->size;
    d->custom_metadata = metadataFor(*d);
    d->create_time = d->update_time = NOW - 30;
    d->state = DocumentState(Lifecycle::Active);
    return d;
}

CustomMetadata metadataFor(const Document& d) {
    CustomMetadata m{CustomMetadataEntry::numeric("id", d.id), CustomMetadataEntry::string("hash", d.hash)};
    if (d.category) m.push_back(CustomMetadataEntry::string("category", *d.category));
    return m;
}

RemoteDoc remoteOf(const Document& d) {
    RemoteDoc r;
    r.name = d.name.value_or("stores/s/documents/" + d.hash);
    r.display_name = d.display_name;
    r.custom_metadata = metadataFor(d);
    r.size_bytes = d.size;
    r.mime_type = d.mime_type;
    r.state = "STATE_ACTIVE";
    r.create_time = r.update_time = NOW - 30;
    return r;
}

// Locals as they look after the plan is written
std::vector<db::DocumentPtr> applied(const std::vector<db::DocumentPtr>& locals, const sync::model::Plan& plan) {
    std::vector<db::DocumentPtr> out;
    for (const auto& d : locals) {
        auto copy = std::make_shared<Document>(*d);
        for (const auto& u : plan.updates)
            if (u.doc.id == d->id) *copy = u.doc;
        out.push_back(copy);
    }
    return out;
}

const Document* updateFor(const sync::model::Plan& plan, const unsigned int id) {
    for (const auto& u : plan.updates)
        if (u.doc.id == id) return &u.doc;
    return nullptr;
}

}

class SyncPlannerTest : public ::testing::Test {
protected:
    config::SyncConfig cfg;

    sync::model::Plan plan(const std::vector<db::DocumentPtr>& locals, const std::vector<RemoteDoc>& remotes) const {
        return sync::Planner::build(locals, remotes, cfg, NOW);
    }
};

TEST_F(SyncPlannerTest, ClassifiesMixedListing) {
    const auto h1 = local(1, "h1", "one.md");
    const auto h2 = local(2, "h2", "two.md");
    const auto h3 = local(3, "h3", "three.md");

    auto r2 = remoteOf(*h2);
    r2.name = "stores/s/documents/other";
    r2.custom_metadata.reset();

    RemoteDoc orphan;
    orphan.name = "stores/s/documents/orphan";
    orphan.display_name = "orphan.pdf";

    const auto p = plan({h1, h2, h3}, {remoteOf(*h1), r2, orphan});
    const auto& r = p.report;

    EXPECT_EQ(r.missing_metadata.count, 1u);
    EXPECT_EQ(r.missing_metadata.docs, std::vector<std::string>{"two.md"});
    EXPECT_EQ(r.missing_from_local.count, 1u);
    EXPECT_EQ(r.missing_from_local.docs, std::vector<std::string>{"orphan.pdf"});
    EXPECT_EQ(r.missing_from_remote.count, 1u);
    EXPECT_EQ(r.missing_from_remote.docs, std::vector<std::string>{"three.md"});
    EXPECT_EQ(r.summary.matched_documents, 1u);
    EXPECT_EQ(r.summary.local_documents, 3u);
    EXPECT_EQ(r.summary.remote_documents, 3u);
    EXPECT_EQ(r.duplicate_documents.count, 0u);
    EXPECT_EQ(r.metadata_mismatch.count, 0u);

    EXPECT_EQ(updateFor(p, 1), nullptr);
    ASSERT_NE(updateFor(p, 2), nullptr);
    EXPECT_EQ(to_string(updateFor(p, 2)->state), "MISSING_METADATA");
    EXPECT_EQ(updateFor(p, 2)->state.primary, Lifecycle::Active);
    ASSERT_NE(updateFor(p, 3), nullptr);
    EXPECT_EQ(to_string(updateFor(p, 3)->state), "MISSING_FROM_REMOTE");
}

TEST_F(SyncPlannerTest, HashBeatsDisplayName) {
    const auto a = local(1, "ha", "shared.md");
    const auto b = local(2, "hb", "other.md");

    auto r = remoteOf(*b);
    r.display_name = "shared.md";

    const auto p = plan({a, b}, {r});
    EXPECT_EQ(p.report.summary.matched_documents, 1u);
    EXPECT_EQ(p.report.missing_from_remote.docs, std::vector<std::string>{"shared.md"});
    EXPECT_EQ(updateFor(p, 2), nullptr);
    EXPECT_EQ(p.report.unmatched_fields.count, 1u);
}

TEST_F(SyncPlannerTest, FallsBackToResourceName) {
    const auto a = local(1, "ha", "a.md");
    auto r = remoteOf(*a);
    r.display_name = "renamed.md";
    r.custom_metadata = CustomMetadata{CustomMetadataEntry::numeric("id", 1)};

    const auto p = plan({a}, {r});
    EXPECT_EQ(p.report.missing_from_local.count, 0u);
    EXPECT_EQ(p.report.missing_metadata.count, 1u);
    EXPECT_EQ(p.report.missing_metadata.docs, std::vector<std::string>{"renamed.md"});
}

TEST_F(SyncPlannerTest, SecondRemoteCopyIsDuplicate) {
    const auto a = local(1, "ha", "a.md", "guides");
    auto copy = remoteOf(*a);
    copy.name = "stores/s/documents/copy";

    const auto p = plan({a}, {remoteOf(*a), copy});
    EXPECT_EQ(p.report.duplicate_documents.count, 1u);
    EXPECT_EQ(p.report.duplicate_documents.docs, std::vector<std::string>{"guides/a.md"});
    EXPECT_EQ(p.report.summary.matched_documents, 1u);
    ASSERT_NE(updateFor(p, 1), nullptr);
    EXPECT_EQ(to_string(updateFor(p, 1)->state), "DUPLICATE_FILE");
}

TEST_F(SyncPlannerTest, DuplicateOutranksMissingMetadata) {
    const auto a = local(1, "ha", "a.md");
    auto first = remoteOf(*a);
    first.custom_metadata.reset();
    auto second = first;
    second.name = "stores/s/documents/second";

    const auto p = plan({a}, {first, second});
    EXPECT_EQ(p.report.missing_metadata.count, 1u);
    EXPECT_EQ(p.report.duplicate_documents.count, 1u);
    EXPECT_EQ(to_string(updateFor(p, 1)->state), "DUPLICATE_FILE");
}

TEST_F(SyncPlannerTest, DisagreeingIdIsMismatch) {
    const auto a = local(1, "ha", "a.md");
    auto r = remoteOf(*a);
    r.custom_metadata = CustomMetadata{CustomMetadataEntry::numeric("id", 99), CustomMetadataEntry::string("hash", "ha")};

    const auto p = plan({a}, {r});
    EXPECT_EQ(p.report.metadata_mismatch.count, 1u);
    EXPECT_EQ(p.report.summary.matched_documents, 1u);
    EXPECT_EQ(to_string(updateFor(p, 1)->state), "METADATA_MISMATCH");
}

TEST_F(SyncPlannerTest, CategoryKeyRequiredOnlyForCategorizedDocuments) {
    const auto categorized = local(1, "ha", "a.md", "guides");
    const auto plain = local(2, "hb", "b.md");

    auto r1 = remoteOf(*categorized);
    r1.custom_metadata = CustomMetadata{CustomMetadataEntry::numeric("id", 1), CustomMetadataEntry::string("hash", "ha")};

    const auto p = plan({categorized, plain}, {r1, remoteOf(*plain)});
    EXPECT_EQ(p.report.missing_metadata.count, 1u);
    EXPECT_EQ(to_string(updateFor(p, 1)->state), "MISSING_METADATA");
    EXPECT_EQ(updateFor(p, 2), nullptr);
}

TEST_F(SyncPlannerTest, FieldDifferencesAreInformational) {
    const auto a = local(1, "ha", "a.md");
    auto r = remoteOf(*a);
    r.size_bytes = 101;
    r.mime_type = "text/plain";

    const auto p = plan({a}, {r});
    EXPECT_EQ(p.report.unmatched_fields.count, 1u);
    ASSERT_NE(updateFor(p, 1), nullptr);
    EXPECT_EQ(updateFor(p, 1)->state, DocumentState(Lifecycle::Active));
    EXPECT_EQ(updateFor(p, 1)->size_bytes, 101u);
}

TEST_F(SyncPlannerTest, CleanPairClearsOverlay) {
    const auto a = local(1, "ha", "a.md");
    const auto r = remoteOf(*a);
    a->state = DocumentState(Lifecycle::Active, Advisory::DuplicateFile);

    const auto p = plan({a}, {r});
    ASSERT_EQ(p.updates.size(), 1u);
    EXPECT_EQ(p.updates[0].doc.state, DocumentState(Lifecycle::Active));
}

TEST_F(SyncPlannerTest, FailedDocumentPresentRemotelyIsAdopted) {
    const auto a = local(1, "ha", "a.md");
    a->uploaded_at.reset();
    a->error = "timeout";
    a->state = DocumentState(Lifecycle::Failed);

    const auto p = plan({a}, {remoteOf(*a)});
    const auto* u = updateFor(p, 1);
    ASSERT_NE(u, nullptr);
    EXPECT_EQ(u->state, DocumentState(Lifecycle::Active));
    EXPECT_EQ(u->uploaded_at, NOW);
    EXPECT_FALSE(u->error);

    // the write is conditioned on the markers the plan was built from
    ASSERT_EQ(p.updates.size(), 1u);
    EXPECT_EQ(p.updates[0].expected.error, "timeout");
    EXPECT_FALSE(p.updates[0].expected.uploaded_at);
    EXPECT_EQ(p.updates[0].expected.started_at, NOW - 60);
}

TEST_F(SyncPlannerTest, InFlightDocumentIsNotAdopted) {
    const auto a = local(1, "ha", "a.md");
    a->uploaded_at.reset();
    a->size_bytes.reset();
    a->state = DocumentState(Lifecycle::Pending);

    const auto p = plan({a}, {remoteOf(*a)});
    const auto* u = updateFor(p, 1);
    ASSERT_NE(u, nullptr);
    EXPECT_FALSE(u->uploaded_at);
    EXPECT_EQ(u->size_bytes, 100u);
    EXPECT_EQ(u->state, DocumentState(Lifecycle::Pending));
}

TEST_F(SyncPlannerTest, SecondPlanOverAppliedStateIsEmpty) {
    const auto h1 = local(1, "h1", "one.md");
    const auto h2 = local(2, "h2", "two.md");
    const auto h3 = local(3, "h3", "three.md");
    h1->error = "stale";
    auto r2 = remoteOf(*h2);
    r2.custom_metadata.reset();
    auto r1 = remoteOf(*h1);
    r1.size_bytes = 5;

    const std::vector remotes{r1, r2};
    const auto first = plan({h1, h2, h3}, remotes);
    ASSERT_FALSE(first.updates.empty());

    const auto second = plan(applied({h1, h2, h3}, first), remotes);
    EXPECT_TRUE(second.updates.empty());
    EXPECT_EQ(second.report, first.report);
}

TEST_F(SyncPlannerTest, SamplesAreCapped) {
    std::vector<RemoteDoc> remotes;
    for (int i = 0; i < 7; ++i) {
        RemoteDoc r;
        r.name = "stores/s/documents/x" + std::to_string(i);
        r.display_name = "x" + std::to_string(i) + ".md";
        r.custom_metadata = CustomMetadata{CustomMetadataEntry::string("category", "misc")};
        remotes.push_back(r);
    }

    const auto p = plan({}, remotes);
    EXPECT_EQ(p.report.missing_from_local.count, 7u);
    ASSERT_EQ(p.report.missing_from_local.docs.size(), 5u);
    EXPECT_EQ(p.report.missing_from_local.docs.front(), "misc/x0.md");
}

TEST_F(SyncPlannerTest, DisplayNameTieBreakIsConfigurable) {
    const auto older = local(1, "ha", "same.md");
    const auto newer = local(2, "hb", "same.md");
    older->name.reset();
    newer->name.reset();

    RemoteDoc r;
    r.name = "stores/s/documents/unknown";
    r.display_name = "same.md";

    auto p = plan({older, newer}, {r});
    EXPECT_EQ(p.report.missing_from_remote.docs, std::vector<std::string>{"same.md"});
    EXPECT_EQ(to_string(updateFor(p, 2)->state), "MISSING_FROM_REMOTE");

    cfg.name_tie_break = config::NameTieBreak::Last;
    p = plan({older, newer}, {r});
    EXPECT_EQ(to_string(updateFor(p, 1)->state), "MISSING_FROM_REMOTE");
}

TEST_F(SyncPlannerTest, ReportSerializesWithCategoryKeys) {
    const nlohmann::json j = plan({local(1, "h1", "one.md")}, {}).report;
    for (const auto* key : {"Missing from Local", "Missing from Gemini", "Missing Metadata",
                            "Metadata Mismatch", "Unmatched Fields", "Duplicate Documents"}) {
        ASSERT_TRUE(j.contains(key)) << key;
        EXPECT_TRUE(j.at(key).contains("count"));
        EXPECT_TRUE(j.at(key).contains("docs"));
    }
    EXPECT_EQ(j.at("Missing from Gemini").at("count"), 1);
    EXPECT_EQ(j.at("Summary").at("Local Documents"), 1);
    EXPECT_EQ(j.at("Summary").at("Remote Documents"), 0);
    EXPECT_EQ(j.at("Summary").at("Matched Documents"), 0);
}
