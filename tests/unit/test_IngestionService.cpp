#include "MirrorFixture.hpp"
#include "errors/errors.hpp"

using namespace dm;
using namespace dm::types;

class IngestionServiceTest : public test::MirrorFixture {};

TEST_F(IngestionServiceTest, QueuesPendingDocument) {
    const auto doc = ingestFile("Guide.md", "# hello", "guides");

    EXPECT_GT(doc->id, 0u);
    EXPECT_EQ(doc->filestore_id, filestore->id);
    EXPECT_EQ(doc->display_name, "Guide.md");
    EXPECT_EQ(doc->category, "guides");
    EXPECT_EQ(doc->mime_type, "text/markdown");
    EXPECT_EQ(doc->size, 7u);
    EXPECT_EQ(doc->state, DocumentState(Lifecycle::Pending));
    EXPECT_FALSE(doc->started_at);
    EXPECT_FALSE(doc->uploaded_at);
    EXPECT_FALSE(doc->error);
    EXPECT_FALSE(doc->custom_metadata);
    EXPECT_TRUE(doc->url.starts_with("/~cache/"));
    EXPECT_TRUE(store->exists(doc->url));
    EXPECT_EQ(wakes.load(), 1u);
}

TEST_F(IngestionServiceTest, UnknownFilestoreIsNotFound) {
    EXPECT_THROW(ingestFile("a.md", "x", std::nullopt, 999u), errors::NotFound);
    EXPECT_EQ(repo->documentCount(), 0u);
    EXPECT_EQ(wakes.load(), 0u);
}

TEST_F(IngestionServiceTest, EmptyCategoryIsUncategorized) {
    const auto doc = ingestFile("a.md", "x", "");
    EXPECT_FALSE(doc->category);
}

TEST_F(IngestionServiceTest, SameContentReplacesEarlierDocument) {
    const auto first = ingestFile("first.md", "same bytes");

    // pretend the first copy was uploaded
    auto uploaded = *repo->getDocument(first->id);
    uploaded.name = filestore->name + "/documents/old";
    remote->addDocument(filestore->name, {.name = *uploaded.name, .display_name = "first.md"});
    repo->put(uploaded);

    const auto second = ingestFile("second.md", "same bytes");

    EXPECT_NE(second->id, first->id);
    EXPECT_EQ(repo->getDocument(first->id), nullptr);
    EXPECT_EQ(repo->documentCount(), 1u);
    EXPECT_EQ(remote->deletedDocuments(), std::vector<std::string>{*uploaded.name});
    EXPECT_TRUE(remote->documents(filestore->name).empty());
}

TEST_F(IngestionServiceTest, ReplacementToleratesRemoteAlreadyGone) {
    const auto first = ingestFile("first.md", "same bytes");
    auto uploaded = *repo->getDocument(first->id);
    uploaded.name = filestore->name + "/documents/vanished";
    repo->put(uploaded);

    EXPECT_NO_THROW(ingestFile("again.md", "same bytes"));
    EXPECT_EQ(repo->documentCount(), 1u);
}

TEST_F(IngestionServiceTest, DifferentFilestoresKeepTheirOwnCopies) {
    const auto other = makeFilestore("Other");
    ingestFile("a.md", "shared");
    ingestFile("a.md", "shared", std::nullopt, other->id);
    EXPECT_EQ(repo->documentCount(), 2u);
}

TEST_F(IngestionServiceTest, BatchIngestSignalsOnce) {
    std::vector<ingest::IncomingFile> files{
        ingest::IncomingFile::fromBytes("a.pdf", "aaa"),
        ingest::IncomingFile::fromBytes("b.json", "{}"),
        ingest::IncomingFile::fromBytes("c.weird", "ccc"),
    };

    const auto docs = ingestion()->ingest(filestore->id, std::nullopt, files);

    ASSERT_EQ(docs.size(), 3u);
    EXPECT_EQ(docs[0]->mime_type, "application/pdf");
    EXPECT_EQ(docs[1]->mime_type, "application/json");
    EXPECT_EQ(docs[2]->mime_type, "application/octet-stream");
    EXPECT_EQ(wakes.load(), 1u);
}
