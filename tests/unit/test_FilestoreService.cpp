#include "MirrorFixture.hpp"
#include "services/FilestoreService.hpp"
#include "errors/errors.hpp"
#include "errors/RemoteError.hpp"

using namespace dm;
using namespace dm::types;

class FilestoreServiceTest : public test::MirrorFixture {
protected:
    std::shared_ptr<services::FilestoreService> svc;

    void SetUp() override {
        MirrorFixture::SetUp();
        svc = std::make_shared<services::FilestoreService>(repo, remote, aggregator);
    }
};

TEST_F(FilestoreServiceTest, CreateProvisionsRemoteStoreFirst) {
    const auto created = svc->create("Policies", "alice");
    EXPECT_EQ(created->display_name, "Policies");
    EXPECT_EQ(created->user, "alice");
    ASSERT_TRUE(created->name.starts_with("fileSearchStores/"));
    EXPECT_NO_THROW(remote->getStore(created->name));
    EXPECT_EQ(svc->get(created->id)->name, created->name);
}

TEST_F(FilestoreServiceTest, CreateRejectsEmptyName) {
    EXPECT_THROW(svc->create(""), std::invalid_argument);
    EXPECT_EQ(svc->list({}).size(), 1u);
}

TEST_F(FilestoreServiceTest, ListFiltersByOwnerAndName) {
    svc->create("Policies", "alice");
    svc->create("Runbooks", "bob");

    FilestoreQuery byUser;
    byUser.user = "bob";
    const auto bobs = svc->list(byUser);
    ASSERT_EQ(bobs.size(), 1u);
    EXPECT_EQ(bobs[0]->display_name, "Runbooks");

    FilestoreQuery byName;
    byName.q = "Pol";
    ASSERT_EQ(svc->list(byName).size(), 1u);
    EXPECT_EQ(svc->list({}).size(), 3u);
}

TEST_F(FilestoreServiceTest, RemoveDeletesRemoteStoreAndDocuments) {
    const auto doc = ingestFile("a.md", "alpha");
    worker()->drain();

    svc->remove(filestore->id);

    EXPECT_THROW(remote->getStore(filestore->name), remote::NotFound);
    EXPECT_EQ(repo->getFilestore(filestore->id), nullptr);
    EXPECT_EQ(repo->getDocument(doc->id), nullptr);
}

TEST_F(FilestoreServiceTest, RemoveToleratesMissingRemoteStore) {
    remote->deleteStore(filestore->name, true);
    EXPECT_NO_THROW(svc->remove(filestore->id));
    EXPECT_EQ(repo->getFilestore(filestore->id), nullptr);
}

TEST_F(FilestoreServiceTest, UnknownFilestoreIsNotFound) {
    EXPECT_THROW(svc->get(42), errors::NotFound);
    EXPECT_THROW(svc->remove(42), errors::NotFound);
    EXPECT_THROW(svc->categories(42), errors::NotFound);
    EXPECT_THROW(svc->remoteDocuments(42), errors::NotFound);
}

TEST_F(FilestoreServiceTest, DeleteDocumentRemovesBothCopies) {
    const auto doc = ingestFile("a.md", "alpha");
    ingestFile("b.md", "bravo");
    worker()->drain();
    const auto name = *repo->getDocument(doc->id)->name;

    svc->deleteDocument(doc->id);

    EXPECT_EQ(remote->deletedDocuments(), std::vector<std::string>{name});
    EXPECT_EQ(repo->getDocument(doc->id), nullptr);
    EXPECT_EQ(svc->remoteDocuments(filestore->id).size(), 1u);
    EXPECT_EQ(repo->getFilestore(filestore->id)->stats.active, 1u);
}

TEST_F(FilestoreServiceTest, DeleteDocumentAlreadyGoneRemotely) {
    const auto doc = ingestFile("a.md", "alpha");
    worker()->drain();
    ASSERT_TRUE(remote->deleteDocument(*repo->getDocument(doc->id)->name));

    EXPECT_NO_THROW(svc->deleteDocument(doc->id));
    EXPECT_EQ(repo->getDocument(doc->id), nullptr);
}

TEST_F(FilestoreServiceTest, DeleteNeverUploadedDocumentSkipsRemote) {
    const auto doc = ingestFile("queued.md", "queued");
    svc->deleteDocument(doc->id);
    EXPECT_TRUE(remote->deletedDocuments().empty());
    EXPECT_EQ(repo->getDocument(doc->id), nullptr);
    EXPECT_EQ(repo->getFilestore(filestore->id)->stats.pending, 0u);
}

TEST_F(FilestoreServiceTest, DeleteUnknownDocumentIsNotFound) {
    EXPECT_THROW(svc->deleteDocument(77), errors::NotFound);
}

TEST_F(FilestoreServiceTest, CategoriesGroupDocuments) {
    ingestFile("a.md", "aaaa", "guides");
    ingestFile("b.md", "bb", "guides");
    ingestFile("c.md", "c");

    const auto cats = svc->categories(filestore->id);
    ASSERT_EQ(cats.size(), 2u);
    EXPECT_FALSE(cats[0].category);
    EXPECT_EQ(cats[0].count, 1u);
    EXPECT_EQ(cats[1].category, "guides");
    EXPECT_EQ(cats[1].count, 2u);
    EXPECT_EQ(cats[1].size, 6u);
}

TEST_F(FilestoreServiceTest, DocumentsHonorCategoryFilter) {
    ingestFile("a.md", "aaaa", "guides");
    ingestFile("c.md", "c");

    DocumentQuery query;
    query.filestore_id = filestore->id;
    query.category = "";
    const auto uncategorized = svc->documents(query);
    ASSERT_EQ(uncategorized.size(), 1u);
    EXPECT_EQ(uncategorized[0]->display_name, "c.md");

    query.category = "guides";
    ASSERT_EQ(svc->documents(query).size(), 1u);
}
