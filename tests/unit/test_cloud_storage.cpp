#include <gtest/gtest.h>
#include "lore/storage/cloud_storage.hpp"
#include "mocks/mock_object_store.hpp"
#include "fixtures/zip_builder.hpp"

using namespace lore;
using namespace lore::storage;
using namespace lore::testing;

class CloudStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MockObjectStore>();
        open_backend();
    }

    void open_backend() {
        backend_.reset();
        auto cache = ObjectCache::open(dir_.path() / "cache", std::chrono::seconds(3600));
        ASSERT_TRUE(cache.has_value()) << cache.error().to_string();
        cache_ = *cache;

        CloudStorageOptions options;
        options.project_id = "acme-project";
        options.operation_timeout = std::chrono::seconds(5);
        auto opened = CloudStorageBackend::open(store_, cache_, options);
        ASSERT_TRUE(opened.has_value()) << opened.error().to_string();
        backend_ = std::move(*opened);
    }

    UploadResult store_sample() {
        const std::string archive = ZipBuilder()
            .add("a.md", "Rate: 5%")
            .add("guides/b.md", "Second")
            .add("notes.txt", "plain")
            .build();
        auto stored = backend_->store_knowledge_file("Policies", "Finance policies", {"default"},
                                                     archive, "application/zip");
        EXPECT_TRUE(stored.has_value()) << stored.error().to_string();
        return stored.value_or(UploadResult{});
    }

    TempDir dir_;
    std::shared_ptr<MockObjectStore> store_;
    std::shared_ptr<ObjectCache> cache_;
    std::unique_ptr<CloudStorageBackend> backend_;
};

// ============================================================================
// Setup
// ============================================================================

TEST_F(CloudStorageTest, SeedsRegistryObject) {
    ASSERT_EQ(store_->objects.count("registry.json"), 1U);
    EXPECT_EQ(store_->objects["registry.json"].content_type, "application/json");
    EXPECT_EQ(backend_->get_all_agents().size(), 1U);
    EXPECT_EQ(store_->create_bucket_calls, 0);
    EXPECT_EQ(backend_->backend_name(), "cloud");
}

TEST_F(CloudStorageTest, CreatesMissingBucket) {
    store_ = std::make_shared<MockObjectStore>();
    store_->bucket_present = false;
    open_backend();
    EXPECT_EQ(store_->create_bucket_calls, 1);
    EXPECT_EQ(store_->created_project, "acme-project");
}

TEST_F(CloudStorageTest, CorruptRegistryObjectFailsOpen) {
    store_->objects["registry.json"].data = "[1, 2";
    backend_.reset();
    auto opened = CloudStorageBackend::open(store_, cache_, CloudStorageOptions{});
    ASSERT_FALSE(opened.has_value());
    EXPECT_EQ(opened.error().code, ErrorCode::RegistryCorrupt);
}

TEST(CloudStorageOpenTest, RequiresStoreAndCache) {
    TempDir dir;
    auto cache = ObjectCache::open(dir.path(), std::chrono::seconds(1));
    ASSERT_TRUE(cache.has_value());

    auto no_store = CloudStorageBackend::open(nullptr, *cache);
    ASSERT_FALSE(no_store.has_value());
    EXPECT_EQ(no_store.error().code, ErrorCode::InvalidConfig);

    auto no_cache = CloudStorageBackend::open(std::make_shared<MockObjectStore>(), nullptr);
    ASSERT_FALSE(no_cache.has_value());
    EXPECT_EQ(no_cache.error().code, ErrorCode::InvalidConfig);
}

// ============================================================================
// Storing
// ============================================================================

TEST_F(CloudStorageTest, StoreUploadsArchiveAndDocuments) {
    auto stored = store_sample();
    const std::string prefix = "files/" + stored.file.id;
    EXPECT_EQ(stored.file.file_path, prefix);
    EXPECT_EQ(stored.extraction.files_extracted, 3U);
    EXPECT_EQ(stored.extraction.markdown_files, 2U);

    ASSERT_EQ(store_->objects.count(prefix + "/content.zip"), 1U);
    EXPECT_EQ(store_->objects[prefix + "/content.zip"].content_type, "application/zip");
    EXPECT_EQ(store_->objects[prefix + "/extracted/a.md"].content_type, "text/markdown");
    EXPECT_EQ(store_->objects[prefix + "/extracted/guides/b.md"].data, "Second");
    EXPECT_EQ(store_->objects[prefix + "/extracted/notes.txt"].content_type, "text/plain");
    EXPECT_EQ(store_->count_prefix(prefix + "/"), 4U);

    // Scratch extraction is cleaned up.
    EXPECT_FALSE(std::filesystem::exists(cache_->scratch_dir() / stored.file.id));

    // The registry object now lists the file.
    EXPECT_NE(store_->objects["registry.json"].data.find(stored.file.id), std::string::npos);
}

TEST_F(CloudStorageTest, DocumentsAreListedAndReadThroughCache) {
    auto stored = store_sample();

    auto docs = backend_->list_documents(stored.file);
    ASSERT_TRUE(docs.has_value());
    EXPECT_EQ(*docs, (std::vector<std::string>{"a.md", "guides/b.md", "notes.txt"}));

    // Upload warmed the cache, so reads do not touch the store.
    const int gets_before = store_->get_calls;
    auto body = backend_->read_document(stored.file, "a.md");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "Rate: 5%");
    EXPECT_EQ(store_->get_calls, gets_before);
    EXPECT_GE(cache_->stats().hits, 1U);
}

TEST_F(CloudStorageTest, ColdCacheFetchesFromStore) {
    auto stored = store_sample();
    ASSERT_TRUE(cache_->evict_prefix("files/").has_value());

    const int gets_before = store_->get_calls;
    auto body = backend_->read_document(stored.file, "guides/b.md");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "Second");
    EXPECT_EQ(store_->get_calls, gets_before + 1);
}

TEST_F(CloudStorageTest, ReadRejectsUnsafePaths) {
    auto stored = store_sample();
    for (const std::string path : {"../content.zip", "/a.md", "guides//b.md", "guides/", ""}) {
        auto body = backend_->read_document(stored.file, path);
        ASSERT_FALSE(body.has_value()) << path;
        EXPECT_EQ(body.error().code, ErrorCode::InvalidArchiveEntry) << path;
    }
}

TEST_F(CloudStorageTest, FailedDocumentUploadRollsBack) {
    store_->fail_put_suffixes.insert("/extracted/notes.txt");
    const std::string archive = ZipBuilder().add("a.md", "x").add("notes.txt", "y").build();

    auto stored = backend_->store_knowledge_file("Policies", "", {"default"}, archive, "application/zip");
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, ErrorCode::StorageWriteFailed);
    EXPECT_EQ(store_->count_prefix("files/"), 0U);
    EXPECT_TRUE(backend_->get_all_knowledge_files().empty());
}

TEST_F(CloudStorageTest, FailedRegistryWriteRollsBack) {
    store_->fail_put_suffixes.insert("registry.json");
    const std::string archive = ZipBuilder().add("a.md", "x").build();

    auto stored = backend_->store_knowledge_file("Policies", "", {"default"}, archive, "application/zip");
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, ErrorCode::RegistryPersistFailed);
    EXPECT_EQ(store_->count_prefix("files/"), 0U);
    EXPECT_TRUE(backend_->get_all_knowledge_files().empty());
}

TEST_F(CloudStorageTest, TraversalArchiveRollsBack) {
    const std::string archive = ZipBuilder().add("a.md", "x").add("../evil.md", "y").build();
    auto stored = backend_->store_knowledge_file("Evil", "", {"default"}, archive, "application/zip");
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, ErrorCode::InvalidArchiveEntry);
    EXPECT_EQ(store_->count_prefix("files/"), 0U);
}

TEST_F(CloudStorageTest, UnknownAgentUploadsNothing) {
    auto stored = backend_->store_knowledge_file("Policies", "", {"ghost"},
                                                 ZipBuilder().add("a.md", "x").build(), "application/zip");
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, ErrorCode::Validation);
    EXPECT_EQ(store_->count_prefix("files/"), 0U);
}

// ============================================================================
// Deletion
// ============================================================================

TEST_F(CloudStorageTest, DeleteRemovesObjectsAndCache) {
    auto stored = store_sample();
    const size_t cached_before = *cache_->size();
    ASSERT_GT(cached_before, 0U);

    auto report = backend_->delete_knowledge_file(stored.file.id);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->complete());
    EXPECT_EQ(report->objects_deleted, 4U);
    EXPECT_EQ(store_->count_prefix("files/"), 0U);
    EXPECT_EQ(*cache_->size(), 0U);
    EXPECT_FALSE(backend_->get_knowledge_file(stored.file.id).has_value());
}

TEST_F(CloudStorageTest, PartialCleanupStillDeletesRecord) {
    auto stored = store_sample();
    store_->fail_delete_suffixes.insert("/extracted/guides/b.md");

    auto report = backend_->delete_knowledge_file(stored.file.id);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->complete());
    EXPECT_EQ(report->objects_failed, 1U);
    EXPECT_EQ(report->objects_deleted, 3U);
    EXPECT_FALSE(backend_->get_knowledge_file(stored.file.id).has_value());

    // The survivor is an orphan that a later sweep removes.
    store_->fail_delete_suffixes.clear();
    auto swept = backend_->sweep_orphans();
    ASSERT_TRUE(swept.has_value());
    EXPECT_EQ(swept->objects_deleted, 1U);
    EXPECT_EQ(store_->count_prefix("files/"), 0U);
}

TEST_F(CloudStorageTest, DeleteReportsTimeout) {
    auto stored = store_sample();
    store_->delete_delay_ms = 30;

    auto report = backend_->delete_knowledge_file(stored.file.id, Deadline::after(std::chrono::milliseconds(50)));
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->timed_out);
    EXPECT_LT(report->objects_deleted, 4U);
    EXPECT_FALSE(backend_->get_knowledge_file(stored.file.id).has_value());
}

TEST_F(CloudStorageTest, DeleteUnknownFile) {
    auto report = backend_->delete_knowledge_file("missing");
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::NotFound);
}

TEST_F(CloudStorageTest, ListFailureDuringDeleteIsReported) {
    auto stored = store_sample();
    store_->should_fail_list = true;

    auto report = backend_->delete_knowledge_file(stored.file.id);
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->complete());
    EXPECT_FALSE(backend_->get_knowledge_file(stored.file.id).has_value());
}

// ============================================================================
// Orphan Sweeps
// ============================================================================

TEST_F(CloudStorageTest, SweepKeepsRegisteredFiles) {
    auto stored = store_sample();
    store_->objects["files/orphan/content.zip"] = {"zip", "application/zip"};
    store_->objects["files/orphan/extracted/x.md"] = {"x", "text/markdown"};

    auto report = backend_->sweep_orphans();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->objects_deleted, 2U);
    EXPECT_EQ(store_->count_prefix("files/orphan/"), 0U);
    EXPECT_EQ(store_->count_prefix("files/" + stored.file.id + "/"), 4U);
}

TEST_F(CloudStorageTest, SweepPropagatesListFailure) {
    store_->should_fail_list = true;
    auto report = backend_->sweep_orphans();
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::StorageReadFailed);
}

TEST_F(CloudStorageTest, StateSurvivesReopen) {
    auto stored = store_sample();
    ASSERT_TRUE(backend_->create_agent("finance-bot", "Finance", "", "acme").has_value());

    open_backend();
    EXPECT_EQ(backend_->get_all_agents().size(), 2U);
    auto file = backend_->get_knowledge_file(stored.file.id);
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->name, "Policies");
}

// ============================================================================
// Content Types
// ============================================================================

TEST(ContentTypeTest, ByExtension) {
    EXPECT_EQ(detail::content_type_for("a.md"), "text/markdown");
    EXPECT_EQ(detail::content_type_for("docs/A.MD"), "text/markdown");
    EXPECT_EQ(detail::content_type_for("notes.TXT"), "text/plain");
    EXPECT_EQ(detail::content_type_for("image.png"), "application/octet-stream");
    EXPECT_EQ(detail::content_type_for("README"), "application/octet-stream");
}
