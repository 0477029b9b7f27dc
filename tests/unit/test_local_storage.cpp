#include <gtest/gtest.h>
#include "lore/storage/local_storage.hpp"
#include "fixtures/zip_builder.hpp"

#include <fstream>

using namespace lore;
using namespace lore::storage;
using namespace lore::testing;

class LocalStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        open_backend();
    }

    void open_backend() {
        backend_.reset();
        auto opened = LocalStorageBackend::open(dir_.path() / "kb");
        ASSERT_TRUE(opened.has_value()) << opened.error().to_string();
        backend_ = std::move(*opened);
    }

    std::filesystem::path files_root() const {
        return dir_.path() / "kb" / "files";
    }

    TempDir dir_;
    std::unique_ptr<LocalStorageBackend> backend_;
};

// ============================================================================
// Layout
// ============================================================================

TEST_F(LocalStorageTest, OpenCreatesLayoutAndSeedsRegistry) {
    EXPECT_TRUE(std::filesystem::is_directory(files_root()));
    EXPECT_TRUE(std::filesystem::exists(dir_.path() / "kb" / "registry.json"));
    EXPECT_EQ(backend_->backend_name(), "local");

    auto agents = backend_->get_all_agents();
    ASSERT_EQ(agents.size(), 1U);
    EXPECT_EQ(agents[0].id, "default");
}

TEST_F(LocalStorageTest, StoreWritesArchiveAndExtractedTree) {
    const std::string archive = ZipBuilder()
        .add("a.md", "Rate: 5%")
        .add("guides/b.md", "Second")
        .add("notes.txt", "plain")
        .build();

    auto stored = backend_->store_knowledge_file("Policies", "Finance policies", {"default"},
                                                 archive, "application/zip");
    ASSERT_TRUE(stored.has_value()) << stored.error().to_string();
    EXPECT_EQ(stored->extraction.files_extracted, 3U);
    EXPECT_EQ(stored->extraction.markdown_files, 2U);

    const auto& file = stored->file;
    EXPECT_EQ(file.name, "Policies");
    EXPECT_EQ(file.file_size, static_cast<int64_t>(archive.size()));
    EXPECT_EQ(file.content_type, "application/zip");

    const auto file_dir = files_root() / file.id;
    EXPECT_EQ(std::filesystem::path(file.file_path), file_dir);
    EXPECT_EQ(std::filesystem::file_size(file_dir / "content.zip"), archive.size());
    EXPECT_TRUE(std::filesystem::exists(file_dir / "extracted" / "guides" / "b.md"));

    auto docs = backend_->list_documents(file);
    ASSERT_TRUE(docs.has_value());
    EXPECT_EQ(*docs, (std::vector<std::string>{"a.md", "guides/b.md", "notes.txt"}));

    auto body = backend_->read_document(file, "a.md");
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(*body, "Rate: 5%");
}

TEST_F(LocalStorageTest, StateSurvivesReopen) {
    ASSERT_TRUE(backend_->create_agent("finance-bot", "Finance", "", "acme").has_value());
    auto stored = backend_->store_knowledge_file("Policies", "", {"finance-bot"},
                                                 ZipBuilder().add("a.md", "x").build(), "application/zip");
    ASSERT_TRUE(stored.has_value());

    open_backend();
    EXPECT_EQ(backend_->get_all_agents().size(), 2U);
    auto file = backend_->get_knowledge_file(stored->file.id);
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->agent_ids, std::vector<std::string>{"finance-bot"});
    EXPECT_EQ(backend_->get_knowledge_files_for_agent("finance-bot").size(), 1U);
    EXPECT_TRUE(backend_->get_knowledge_files_for_agent("default").empty());
}

// ============================================================================
// Failure Handling
// ============================================================================

TEST_F(LocalStorageTest, UnknownAgentWritesNothing) {
    auto stored = backend_->store_knowledge_file("Policies", "", {"ghost"},
                                                 ZipBuilder().add("a.md", "x").build(), "application/zip");
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, ErrorCode::Validation);
    EXPECT_TRUE(std::filesystem::is_empty(files_root()));
}

TEST_F(LocalStorageTest, TraversalArchiveIsRolledBack) {
    const std::string archive = ZipBuilder()
        .add("ok.md", "fine")
        .add("../evil.md", "pwned")
        .build();

    auto stored = backend_->store_knowledge_file("Evil", "", {"default"}, archive, "application/zip");
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, ErrorCode::InvalidArchiveEntry);
    EXPECT_TRUE(std::filesystem::is_empty(files_root()));
    EXPECT_FALSE(std::filesystem::exists(files_root() / "evil.md"));
    EXPECT_TRUE(backend_->get_all_knowledge_files().empty());
}

TEST_F(LocalStorageTest, CorruptArchiveIsRolledBack) {
    auto stored = backend_->store_knowledge_file("Broken", "", {"default"}, "PK-not-really", "application/zip");
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, ErrorCode::ArchiveReadFailed);
    EXPECT_TRUE(std::filesystem::is_empty(files_root()));
}

TEST_F(LocalStorageTest, ExpiredDeadlineStopsStore) {
    auto expired = Deadline::at(Deadline::Clock::now() - std::chrono::seconds(1));
    auto stored = backend_->store_knowledge_file("Late", "", {"default"},
                                                 ZipBuilder().add("a.md", "x").build(),
                                                 "application/zip", expired);
    ASSERT_FALSE(stored.has_value());
    EXPECT_EQ(stored.error().code, ErrorCode::Timeout);
    EXPECT_TRUE(std::filesystem::is_empty(files_root()));
}

TEST_F(LocalStorageTest, ReadDocumentRejectsEscapes) {
    auto stored = backend_->store_knowledge_file("Policies", "", {"default"},
                                                 ZipBuilder().add("a.md", "x").build(), "application/zip");
    ASSERT_TRUE(stored.has_value());

    auto escaped = backend_->read_document(stored->file, "../content.zip");
    ASSERT_FALSE(escaped.has_value());
    EXPECT_EQ(escaped.error().code, ErrorCode::InvalidArchiveEntry);

    auto missing = backend_->read_document(stored->file, "missing.md");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::StorageReadFailed);
}

TEST_F(LocalStorageTest, ListDocumentsFailsWhenDirectoryVanished) {
    auto stored = backend_->store_knowledge_file("Policies", "", {"default"},
                                                 ZipBuilder().add("a.md", "x").build(), "application/zip");
    ASSERT_TRUE(stored.has_value());
    std::filesystem::remove_all(std::filesystem::path(stored->file.file_path) / "extracted");

    auto docs = backend_->list_documents(stored->file);
    ASSERT_FALSE(docs.has_value());
    EXPECT_EQ(docs.error().code, ErrorCode::StorageReadFailed);
}

TEST_F(LocalStorageTest, RepeatedReadsReturnEqualIndependentCopies) {
    ASSERT_TRUE(backend_->create_agent("finance-bot", "Finance", "", "acme").has_value());
    auto first_file = backend_->store_knowledge_file("Policies", "", {"default", "finance-bot"},
                                                     ZipBuilder().add("a.md", "x").build(), "application/zip");
    ASSERT_TRUE(first_file.has_value());
    auto second_file = backend_->store_knowledge_file("Rates", "", {"finance-bot"},
                                                      ZipBuilder().add("b.md", "y").build(), "application/zip");
    ASSERT_TRUE(second_file.has_value());

    const auto first = backend_->get_all_knowledge_files();
    const auto second = backend_->get_all_knowledge_files();
    ASSERT_EQ(first.size(), 2U);
    EXPECT_EQ(first, second);
    EXPECT_EQ(backend_->get_knowledge_files_for_agent("finance-bot"),
              backend_->get_knowledge_files_for_agent("finance-bot"));

    auto mutated = backend_->get_all_knowledge_files();
    mutated[0].agent_ids.clear();
    mutated[0].name = "edited";
    mutated.erase(mutated.begin() + 1);

    EXPECT_EQ(backend_->get_all_knowledge_files(), first);
    auto visible = backend_->get_knowledge_files_for_agent("finance-bot");
    ASSERT_EQ(visible.size(), 2U);
    EXPECT_EQ(visible[0].name, "Policies");
    EXPECT_EQ(visible[0].agent_ids, (std::vector<std::string>{"default", "finance-bot"}));
    EXPECT_EQ(visible[1].id, second_file->file.id);
}

// ============================================================================
// Deletion and Sweeps
// ============================================================================

TEST_F(LocalStorageTest, DeleteRemovesRecordAndDirectory) {
    auto stored = backend_->store_knowledge_file("Policies", "", {"default"},
                                                 ZipBuilder().add("a.md", "x").add("b.md", "y").build(),
                                                 "application/zip");
    ASSERT_TRUE(stored.has_value());

    auto report = backend_->delete_knowledge_file(stored->file.id);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->complete());
    EXPECT_GT(report->objects_deleted, 0U);
    EXPECT_FALSE(std::filesystem::exists(stored->file.file_path));
    EXPECT_FALSE(backend_->get_knowledge_file(stored->file.id).has_value());

    auto again = backend_->delete_knowledge_file(stored->file.id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);
}

TEST_F(LocalStorageTest, SweepRemovesOnlyOrphans) {
    auto stored = backend_->store_knowledge_file("Policies", "", {"default"},
                                                 ZipBuilder().add("a.md", "x").build(), "application/zip");
    ASSERT_TRUE(stored.has_value());

    const auto orphan = files_root() / "orphan-id";
    std::filesystem::create_directories(orphan / "extracted");
    std::ofstream(orphan / "extracted" / "left.md") << "leftover";

    auto report = backend_->sweep_orphans();
    ASSERT_TRUE(report.has_value());
    EXPECT_FALSE(report->timed_out);
    EXPECT_GT(report->objects_deleted, 0U);
    EXPECT_FALSE(std::filesystem::exists(orphan));
    EXPECT_TRUE(std::filesystem::exists(stored->file.file_path));
}

TEST_F(LocalStorageTest, SweepStopsAtDeadline) {
    std::filesystem::create_directories(files_root() / "orphan-a");
    auto expired = Deadline::at(Deadline::Clock::now() - std::chrono::seconds(1));

    auto report = backend_->sweep_orphans(expired);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(report->timed_out);
    EXPECT_TRUE(std::filesystem::exists(files_root() / "orphan-a"));
}
