#include <gtest/gtest.h>
#include "lore/config.hpp"
#include "lore/types.hpp"

#include <cstdlib>
#include <thread>

using namespace lore;

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, ToStringWithoutContext) {
    Error err{ErrorCode::NotFound, "knowledge file not found: abc"};
    EXPECT_EQ(err.to_string(), "[201] knowledge file not found: abc");
}

TEST(ErrorTest, ToStringWithContext) {
    Error err{ErrorCode::InvalidArchiveEntry, "Invalid file path in zip", "../evil.md"};
    EXPECT_EQ(err.to_string(), "[300] Invalid file path in zip | Context: ../evil.md");
}

TEST(ErrorTest, Equality) {
    Error a{ErrorCode::Validation, "Name is required"};
    Error b{ErrorCode::Validation, "Name is required"};
    Error c{ErrorCode::Validation, "Name is required", "upload"};
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(error_code_to_string(ErrorCode::AlreadyExists), "AlreadyExists");
    EXPECT_STREQ(error_code_to_string(ErrorCode::RegistryPersistFailed), "RegistryPersistFailed");
    EXPECT_STREQ(error_code_to_string(ErrorCode::Timeout), "Timeout");
}

// ============================================================================
// Deadline Tests
// ============================================================================

TEST(DeadlineTest, NoneNeverExpires) {
    auto deadline = Deadline::none();
    EXPECT_FALSE(deadline.has_value());
    EXPECT_FALSE(deadline.expired());
    EXPECT_FALSE(deadline.remaining().has_value());
    EXPECT_TRUE(deadline.check("noop").has_value());
}

TEST(DeadlineTest, PastDeadlineFailsCheck) {
    auto deadline = Deadline::at(Deadline::Clock::now() - std::chrono::seconds(1));
    EXPECT_TRUE(deadline.expired());
    ASSERT_TRUE(deadline.remaining().has_value());
    EXPECT_EQ(deadline.remaining()->count(), 0);

    auto result = deadline.check("delete_object");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_NE(result.error().message.find("delete_object"), std::string::npos);
}

TEST(DeadlineTest, OrAfterKeepsBoundedDeadline) {
    auto bounded = Deadline::after(std::chrono::milliseconds(50));
    auto kept = bounded.or_after(std::chrono::hours(1));
    ASSERT_TRUE(kept.remaining().has_value());
    EXPECT_LE(kept.remaining()->count(), 50);

    auto fallback = Deadline::none().or_after(std::chrono::milliseconds(10));
    EXPECT_TRUE(fallback.has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(fallback.expired());
}

// ============================================================================
// Timestamp Tests
// ============================================================================

TEST(TimestampTest, FormatsUtcWithMicroseconds) {
    const Timestamp ts{std::chrono::microseconds(1714566600123456LL)};
    EXPECT_EQ(detail::format_timestamp(ts), "2024-05-01T12:30:00.123456Z");
}

TEST(TimestampTest, ParsesOffsetsAndFractions) {
    auto utc = detail::parse_timestamp("2024-05-01T12:30:00Z");
    ASSERT_TRUE(utc.has_value());

    auto offset = detail::parse_timestamp("2024-05-01T14:30:00+02:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(*utc, *offset);

    auto nanos = detail::parse_timestamp("2024-05-01T12:30:00.123456789Z");
    ASSERT_TRUE(nanos.has_value());
    EXPECT_EQ(detail::format_timestamp(*nanos), "2024-05-01T12:30:00.123456Z");
}

TEST(TimestampTest, RejectsMalformedInput) {
    EXPECT_FALSE(detail::parse_timestamp("").has_value());
    EXPECT_FALSE(detail::parse_timestamp("2024-05-01").has_value());
    EXPECT_FALSE(detail::parse_timestamp("2024-05-01T12:30:00").has_value());
    EXPECT_FALSE(detail::parse_timestamp("2024-05-01T12:30:00Zjunk").has_value());
}

// ============================================================================
// JSON Serialization Tests
// ============================================================================

TEST(JsonTest, AgentOmitsEmptyApiKey) {
    Agent agent;
    agent.id = "finance-bot";
    agent.name = "Finance";
    agent.tenant_id = "acme";
    agent.created_at = detail::now_micros();

    nlohmann::json j = agent;
    EXPECT_FALSE(j.contains("api_key"));
    EXPECT_EQ(j["id"], "finance-bot");
    EXPECT_EQ(j["tenant_id"], "acme");

    agent.api_key = "secret";
    nlohmann::json with_key = agent;
    EXPECT_EQ(with_key["api_key"], "secret");

    Agent parsed = with_key.get<Agent>();
    EXPECT_EQ(parsed, agent);
}

TEST(JsonTest, KnowledgeFileToleratesNullAgentIds) {
    auto j = nlohmann::json::parse(R"({
        "id": "f1",
        "name": "Policies",
        "file_path": "files/f1",
        "agent_ids": null,
        "uploaded_at": "2024-05-01T12:30:00Z",
        "file_size": 42
    })");
    auto file = j.get<KnowledgeFile>();
    EXPECT_EQ(file.id, "f1");
    EXPECT_TRUE(file.agent_ids.empty());
    EXPECT_EQ(file.file_size, 42);
    EXPECT_TRUE(file.content_type.empty());
}

TEST(JsonTest, BadTimestampThrows) {
    auto j = nlohmann::json::parse(R"({"id": "a", "created_at": "yesterday"})");
    EXPECT_THROW(j.get<Agent>(), std::invalid_argument);
}

TEST(JsonTest, RegistryDocumentRequiresObject) {
    EXPECT_THROW(nlohmann::json::array().get<RegistryDocument>(), std::invalid_argument);

    auto doc = nlohmann::json::parse(R"({"agents": [], "knowledge_files": null})").get<RegistryDocument>();
    EXPECT_TRUE(doc.agents.empty());
    EXPECT_TRUE(doc.knowledge_files.empty());
}

TEST(JsonTest, CleanupReportCompleteness) {
    CleanupReport report;
    EXPECT_TRUE(report.complete());
    report.objects_failed = 1;
    EXPECT_FALSE(report.complete());

    CleanupReport timed_out;
    timed_out.timed_out = true;
    EXPECT_FALSE(timed_out.complete());

    nlohmann::json j = timed_out;
    EXPECT_EQ(j["timed_out"], true);
}

// ============================================================================
// Configuration Tests
// ============================================================================

namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~ScopedEnv() {
        unsetenv(name_);
    }

private:
    const char* name_;
};

} // namespace

TEST(StorageConfigTest, DefaultsAreValid) {
    StorageConfig config;
    EXPECT_EQ(config.type, StorageType::Local);
    EXPECT_EQ(config.local_path, "knowledge");
    EXPECT_TRUE(config.validate().has_value());
}

TEST(StorageConfigTest, CloudRequiresBucket) {
    StorageConfig config;
    config.type = StorageType::Cloud;
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidConfig);

    config.bucket = "kb-bucket";
    EXPECT_TRUE(config.validate().has_value());
}

TEST(StorageConfigTest, RejectsBadNumbers) {
    StorageConfig config;
    config.local_path = "";
    EXPECT_FALSE(config.validate().has_value());

    config.local_path = "kb";
    config.operation_timeout = std::chrono::seconds(0);
    EXPECT_FALSE(config.validate().has_value());

    config.operation_timeout = std::chrono::seconds(5);
    config.cache_ttl = std::chrono::seconds(-1);
    EXPECT_FALSE(config.validate().has_value());
}

TEST(StorageConfigTest, FromEnvironment) {
    ScopedEnv type("STORAGE_TYPE", "gcp");
    ScopedEnv bucket("GCP_STORAGE_BUCKET", "kb-bucket");
    ScopedEnv emulator("STORAGE_EMULATOR_HOST", "localhost:4443");
    ScopedEnv ttl("KNOWLEDGE_CACHE_TTL_SECONDS", "120");

    auto config = StorageConfig::from_env();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->type, StorageType::Cloud);
    EXPECT_EQ(config->bucket, "kb-bucket");
    EXPECT_EQ(config->endpoint, "localhost:4443");
    EXPECT_EQ(config->cache_ttl.count(), 120);
    EXPECT_TRUE(config->validate().has_value());
}

TEST(StorageConfigTest, FromEnvironmentRejectsGarbage) {
    {
        ScopedEnv type("STORAGE_TYPE", "ftp");
        auto config = StorageConfig::from_env();
        ASSERT_FALSE(config.has_value());
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    }
    {
        ScopedEnv timeout("KNOWLEDGE_OPERATION_TIMEOUT_SECONDS", "30s");
        auto config = StorageConfig::from_env();
        ASSERT_FALSE(config.has_value());
        EXPECT_EQ(config.error().code, ErrorCode::InvalidConfig);
    }
}

TEST(StorageConfigTest, FromJson) {
    auto config = storage_config_from_json(nlohmann::json::parse(R"({
        "type": "local",
        "local_path": "/srv/kb",
        "cache_ttl_seconds": 0,
        "default_agent": {"id": "main", "name": "Main"}
    })"));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->local_path, "/srv/kb");
    EXPECT_EQ(config->cache_ttl.count(), 0);
    EXPECT_EQ(config->default_agent.id, "main");
    EXPECT_EQ(config->default_agent.name, "Main");
    EXPECT_EQ(config->default_agent.tenant_id, "default");

    auto wrong_type = storage_config_from_json(nlohmann::json::parse(R"({"local_path": 7})"));
    ASSERT_FALSE(wrong_type.has_value());
    EXPECT_EQ(wrong_type.error().code, ErrorCode::InvalidConfig);

    EXPECT_FALSE(storage_config_from_json(nlohmann::json::array()).has_value());
}

TEST(RetrieverConfigTest, Validation) {
    RetrieverConfig config;
    EXPECT_TRUE(config.validate().has_value());
    EXPECT_EQ(config.max_context_tokens, 50000);

    config.tokens_per_char = 0.0;
    EXPECT_FALSE(config.validate().has_value());
}
