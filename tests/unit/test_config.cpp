#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <gtest/gtest.h>
#include "config.hpp"

namespace {

using evoloop::Config;

class TempDir {
public:
    TempDir() {
        root_ = std::filesystem::temp_directory_path() /
                ("evoloop_config_" + std::to_string(::getpid()) + "_" + std::to_string(counter_++));
        std::filesystem::create_directories(root_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }
    const std::filesystem::path& root() const { return root_; }

private:
    static inline int counter_ = 0;
    std::filesystem::path root_;
};

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
    Config c = Config::make_default();
    EXPECT_EQ(c.max_rounds, 200);
    EXPECT_EQ(c.max_retries, 3);
    EXPECT_EQ(c.context.default_cap, 8192);
    EXPECT_EQ(c.context.low_throughput_cap, 4096);
    EXPECT_DOUBLE_EQ(c.budget.force_fraction, 0.5);
    EXPECT_DOUBLE_EQ(c.budget.warn_fraction, 0.3);
    EXPECT_EQ(c.budget.warn_every_rounds, 10);
    EXPECT_EQ(c.budget.self_check_every_rounds, 50);
    EXPECT_EQ(c.routing.providers.count("openrouter"), 1u);
}

TEST(ConfigTest, FromJsonOverridesSections) {
    auto j = nlohmann::json::parse(R"JSON({
        "model": "openai/o3",
        "fallback_models": "a/one, b/two ,",
        "max_rounds": 12,
        "context": {"default_cap": 1000, "low_throughput_prefixes": ["groq/"]},
        "budget": {"total_usd": 2.5},
        "routing": {
            "default_provider": "openrouter",
            "providers": {"groq": {"api_base": "https://api.groq.com/openai/v1", "models": ["llama-3"]}},
            "native_models": {"local-model": "local"},
            "paid_tier": true
        },
        "pricing": {"refresh": false, "min_live_entries": 9}
    })JSON");

    Config c = Config::from_json(j);
    EXPECT_EQ(c.model, "openai/o3");
    ASSERT_EQ(c.fallback_models.size(), 2u);
    EXPECT_EQ(c.fallback_models[1], "b/two");
    EXPECT_EQ(c.max_rounds, 12);
    EXPECT_EQ(c.context.default_cap, 1000);
    EXPECT_EQ(c.context.low_throughput_cap, 4096);
    ASSERT_EQ(c.context.low_throughput_prefixes.size(), 1u);
    EXPECT_DOUBLE_EQ(c.budget.total_usd, 2.5);
    EXPECT_EQ(c.routing.providers.at("groq").models.size(), 1u);
    EXPECT_EQ(c.routing.native_models.at("local-model"), "local");
    EXPECT_TRUE(c.routing.paid_tier);
    EXPECT_FALSE(c.pricing.refresh);
    EXPECT_EQ(c.pricing.min_live_entries, 9u);
}

TEST(ConfigTest, SaveThenLoadKeepsSettings) {
    TempDir dir;
    std::string path = (dir.root() / "config.json").string();

    Config c = Config::make_default();
    c.fallback_models = {"x/a", "x/b"};
    c.tool_error_ceiling = 7;
    c.save(path);

    ::unsetenv("EVOLOOP_MODEL_FALLBACK_LIST");
    Config loaded = Config::load(path);
    EXPECT_EQ(loaded.fallback_models, c.fallback_models);
    EXPECT_EQ(loaded.tool_error_ceiling, 7);
}

TEST(ConfigTest, UnparsableFileFallsBackToDefaults) {
    TempDir dir;
    std::string path = (dir.root() / "config.json").string();
    std::ofstream(path) << "{ not json";

    ::unsetenv("EVOLOOP_MAX_ROUNDS");
    Config c = Config::load(path);
    EXPECT_EQ(c.max_rounds, 200);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    Config c = Config::make_default();
    ::setenv("EVOLOOP_MODEL_FALLBACK_LIST", "m1,m2,m3", 1);
    ::setenv("EVOLOOP_MAX_ROUNDS", "not-a-number", 1);
    c.apply_env();
    ::unsetenv("EVOLOOP_MODEL_FALLBACK_LIST");
    ::unsetenv("EVOLOOP_MAX_ROUNDS");

    ASSERT_EQ(c.fallback_models.size(), 3u);
    EXPECT_EQ(c.fallback_models[0], "m1");
    EXPECT_EQ(c.max_rounds, 200);
}

TEST(ConfigTest, DrivePathsDeriveFromWorkspace) {
    Config c;
    c.workspace = "/tmp/evo";
    EXPECT_EQ(c.drive_root(), "/tmp/evo/drive");
    EXPECT_EQ(c.logs_dir(), "/tmp/evo/drive/logs");
}

} // namespace
