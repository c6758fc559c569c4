#include <gtest/gtest.h>
#include "utils/config.h"
#include "utils/utils.h"
#include "core/funding_ledger.h"
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace sciencefund;
using namespace sciencefund::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto uniq = std::to_string(static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
        testDir = std::filesystem::temp_directory_path() / ("sciencefund_config_" + uniq);
        std::filesystem::create_directories(testDir);
        Config::instance().reset();
        Config::instance().setDataDir(testDir.string());
    }

    void TearDown() override {
        Config::instance().onChange(nullptr);
        Config::instance().reset();
        if (std::filesystem::exists(testDir)) {
            std::filesystem::remove_all(testDir);
        }
    }

    void writeFile(const std::string& name, const std::string& content) {
        std::ofstream file(testDir / name);
        file << content;
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigTest, DefaultsDescribePlatform) {
    auto platform = Config::instance().getPlatformConfig();
    EXPECT_EQ(platform.owner, "owner");
    EXPECT_EQ(platform.feeBps, 250u);
    EXPECT_EQ(platform.feeRecipient, "owner");
    EXPECT_TRUE(platform.verifiers.empty());

    auto ledger = Config::instance().getLedgerConfig();
    EXPECT_EQ(ledger.dbFile, "ledger.db");
    EXPECT_EQ(ledger.logLevel, "info");
    EXPECT_FALSE(ledger.logConsole);
    EXPECT_EQ(ledger.logMaxSize, 10u * 1024 * 1024);
    EXPECT_EQ(ledger.logMaxFiles, 5u);
    EXPECT_EQ(ledger.dbPath(), (testDir / "ledger.db").string());
}

TEST_F(ConfigTest, LoadsKeyValueFile) {
    writeFile("sciencefund.conf",
              "# platform\n"
              "platform.owner = foundation\n"
              "platform.fee_bps=100\n"
              "platform.verifiers = v1, v2 ,,v3\n"
              "\n"
              "ledger.db_file=/var/lib/sciencefund/main.db\n"
              "log.max_files = 2\n"
              "log.console=true\n"
              "not a setting\n");
    ASSERT_TRUE(Config::instance().load((testDir / "sciencefund.conf").string()));

    auto platform = Config::instance().getPlatformConfig();
    EXPECT_EQ(platform.owner, "foundation");
    EXPECT_EQ(platform.feeBps, 100u);
    EXPECT_EQ(platform.feeRecipient, "foundation");
    ASSERT_EQ(platform.verifiers.size(), 3u);
    EXPECT_EQ(platform.verifiers[1], "v2");
    auto ledger = Config::instance().getLedgerConfig();
    EXPECT_EQ(ledger.dbPath(), "/var/lib/sciencefund/main.db");
    EXPECT_EQ(ledger.logMaxFiles, 2u);
    EXPECT_TRUE(ledger.logConsole);
    EXPECT_FALSE(Config::instance().has("not a setting"));
}

TEST_F(ConfigTest, MissingFileIsReported) {
    EXPECT_FALSE(Config::instance().load((testDir / "absent.conf").string()));
    EXPECT_EQ(Config::instance().getString("platform.owner"), "owner");
}

TEST_F(ConfigTest, TypedGetters) {
    auto& cfg = Config::instance();
    cfg.set("a.int", 42);
    cfg.set("a.neg", -7);
    cfg.set("a.big", static_cast<uint64_t>(18446744073709551615ULL));
    cfg.set("a.flag", true);
    cfg.set("a.word", "yes");
    cfg.set("a.bad", "12x");

    EXPECT_EQ(cfg.getInt("a.int"), 42);
    EXPECT_EQ(cfg.getInt("a.neg"), -7);
    EXPECT_EQ(cfg.getInt("a.big", 4), 4);
    EXPECT_EQ(cfg.getUint64("a.big"), 18446744073709551615ULL);
    EXPECT_TRUE(cfg.getBool("a.flag"));
    EXPECT_TRUE(cfg.getBool("a.word"));
    EXPECT_EQ(cfg.getUint64("a.bad", 9), 9u);
    EXPECT_EQ(cfg.getUint64("a.neg", 3), 3u);
    EXPECT_EQ(cfg.getInt("missing", 5), 5);
    EXPECT_EQ(cfg.keys("a."), (std::vector<std::string>{"a.bad", "a.big", "a.flag", "a.int", "a.neg", "a.word"}));

    cfg.remove("a.int");
    EXPECT_FALSE(cfg.has("a.int"));
}

TEST_F(ConfigTest, ListValues) {
    auto& cfg = Config::instance();
    cfg.setList("ledger.tags", {"alpha", "beta", "gamma"});
    EXPECT_EQ(cfg.getString("ledger.tags"), "alpha,beta,gamma");
    EXPECT_EQ(cfg.getList("ledger.tags"), (std::vector<std::string>{"alpha", "beta", "gamma"}));

    cfg.set("ledger.tags", " one ,, two,");
    EXPECT_EQ(cfg.getList("ledger.tags"), (std::vector<std::string>{"one", "two"}));

    cfg.setList("ledger.tags", {});
    EXPECT_TRUE(cfg.getList("ledger.tags").empty());
    EXPECT_TRUE(cfg.getList("ledger.absent").empty());
}

TEST_F(ConfigTest, SaveRoundTripsPlatformConfig) {
    PlatformConfig platform;
    platform.owner = "foundation";
    platform.feeBps = 400;
    platform.feeRecipient = "treasury";
    platform.verifiers = {"v1", "v2"};
    Config::instance().setPlatformConfig(platform);

    std::string path = (testDir / "saved.conf").string();
    ASSERT_TRUE(Config::instance().save(path));
    Config::instance().reset();
    EXPECT_EQ(Config::instance().getPlatformConfig().owner, "owner");

    ASSERT_TRUE(Config::instance().load(path));
    auto loaded = Config::instance().getPlatformConfig();
    EXPECT_EQ(loaded.owner, "foundation");
    EXPECT_EQ(loaded.feeBps, 400u);
    EXPECT_EQ(loaded.feeRecipient, "treasury");
    EXPECT_EQ(loaded.verifiers, platform.verifiers);
    EXPECT_EQ(Config::instance().getConfigPath(), path);
}

TEST_F(ConfigTest, ChangeCallbackSeesKeys) {
    std::vector<std::string> changed;
    Config::instance().onChange([&changed](const std::string& key) { changed.push_back(key); });
    Config::instance().set("platform.fee_bps", 300);
    Config::instance().remove("platform.verifiers");
    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], "platform.fee_bps");
    EXPECT_EQ(changed[1], "platform.verifiers");
}

TEST_F(ConfigTest, OversizedFeeRejectedWhenLedgerOpens) {
    Config::instance().set("platform.fee_bps", 1500);
    auto platform = Config::instance().getPlatformConfig();

    core::PlatformParams params;
    params.owner = platform.owner;
    params.feeBps = platform.feeBps;
    params.feeRecipient = platform.feeRecipient;
    params.verifiers = platform.verifiers;

    core::FundingLedger ledger;
    auto opened = ledger.openInMemory(params);
    EXPECT_TRUE(opened.failed());
    EXPECT_EQ(opened.code(), ErrorCode::LIMIT_EXCEEDED);
}

TEST(FormatterTest, Amounts) {
    EXPECT_EQ(Formatter::formatAmount(0), "0");
    EXPECT_EQ(Formatter::formatAmount(1234567), "1,234,567");
    EXPECT_EQ(Formatter::formatBps(250), "2.50%");
    EXPECT_EQ(Formatter::formatBps(1000), "10.00%");

    uint64_t value = 0;
    EXPECT_TRUE(Formatter::parseUint64("18446744073709551615", value));
    EXPECT_EQ(value, 18446744073709551615ULL);
    EXPECT_FALSE(Formatter::parseUint64("18446744073709551616", value));
    EXPECT_FALSE(Formatter::parseUint64("-1", value));
    EXPECT_FALSE(Formatter::parseUint64("", value));
    EXPECT_EQ(Formatter::split(" a, b ,,c ", ','), (std::vector<std::string>{"a", "b", "c"}));
}
