#include <gtest/gtest.h>
#include <shipcalc/utils/config.hpp>
#include <shipcalc/utils/logger.hpp>
#include <shipcalc/utils/random_source.hpp>

#include <atomic>
#include <cstdint>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        previous_level_ = shipcalc::utils::Logger::level();
        shipcalc::utils::Logger::set_sink(&buffer_);
    }

    void TearDown() override {
        shipcalc::utils::Logger::set_sink(nullptr);
        shipcalc::utils::Logger::set_level(previous_level_);
    }

    std::stringstream buffer_;
    shipcalc::utils::LogLevel previous_level_ = shipcalc::utils::LogLevel::INFO;
};

TEST_F(LoggerTest, BasicLogging) {
    shipcalc::utils::Logger::set_level(shipcalc::utils::LogLevel::INFO);

    shipcalc::utils::Logger::debug() << "Debug message" << shipcalc::utils::Logger::endl;
    shipcalc::utils::Logger::info() << "Info message" << shipcalc::utils::Logger::endl;
    shipcalc::utils::Logger::warn() << "Warning message" << shipcalc::utils::Logger::endl;
    shipcalc::utils::Logger::error() << "Error message" << shipcalc::utils::Logger::endl;

    std::string output = buffer_.str();
    EXPECT_EQ(output.find("Debug message"), std::string::npos);
    EXPECT_NE(output.find("[INFO] Info message"), std::string::npos);
    EXPECT_NE(output.find("[WARN] Warning message"), std::string::npos);
    EXPECT_NE(output.find("[ERROR] Error message"), std::string::npos);
}

TEST_F(LoggerTest, MessagesDoNotLeakBetweenLines) {
    shipcalc::utils::Logger::info() << "first " << 1 << shipcalc::utils::Logger::endl;
    shipcalc::utils::Logger::info() << "second " << 2 << shipcalc::utils::Logger::endl;

    std::string output = buffer_.str();
    EXPECT_NE(output.find("[INFO] first 1\n"), std::string::npos);
    EXPECT_NE(output.find("[INFO] second 2\n"), std::string::npos);
}

TEST_F(LoggerTest, ErrorLevelSilencesWarnings) {
    shipcalc::utils::Logger::set_level(shipcalc::utils::LogLevel::LOG_ERROR);
    EXPECT_EQ(shipcalc::utils::Logger::level(), shipcalc::utils::LogLevel::LOG_ERROR);
    shipcalc::utils::Logger::warn() << "quiet" << shipcalc::utils::Logger::endl;
    EXPECT_TRUE(buffer_.str().empty());
}

TEST(LogLevelTest, ParsesNames) {
    using shipcalc::utils::LogLevel;
    using shipcalc::utils::parse_log_level;
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("info"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level("Warn"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("ERROR"), LogLevel::LOG_ERROR);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
}

TEST(ConfigTest, ParsesKeyValueLines) {
    std::istringstream input(
        "# carrier settings\n"
        "\n"
        "order_cost = 250.5\n"
        "  destination_country=USA  \n"
        "not a setting\n"
        "strategy =FedEx\r\n");

    shipcalc::utils::Config config;
    config.load_from_stream(input);

    EXPECT_DOUBLE_EQ(config.get("order_cost", 0.0), 250.5);
    EXPECT_EQ(config.get("destination_country", "none"), "USA");
    EXPECT_EQ(config.get("strategy", "none"), "FedEx");
    EXPECT_FALSE(config.has("not a setting"));
    EXPECT_FALSE(config.has("# carrier settings"));
}

TEST(ConfigTest, FallsBackToDefaults) {
    std::istringstream input("order_cost = lots\n");
    shipcalc::utils::Config config;
    config.load_from_stream(input);

    EXPECT_DOUBLE_EQ(config.get("order_cost", 1000.0), 1000.0);
    EXPECT_EQ(config.get("missing", "fallback"), "fallback");
    EXPECT_EQ(config.get<int>("missing", 7), 7);
}

TEST(ConfigTest, SetOverridesValue) {
    shipcalc::utils::Config config;
    config.set("ems_seed", 42);
    EXPECT_TRUE(config.has("ems_seed"));
    EXPECT_EQ(config.get<std::uint64_t>("ems_seed", 0), 42u);
}

TEST(ConfigTest, MissingFileIsReported) {
    shipcalc::utils::Config config;
    config.set("strategy", "UPS");
    EXPECT_FALSE(config.load_from_file("/nonexistent/shipcalc.conf"));
    EXPECT_EQ(config.get("strategy", "none"), "UPS");
}

TEST(RandomSourceTest, ValuesStayInUnitRange) {
    shipcalc::utils::MersenneRandomSource source(1);
    for (int i = 0; i < 10000; ++i) {
        double value = source.next_unit();
        EXPECT_GE(value, 0.0);
        EXPECT_LT(value, 1.0);
    }
}

TEST(RandomSourceTest, SameSeedSameSequence) {
    shipcalc::utils::MersenneRandomSource a(99);
    shipcalc::utils::MersenneRandomSource b(99);
    for (int i = 0; i < 100; ++i) {
        EXPECT_DOUBLE_EQ(a.next_unit(), b.next_unit());
    }
}

TEST(RandomSourceTest, DefaultSourceIsShared) {
    EXPECT_EQ(shipcalc::utils::default_random_source().get(),
              shipcalc::utils::default_random_source().get());
}

TEST(RandomSourceTest, SharedAcrossThreads) {
    auto source = std::make_shared<shipcalc::utils::MersenneRandomSource>(5);
    std::atomic<int> out_of_range(0);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&source, &out_of_range]() {
            for (int i = 0; i < 1000; ++i) {
                double value = source->next_unit();
                if (value < 0.0 || value >= 1.0) {
                    out_of_range.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(out_of_range.load(), 0);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
