// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────
// The spdlog backend used by wxstream-cli (--log-level, --log-file).

#include <catch2/catch_test_macros.hpp>

#include "wxstream/log/logger.hpp"
#include "wxstream/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace wxstream;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger respects minimum log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Trace));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
}

TEST_CASE("SpdlogLogger level conversion round-trips", "[log][spdlog]") {
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Trace) == spdlog::level::trace);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Warn) == spdlog::level::warn);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Off) == spdlog::level::off);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::critical) == LogLevel::Fatal);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::info) == LogLevel::Info);
}

TEST_CASE("SpdlogLogger rejects a null spdlog logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Sinks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger writes to custom sinks", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);

    SpdlogLogger logger({sink}, LogLevel::Info);
    logger.set_pattern("%l|%v");
    logger.debug("hidden");
    logger.info_fmt("stream {} open", "alerts");
    logger.flush();

    REQUIRE(out.str().find("hidden") == std::string::npos);
    REQUIRE(out.str().find("info|stream alerts open") != std::string::npos);
}

TEST_CASE("SpdlogLogger can log to file", "[log][spdlog][file]") {
    const std::string test_file = "test_wxstream_spdlog.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Warn);
        logger->info("This should not appear");
        logger->warn("connection lost, reconnecting");
        logger->error("giving up");
        logger->flush();
    }

    REQUIRE(std::filesystem::exists(test_file));
    const auto content = read_file(test_file);
    REQUIRE(content.find("This should not appear") == std::string::npos);
    REQUIRE(content.find("connection lost, reconnecting") != std::string::npos);
    REQUIRE(content.find("giving up") != std::string::npos);

    std::filesystem::remove(test_file);
}

TEST_CASE("SpdlogLogger async logger works", "[log][spdlog][async]") {
    auto logger = make_spdlog_async_logger(LogLevel::Info);
    REQUIRE(logger != nullptr);

    for (int i = 0; i < 10; ++i) {
        logger->info_fmt("frame {}", i);
    }
    logger->flush();

    REQUIRE(logger->should_log(LogLevel::Info));
}

// ═══════════════════════════════════════════════════════════════════════════
// Integration with Global Logger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger can be set as global logger", "[log][spdlog][integration]") {
    const std::string test_file = "test_wxstream_spdlog_global.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Info);
        auto* spdlog_ptr = logger.get();
        set_logger(std::move(logger));

        WXSTREAM_LOG_INFO("Global logger test");
        spdlog_ptr->flush();
        set_logger(nullptr);
    }

    const auto content = read_file(test_file);
    REQUIRE(content.find("Global logger test") != std::string::npos);

    std::filesystem::remove(test_file);
}
