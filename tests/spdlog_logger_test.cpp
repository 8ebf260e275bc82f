// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "cfpp/log/spdlog_logger.hpp"
#include "cfpp/log/logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace cfpp;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic Functionality Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger respects minimum log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Trace));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));
    REQUIRE_FALSE(logger->should_log(LogLevel::Off));
}

TEST_CASE("SpdlogLogger can change log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Info);
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));

    logger->set_level(LogLevel::Debug);

    REQUIRE(logger->should_log(LogLevel::Debug));
    REQUIRE(logger->get_spdlog_logger()->level() == spdlog::level::debug);
}

TEST_CASE("SpdlogLogger level conversion round-trips", "[log][spdlog]") {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
}

TEST_CASE("SpdlogLogger prefixes the component name", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    SpdlogLogger logger(std::vector<spdlog::sink_ptr>{sink}, LogLevel::Debug);
    logger.set_pattern("%l|%v");

    logger.log(LogRecord(LogLevel::Warn, "cfpp:Retry", "attempt 1 failed", std::source_location::current()));
    logger.info("plain message");
    logger.trace("filtered");
    logger.flush();

    const auto text = out.str();
    REQUIRE(text.find("warning|[cfpp:Retry] attempt 1 failed") != std::string::npos);
    REQUIRE(text.find("info|plain message") != std::string::npos);
    REQUIRE(text.find("filtered") == std::string::npos);
}

TEST_CASE("SpdlogLogger wraps an existing spdlog logger", "[log][spdlog]") {
    std::ostringstream out;
    auto inner = std::make_shared<spdlog::logger>("wrapped_test",
        std::make_shared<spdlog::sinks::ostream_sink_mt>(out));
    inner->set_level(spdlog::level::err);

    SpdlogLogger logger(inner);

    REQUIRE(logger.should_log(LogLevel::Error));
    REQUIRE_FALSE(logger.should_log(LogLevel::Warn));
    REQUIRE(logger.get_spdlog_logger() == inner);
}

// ═══════════════════════════════════════════════════════════════════════════
// File Logging Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger file logger respects log level", "[log][spdlog][file]") {
    const std::string test_file = "test_cfpp_spdlog_level.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Warn);
        logger->info("This should not appear");
        logger->warn("This should appear");
        logger->flush();
    }

    const auto content = read_file(test_file);
    REQUIRE(content.find("This should not appear") == std::string::npos);
    REQUIRE(content.find("This should appear") != std::string::npos);

    std::filesystem::remove(test_file);
}

TEST_CASE("Errors are flushed without an explicit flush", "[log][spdlog][file]") {
    const std::string test_file = "test_cfpp_spdlog_error_flush.log";
    std::filesystem::remove(test_file);

    auto logger = make_spdlog_file_logger(test_file, LogLevel::Info);
    logger->error("Deserialization failed");

    REQUIRE(read_file(test_file).find("Deserialization failed") != std::string::npos);

    logger.reset();
    std::filesystem::remove(test_file);
}

// ═══════════════════════════════════════════════════════════════════════════
// Async Logging Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger async console logger works", "[log][spdlog][async]") {
    auto logger = make_spdlog_async_console_logger(LogLevel::Info, 1024);
    REQUIRE(logger != nullptr);

    for (int i = 0; i < 10; ++i) {
        logger->info_fmt("Async message {}", i);
    }
    logger->flush();

    REQUIRE(logger->should_log(LogLevel::Info));
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
}

// ═══════════════════════════════════════════════════════════════════════════
// Integration with Global Logger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ComponentLogger output reaches the spdlog file", "[log][spdlog][integration]") {
    const std::string test_file = "test_cfpp_spdlog_global.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Info);
        auto* spdlog_ptr = logger.get();
        set_logger(std::move(logger));

        ComponentLogger("cfpp:RateLimiter").warn("Rejected GET {}", "zones");
        spdlog_ptr->flush();
    }

    const auto content = read_file(test_file);
    REQUIRE(content.find("[cfpp:RateLimiter] Rejected GET zones") != std::string::npos);

    set_logger(nullptr);
    std::filesystem::remove(test_file);
}
