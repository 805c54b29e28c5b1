// test_logging.cpp
// Tests for sk_wrap::Logger and the sk_wrap::logging helpers
//
// Framework: doctest
//
// Output is captured by redirecting the sink to a stringstream.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "sk_wrap/logging.hpp"

#include <sstream>
#include <string>

using namespace sk_wrap;

namespace {

// Restores level and sink when a test case ends
struct CaptureLog {
    std::ostringstream out;
    LogLevel saved = Logger::level();

    explicit CaptureLog(LogLevel level) {
        Logger::set_level(level);
        Logger::set_sink(&out);
    }

    ~CaptureLog() {
        Logger::set_sink(nullptr);
        Logger::set_level(saved);
    }
};

} // namespace

// ============================================================================
// Level parsing
// ============================================================================

TEST_CASE("parse_log_level - known names, any case") {
    CHECK(parse_log_level("debug", LogLevel::Warn) == LogLevel::Debug);
    CHECK(parse_log_level("INFO", LogLevel::Warn) == LogLevel::Info);
    CHECK(parse_log_level("Warning", LogLevel::Error) == LogLevel::Warn);
    CHECK(parse_log_level("off", LogLevel::Warn) == LogLevel::None);
    CHECK(parse_log_level("trace", LogLevel::Warn) == LogLevel::Trace);
}

TEST_CASE("parse_log_level - unknown name yields fallback") {
    CHECK(parse_log_level("verbose", LogLevel::Info) == LogLevel::Info);
    CHECK(parse_log_level("", LogLevel::Error) == LogLevel::Error);
}

// ============================================================================
// Filtering
// ============================================================================

TEST_CASE("Logger - messages at or above the level are written") {
    CaptureLog cap(LogLevel::Info);

    logging::info("loaded {} inputs", 3);
    logging::warn("slow path");

    const std::string text = cap.out.str();
    CHECK(text.find("[INFO] sk_wrap: loaded 3 inputs") != std::string::npos);
    CHECK(text.find("[WARN] sk_wrap: slow path") != std::string::npos);
}

TEST_CASE("Logger - messages below the level are dropped") {
    CaptureLog cap(LogLevel::Warn);

    logging::debug("batch {}", 1);
    logging::info("hidden");

    CHECK(cap.out.str().empty());
}

TEST_CASE("Logger - None silences errors too") {
    CaptureLog cap(LogLevel::None);

    logging::error("boom");

    CHECK(cap.out.str().empty());
    CHECK_FALSE(Logger::enabled(LogLevel::Error));
}

TEST_CASE("Logger - one line per message") {
    CaptureLog cap(LogLevel::Debug);

    logging::debug("a");
    logging::debug("b");

    const std::string text = cap.out.str();
    std::size_t lines = 0;
    for (char c : text) lines += (c == '\n') ? 1 : 0;
    CHECK(lines == 2);
}
