#include "util/c_log.hpp"
#include "util/logging.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cstdarg>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>
#include <string>

using namespace kiln;

namespace {

auto format_c(const char* format, ...) -> util::FormattedCLogMessage {
    va_list args;
    va_start(args, format);
    auto formatted = util::format_c_log_message(format, args);
    va_end(args);
    return formatted;
}

} // namespace

TEST_CASE("initialize_logger creates global logger", "[logging]") {
    SECTION("Basic initialization") {
        initialize_logger("test_basic");
        REQUIRE(get_logger() != nullptr);
    }

    SECTION("Multiple initializations are safe") {
        auto logger1 = get_logger();
        initialize_logger("test_multiple");
        auto logger2 = get_logger();

        REQUIRE(logger1 == logger2);
        REQUIRE(logger1->name() == logger2->name());
    }
}

TEST_CASE("set_log_level changes logger level", "[logging]") {
    initialize_logger("level_test");

    SECTION("Set to trace level") {
        set_log_level(spdlog::level::trace);
        REQUIRE(get_logger()->level() == spdlog::level::trace);
    }

    SECTION("Set to critical level") {
        set_log_level(spdlog::level::critical);
        REQUIRE(get_logger()->level() == spdlog::level::critical);
    }
}

TEST_CASE("parse_log_level accepts config names", "[logging]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("critical") == spdlog::level::critical);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("add_log_file mirrors output into a file", "[logging]") {
    initialize_logger("file_test");
    set_log_level(spdlog::level::info);

    auto path = std::filesystem::temp_directory_path() / "kiln-test-log-file.log";
    std::filesystem::remove(path);

    REQUIRE(add_log_file(path));
    KILN_LOG_INFO("file sink marker {}", 1234);
    get_logger()->flush();

    std::ifstream file(path);
    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    REQUIRE(contents.find("file sink marker 1234") != std::string::npos);

    // Keep later tests off the file.
    get_logger()->sinks().pop_back();
    std::filesystem::remove(path);
}

TEST_CASE("add_log_file reports unwritable paths", "[logging]") {
    auto result = add_log_file("/nonexistent-dir/kiln/test.log");
    REQUIRE(!result);
    REQUIRE(result.error().code == ErrorCode::file_read_failed);
}

TEST_CASE("logging macros compile and execute", "[logging]") {
    initialize_logger("macro_test");
    set_log_level(spdlog::level::trace);

    KILN_LOG_TRACE("Trace message: {}", 42);
    KILN_LOG_DEBUG("Debug message: {}", "test");
    KILN_LOG_INFO("Info message");
    KILN_LOG_WARN("Warning message: {}", 3.14);
    KILN_LOG_ERROR("Error message: {}", true);
    KILN_LOG_CRITICAL("Critical message");

    REQUIRE(true);
}

TEST_CASE("format_c_log_message formats C library callbacks", "[logging]") {
    SECTION("printf arguments") {
        auto formatted = format_c("device %s opened as fd %d", "card0", 7);
        REQUIRE(formatted.status == util::CLogFormatStatus::ok);
        REQUIRE(formatted.message == "device card0 opened as fd 7");
    }

    SECTION("trailing newlines are stripped") {
        auto formatted = format_c("seat enabled\n\n");
        REQUIRE(formatted.message == "seat enabled");
    }

    SECTION("long messages are not truncated") {
        std::string long_text(2000, 'x');
        auto formatted = format_c("%s", long_text.c_str());
        REQUIRE(formatted.status == util::CLogFormatStatus::ok);
        REQUIRE(formatted.message == long_text);
    }

    SECTION("null format") {
        auto formatted = format_c(nullptr);
        REQUIRE(formatted.status == util::CLogFormatStatus::null_format);
    }
}
