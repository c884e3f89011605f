#include "util/error.hpp"

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>

using namespace kiln;

namespace {

auto parse_positive(int value) -> Result<int> {
    if (value <= 0) {
        return make_error<int>(ErrorCode::invalid_data, "not positive");
    }
    return value;
}

auto doubled_positive(int value) -> Result<int> {
    int parsed = KILN_TRY(parse_positive(value));
    return parsed * 2;
}

} // namespace

TEST_CASE("error_code_name returns the lowercase names", "[error]") {
    REQUIRE(static_cast<int>(ErrorCode::ok) == 0);
    REQUIRE(std::string(error_code_name(ErrorCode::ok)) == "ok");
    REQUIRE(std::string(error_code_name(ErrorCode::no_free_slot)) == "no_free_slot");
    REQUIRE(std::string(error_code_name(ErrorCode::commit_rejected)) == "commit_rejected");
    REQUIRE(std::string(error_code_name(ErrorCode::import_failed)) == "import_failed");
    REQUIRE(std::string(error_code_name(ErrorCode::unknown_error)) == "unknown_error");
}

TEST_CASE("error_kind buckets codes by runtime policy", "[error]") {
    SECTION("Slot exhaustion is resource exhaustion") {
        REQUIRE(error_kind(ErrorCode::no_free_slot) == ErrorKind::resource_exhaustion);
    }

    SECTION("Per-tick failures are transient") {
        REQUIRE(error_kind(ErrorCode::commit_rejected) == ErrorKind::runtime_transient);
        REQUIRE(error_kind(ErrorCode::import_failed) == ErrorKind::runtime_transient);
        REQUIRE(error_kind(ErrorCode::render_failed) == ErrorKind::runtime_transient);
    }

    SECTION("Client errors stay with the client") {
        REQUIRE(error_kind(ErrorCode::client_failed) == ErrorKind::client_failure);
    }

    SECTION("Startup errors are setup failures") {
        REQUIRE(error_kind(ErrorCode::drm_setup_failed) == ErrorKind::setup_failure);
        REQUIRE(error_kind(ErrorCode::gbm_alloc_failed) == ErrorKind::setup_failure);
        REQUIRE(error_kind(ErrorCode::session_failed) == ErrorKind::setup_failure);
        REQUIRE(error_kind(ErrorCode::device_open_failed) == ErrorKind::setup_failure);
    }

    REQUIRE(std::string(error_kind_name(ErrorKind::resource_exhaustion)) ==
            "resource_exhaustion");
}

TEST_CASE("Error struct construction", "[error]") {
    SECTION("Basic construction") {
        Error error{ErrorCode::file_not_found, "Test message"};
        REQUIRE(error.code == ErrorCode::file_not_found);
        REQUIRE(error.message == "Test message");
        REQUIRE(error.location.file_name() != nullptr);
    }

    SECTION("Construction with custom source location") {
        auto loc = std::source_location::current();
        Error error{ErrorCode::parse_error, "Parse failed", loc};
        REQUIRE(error.location.line() == loc.line());
    }
}

TEST_CASE("make_error captures the call site", "[error]") {
    auto line_before = static_cast<uint32_t>(__LINE__);
    auto result = make_error<int>(ErrorCode::unknown_error, "Test");
    auto line_after = static_cast<uint32_t>(__LINE__);

    REQUIRE(!result);
    REQUIRE(result.error().location.line() > line_before);
    REQUIRE(result.error().location.line() < line_after);
}

TEST_CASE("ResultPtr helpers", "[error]") {
    SECTION("Value") {
        auto result = make_result_ptr(std::make_unique<int>(7));
        REQUIRE(result);
        REQUIRE(**result == 7);
    }

    SECTION("Error") {
        auto result = make_result_ptr_error<int>(ErrorCode::gbm_alloc_failed, "no memory");
        REQUIRE(!result);
        REQUIRE(result.error().code == ErrorCode::gbm_alloc_failed);
    }
}

TEST_CASE("KILN_TRY propagates errors and unwraps values", "[error]") {
    auto ok = doubled_positive(21);
    REQUIRE(ok);
    REQUIRE(*ok == 42);

    auto failed = doubled_positive(-1);
    REQUIRE(!failed);
    REQUIRE(failed.error().code == ErrorCode::invalid_data);
    REQUIRE(failed.error().message == "not positive");
}

TEST_CASE("Result<T> chaining operations", "[error]") {
    SECTION("and_then success case") {
        auto chained = Result<int>{5}.and_then(
            [](int value) -> Result<std::string> { return std::to_string(value); });
        REQUIRE(chained.value() == "5");
    }

    SECTION("and_then error propagation") {
        auto result = make_error<int>(ErrorCode::parse_error, "Bad input");
        auto chained = result.and_then(
            [](int value) -> Result<std::string> { return std::to_string(value); });
        REQUIRE(!chained);
        REQUIRE(chained.error().code == ErrorCode::parse_error);
    }
}
