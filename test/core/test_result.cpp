#include <catch2/catch_test_macros.hpp>

#include <peppol_lookup/core/result.hpp>

#include <string>

using namespace peppol_lookup;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok holds value", "[core][result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err holds error", "[core][result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result<void>: Ok and Err", "[core][result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: ToString includes endpoint and status", "[core][error]") {
    Error e{"FetchDocumentTypes", "http://smp.example/x", 500, "boom",
            ErrorCategory::HttpStatus};
    CHECK(e.ToString() == "FetchDocumentTypes [http://smp.example/x] (HTTP 500): boom");
}

TEST_CASE("Error: ToString omits missing parts", "[core][error]") {
    Error e{"ConfigLoader", "", std::nullopt, "bad flag", ErrorCategory::Config};
    CHECK(e.ToString() == "ConfigLoader: bad flag");
}

TEST_CASE("Error: exit codes by category", "[core][error]") {
    Error e;
    e.category = ErrorCategory::Connection;
    CHECK(e.ExitCode() == 1);
    e.category = ErrorCategory::Config;
    CHECK(e.ExitCode() == 2);
    e.category = ErrorCategory::HttpStatus;
    CHECK(e.ExitCode() == 4);
    e.category = ErrorCategory::MalformedResponse;
    CHECK(e.ExitCode() == 5);
    e.category = ErrorCategory::Timeout;
    CHECK(e.ExitCode() == 10);
    e.category = ErrorCategory::Internal;
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: no category exits with the not-a-participant code", "[core][error]") {
    // 3 is reserved for an unregistered participant, which is not an Error.
    for (auto category : {ErrorCategory::Connection, ErrorCategory::NotFound,
                          ErrorCategory::Timeout, ErrorCategory::HttpStatus,
                          ErrorCategory::MalformedResponse, ErrorCategory::Config,
                          ErrorCategory::Internal}) {
        Error e;
        e.category = category;
        CHECK(e.ExitCode() != 3);
        CHECK(e.ExitCode() != 0);
    }
}

TEST_CASE("Error: ToJson carries category and exit code", "[core][error]") {
    Error e{"Get", "http://smp.example/x", std::nullopt, "HTTP request failed: Connection",
            ErrorCategory::Connection};
    auto json = e.ToJson();
    CHECK(json.find("\"category\":\"connection\"") != std::string::npos);
    CHECK(json.find("\"exit_code\":1") != std::string::npos);
    CHECK(json.find("\"endpoint\":\"http://smp.example/x\"") != std::string::npos);
    CHECK(json.find("http_status") == std::string::npos);
}

TEST_CASE("Error::FromHttpStatus: 404 maps to NotFound", "[core][error]") {
    auto e = Error::FromHttpStatus("FetchDocumentTypes", "/x", 404);
    CHECK(e.category == ErrorCategory::NotFound);
    CHECK(e.http_status == 404);
    CHECK(e.message == "Participant unknown to the metadata publisher");
}

TEST_CASE("Error::FromHttpStatus: 503 maps to Connection", "[core][error]") {
    auto e = Error::FromHttpStatus("FetchDocumentTypes", "/x", 503);
    CHECK(e.category == ErrorCategory::Connection);
}

TEST_CASE("Error::FromHttpStatus: body snippet is collapsed to one line", "[core][error]") {
    auto e = Error::FromHttpStatus("FetchDocumentTypes", "/x", 500,
                                   "  Internal\n\n   failure\t ");
    CHECK(e.category == ErrorCategory::HttpStatus);
    CHECK(e.message == "Metadata publisher internal error: Internal failure");
}

TEST_CASE("Error::FromHttpStatus: long body is truncated", "[core][error]") {
    auto e = Error::FromHttpStatus("FetchDocumentTypes", "/x", 418, std::string(1000, 'x'));
    CHECK(e.message.rfind("Unexpected HTTP 418: ", 0) == 0);
    CHECK(e.message.size() < 300);
    CHECK(e.message.substr(e.message.size() - 3) == "...");
}
