#include "catch.hpp"
#include "iman/errors.hpp"

TEST_CASE("classifyError maps HTTP status") {
    iman::ErrorInfo info = iman::classifyError("HTTP 503 Service Unavailable", iman::ErrorCategory::Network);
    REQUIRE(info.category == iman::ErrorCategory::Http);
    REQUIRE(info.code == iman::ErrorCode::HttpStatus);
    REQUIRE(info.httpStatus == 503);
    REQUIRE(info.retryable);

    info = iman::classifyError("HTTP 404 Not Found");
    REQUIRE(info.code == iman::ErrorCode::HttpNotFound);
    REQUIRE_FALSE(info.retryable);
}

TEST_CASE("classifyError maps unsupported scheme") {
    iman::ErrorInfo info = iman::classifyError("Protocol not supported: ftp://x/game.zip", iman::ErrorCategory::Network);
    REQUIRE(info.category == iman::ErrorCategory::Unsupported);
    REQUIRE(info.code == iman::ErrorCode::UnsupportedFeature);
    REQUIRE_FALSE(info.retryable);
}

TEST_CASE("classifyError maps network failures") {
    REQUIRE(iman::classifyError("DNS lookup failed for host: nowhere").code == iman::ErrorCode::DnsFailure);
    REQUIRE(iman::classifyError("Recv timed out").code == iman::ErrorCode::Timeout);
    REQUIRE(iman::classifyError("Connect failed: Connection refused (h:80)").code == iman::ErrorCode::ConnectFailure);
    REQUIRE(iman::classifyError("Too many redirects fetching http://x").code == iman::ErrorCode::TransportFailure);
    REQUIRE(iman::classifyError("Recv failed: reset").category == iman::ErrorCategory::Network);
    REQUIRE(iman::classifyError("Transfer timed out: Operation too slow").code == iman::ErrorCode::Timeout);
    REQUIRE(iman::classifyError("TLS handshake failed: SSL certificate problem").code ==
            iman::ErrorCode::ConnectFailure);
}

TEST_CASE("classifyError maps storage and archive failures") {
    iman::ErrorInfo info = iman::classifyError("Write failed: /games/x.part");
    REQUIRE(info.category == iman::ErrorCategory::Filesystem);
    REQUIRE(info.code == iman::ErrorCode::WriteFailed);

    REQUIRE(iman::classifyError("Not enough free space: need 2 MB").code == iman::ErrorCode::NoSpace);
    REQUIRE(iman::classifyError("Corrupt zip: CRC mismatch for a.lua").code == iman::ErrorCode::CorruptArchive);
    REQUIRE(iman::classifyError("Failed to parse index JSON").code == iman::ErrorCode::ParseFailure);
}

TEST_CASE("classifyError falls back to the hint, then Internal") {
    REQUIRE(iman::classifyError("something odd", iman::ErrorCategory::Network).category == iman::ErrorCategory::Network);
    REQUIRE(iman::classifyError("something odd").category == iman::ErrorCategory::Internal);
}

TEST_CASE("makeError and describeError") {
    iman::ErrorInfo none;
    REQUIRE_FALSE(static_cast<bool>(none));

    iman::ErrorInfo e = iman::makeError(iman::ErrorCategory::NotFound, iman::ErrorCode::GameNotFound, "no match for zzz");
    REQUIRE(static_cast<bool>(e));
    REQUIRE(e.userMessage == "Not found.");
    REQUIRE(iman::describeError(e) == "NotFound: Not found. (no match for zzz)");
}
