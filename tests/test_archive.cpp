#include "catch.hpp"
#include "iman/archive.hpp"
#include "iman/errors.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

TEST_CASE("extractZip writes stored entries and directories") {
    auto dir = testsupport::makeTempDir("zip_stored");
    const std::string zip = testsupport::buildStoredZip({
        {"galaxy/", ""},
        {"galaxy/main.lua", "-- $Name: Galaxy$\nwalk 'main'\n"},
        {"galaxy/gfx/logo.txt", "logo"},
    });
    testsupport::writeText(dir / "g.zip", zip);

    iman::ExtractStats stats;
    std::string err;
    REQUIRE(iman::extractZip((dir / "g.zip").string(), (dir / "out").string(), stats, err));
    REQUIRE(stats.files == 2);
    REQUIRE(stats.directories == 1);
    REQUIRE(testsupport::readText(dir / "out" / "galaxy" / "main.lua") == "-- $Name: Galaxy$\nwalk 'main'\n");
    REQUIRE(testsupport::readText(dir / "out" / "galaxy" / "gfx" / "logo.txt") == "logo");
}

TEST_CASE("extractZip inflates deflate entries") {
    auto dir = testsupport::makeTempDir("zip_deflate");
    std::string payload;
    for (int i = 0; i < 2000; ++i) payload += "stead.room { nam = 'r" + std::to_string(i) + "' }\n";
    testsupport::writeText(dir / "d.zip", testsupport::buildDeflateZip("main.lua", payload));

    iman::ExtractStats stats;
    std::string err;
    REQUIRE(iman::extractZip((dir / "d.zip").string(), (dir / "out").string(), stats, err));
    REQUIRE(stats.bytes == payload.size());
    REQUIRE(testsupport::readText(dir / "out" / "main.lua") == payload);
}

TEST_CASE("extractZip rejects CRC mismatches") {
    auto dir = testsupport::makeTempDir("zip_crc");
    testsupport::ZipEntry bad{"main.lua", "content", true};
    testsupport::writeText(dir / "bad.zip", testsupport::buildStoredZip({bad}));

    iman::ExtractStats stats;
    std::string err;
    REQUIRE_FALSE(iman::extractZip((dir / "bad.zip").string(), (dir / "out").string(), stats, err));
    REQUIRE(iman::classifyError(err).code == iman::ErrorCode::CorruptArchive);
}

TEST_CASE("extractZip stops inflating past the declared entry size") {
    auto dir = testsupport::makeTempDir("zip_bomb");
    // Highly compressible payload declared as 1 KiB.
    const std::string payload(4 * 1024 * 1024, 'A');
    testsupport::writeText(dir / "bomb.zip", testsupport::buildDeflateZip("main.lua", payload, 1024));

    iman::ExtractStats stats;
    std::string err;
    REQUIRE_FALSE(iman::extractZip((dir / "bomb.zip").string(), (dir / "out").string(), stats, err));
    REQUIRE(err.find("larger than declared size") != std::string::npos);
    REQUIRE(iman::classifyError(err).code == iman::ErrorCode::CorruptArchive);
    std::error_code ec;
    const auto size = fs::file_size(dir / "out" / "main.lua", ec);
    if (!ec) REQUIRE(size <= 1024);
}

TEST_CASE("extractZip rejects path traversal and absolute paths") {
    auto dir = testsupport::makeTempDir("zip_traversal");
    iman::ExtractStats stats;
    std::string err;

    testsupport::writeText(dir / "up.zip", testsupport::buildStoredZip({{"../evil.lua", "x"}}));
    REQUIRE_FALSE(iman::extractZip((dir / "up.zip").string(), (dir / "out").string(), stats, err));
    REQUIRE_FALSE(fs::exists(dir / "evil.lua"));

    testsupport::writeText(dir / "abs.zip", testsupport::buildStoredZip({{"/tmp/evil.lua", "x"}}));
    REQUIRE_FALSE(iman::extractZip((dir / "abs.zip").string(), (dir / "out2").string(), stats, err));

    testsupport::writeText(dir / "mid.zip", testsupport::buildStoredZip({{"a/../../evil.lua", "x"}}));
    REQUIRE_FALSE(iman::extractZip((dir / "mid.zip").string(), (dir / "out3").string(), stats, err));
}

TEST_CASE("extractZip rejects files that are not archives") {
    auto dir = testsupport::makeTempDir("zip_garbage");
    testsupport::writeText(dir / "page.zip", "<html>502 Bad Gateway</html>");
    iman::ExtractStats stats;
    std::string err;
    REQUIRE_FALSE(iman::extractZip((dir / "page.zip").string(), (dir / "out").string(), stats, err));
    REQUIRE(iman::classifyError(err).code == iman::ErrorCode::CorruptArchive);

    REQUIRE_FALSE(iman::extractZip((dir / "missing.zip").string(), (dir / "out").string(), stats, err));
}

TEST_CASE("buildStoredZip padding yields exact archive size") {
    const std::string zip = testsupport::buildStoredZip({{"main.lua", "x"}}, 1000);
    REQUIRE(zip.size() == 1000);
}
