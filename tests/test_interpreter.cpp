#include "catch.hpp"
#include "iman/interpreter.hpp"
#include "iman/process.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

TEST_CASE("find returns the first existing candidate and leaves the verdict to check") {
    auto dir = testsupport::makeTempDir("interp_candidates");
    testsupport::writeText(dir / "plain-file", "not executable");
    testsupport::writeScript(dir / "second", "echo 2\n");

    iman::InterpreterLocator locator(dir.string(),
                                     {(dir / "missing").string(), (dir / "plain-file").string(),
                                      (dir / "second").string()},
                                     std::string());
    auto found = locator.find();
    REQUIRE(found);
    REQUIRE(*found == (dir / "plain-file").string());

    std::string version;
    iman::ErrorInfo err;
    REQUIRE_FALSE(locator.check(*found, version, err));
    REQUIRE(err.category == iman::ErrorCategory::Subprocess);
    REQUIRE(err.code == iman::ErrorCode::SpawnFailed);

    // locate() still reports the path, just without a verified version.
    auto candidate = locator.locate(true);
    REQUIRE(candidate);
    REQUIRE(candidate->commandPath == (dir / "plain-file").string());
    REQUIRE_FALSE(candidate->verifiedVersion);
}

TEST_CASE("find on PATH accepts files that are present but not executable") {
    auto dir = testsupport::makeTempDir("interp_path_plain");
    testsupport::writeText(dir / "bin" / "sdl-instead", "not executable");

    iman::InterpreterLocator locator(dir.string(), {}, (dir / "bin").string());
    auto found = locator.find();
    REQUIRE(found);
    REQUIRE(*found == (dir / "bin" / "sdl-instead").string());
}

TEST_CASE("find falls back to PATH lookup by binary name") {
    auto dir = testsupport::makeTempDir("interp_path");
    fs::create_directories(dir / "a");
    testsupport::writeScript(dir / "b" / "instead", "echo b\n");
    testsupport::writeScript(dir / "c" / "sdl-instead", "echo c\n");

    const std::string path = (dir / "a").string() + ":" + (dir / "b").string() + ":" + (dir / "c").string();
    iman::InterpreterLocator locator(dir.string(), {}, path);
    auto found = locator.find();
    REQUIRE(found);
    // Binary names are tried in order; sdl-instead wins over an earlier "instead".
    REQUIRE(*found == (dir / "c" / "sdl-instead").string());

    iman::InterpreterLocator nothing(dir.string(), {}, (dir / "a").string());
    REQUIRE_FALSE(nothing.find());
    REQUIRE_FALSE(nothing.locate(true));
}

TEST_CASE("check strips line breaks from the reported version") {
    auto dir = testsupport::makeTempDir("interp_check");
    testsupport::writeScript(dir / "sdl-instead", "[ \"$1\" = \"-version\" ] || exit 9\nprintf '3.3.2\\r\\n'\n");

    iman::InterpreterLocator locator(dir.string(), {(dir / "sdl-instead").string()}, std::string());
    std::string version;
    iman::ErrorInfo err;
    REQUIRE(locator.check((dir / "sdl-instead").string(), version, err));
    REQUIRE(version == "3.3.2");
    REQUIRE_FALSE(err);

    auto candidate = locator.locate(true);
    REQUIRE(candidate);
    REQUIRE(candidate->verifiedVersion == std::optional<std::string>("3.3.2"));
}

TEST_CASE("check reports failures as subprocess errors") {
    auto dir = testsupport::makeTempDir("interp_fail");
    testsupport::writeScript(dir / "broken", "echo oops\nexit 3\n");
    iman::InterpreterLocator locator(dir.string(), {}, std::string());

    std::string version = "stale";
    iman::ErrorInfo err;
    REQUIRE_FALSE(locator.check((dir / "broken").string(), version, err));
    REQUIRE(err.category == iman::ErrorCategory::Subprocess);
    REQUIRE(err.code == iman::ErrorCode::NonZeroExit);
    REQUIRE(version.empty());
    REQUIRE(err.userMessage == "INSTEAD check failed!");

    REQUIRE_FALSE(locator.check("/bin/nonexistent-instead-binary", version, err));
    REQUIRE(err.category == iman::ErrorCategory::Subprocess);
    REQUIRE(err.code == iman::ErrorCode::SpawnFailed);
    REQUIRE(version.empty());
}

TEST_CASE("built-in interpreter lives next to the executable") {
    auto dir = testsupport::makeTempDir("interp_builtin");
    iman::InterpreterLocator without(dir.string(), {}, std::string());
    REQUIRE_FALSE(without.hasBuiltin());
    REQUIRE(without.findBuiltin().empty());

    testsupport::writeScript(dir / "instead" / "sdl-instead", "echo builtin\nexit 1\n");
    iman::InterpreterLocator locator(dir.string(), {}, std::string());
    REQUIRE(locator.hasBuiltin());
    REQUIRE(locator.findBuiltin() == (dir / "instead" / "sdl-instead").string());
    REQUIRE(locator.isBuiltin("./instead/sdl-instead"));
    REQUIRE_FALSE(locator.isBuiltin("/usr/bin/sdl-instead"));

    std::string version;
    iman::ErrorInfo err;
    REQUIRE_FALSE(locator.check("./instead/sdl-instead", version, err));
    REQUIRE(err.userMessage == "INSTEAD built-in check failed!");
}

TEST_CASE("runCapture collects stdout and exit status") {
    iman::ProcessOutput out;
    std::string err;
    REQUIRE(iman::runCapture({"/bin/sh", "-c", "echo hello; exit 4"}, 5, out, err));
    REQUIRE(out.stdoutText == "hello\n");
    REQUIRE(out.exitCode == 4);
}

TEST_CASE("runCapture kills children that exceed the timeout") {
    iman::ProcessOutput out;
    std::string err;
    REQUIRE_FALSE(iman::runCapture({"/bin/sh", "-c", "sleep 30"}, 1, out, err));
    REQUIRE(err.find("timed out") != std::string::npos);
}
