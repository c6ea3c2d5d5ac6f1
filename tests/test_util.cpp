#include "catch.hpp"
#include "iman/util.hpp"

TEST_CASE("foldCase handles Cyrillic and expanding folds") {
    REQUIRE(iman::util::foldCase("Галактика") == "галактика");
    REQUIRE(iman::util::foldCase("Straße") == "strasse");
    REQUIRE(iman::util::iequals("Ру", "ру"));
    REQUIRE_FALSE(iman::util::iequals("ру", "en"));
    REQUIRE(iman::util::icontains("Возвращение Квантового Кота", "квантового"));
    REQUIRE(iman::util::icontains("anything", ""));
    REQUIRE(iman::util::icompare("апельсин", "Банан") < 0);
    REQUIRE(iman::util::icompare("Alpha", "alpha") == 0);
}

TEST_CASE("parseIsoTimestamp accepts dates, UTC and numeric offsets") {
    int64_t ts = 0;
    REQUIRE(iman::util::parseIsoTimestamp("2019-05-01", ts));
    REQUIRE(ts == 1556668800);
    REQUIRE(iman::util::parseIsoTimestamp("2019-05-01 00:00", ts));
    REQUIRE(ts == 1556668800);
    REQUIRE(iman::util::parseIsoTimestamp("2019-05-01T00:00:00Z", ts));
    REQUIRE(ts == 1556668800);
    REQUIRE(iman::util::parseIsoTimestamp("2019-05-01T03:00:00+03:00", ts));
    REQUIRE(ts == 1556668800);
    REQUIRE(iman::util::parseIsoTimestamp("2019-04-30T23:00:00-01", ts));
    REQUIRE(ts == 1556668800);
}

TEST_CASE("parseIsoTimestamp rejects trailing text it cannot interpret") {
    int64_t ts = 0;
    REQUIRE_FALSE(iman::util::parseIsoTimestamp("2019-05-01T00:00:00 MSK", ts));
    REQUIRE_FALSE(iman::util::parseIsoTimestamp("2019-05-01T00:00:00+3", ts));
    REQUIRE_FALSE(iman::util::parseIsoTimestamp("2019-05-01T00:00:00+25:00", ts));
    REQUIRE_FALSE(iman::util::parseIsoTimestamp("2019-13-01", ts));
    REQUIRE_FALSE(iman::util::parseIsoTimestamp("yesterday", ts));
}
