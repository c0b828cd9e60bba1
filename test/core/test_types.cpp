#include <catch2/catch_test_macros.hpp>

#include <peppol_lookup/core/types.hpp>

#include <unordered_set>

using namespace peppol_lookup;

TEST_CASE("ParticipantIdentifier: valid identifier", "[core][types]") {
    auto r = ParticipantIdentifier::Create("0192", "921605900");
    REQUIRE(r.IsOk());
    CHECK(r.Value().SchemeId() == "0192");
    CHECK(r.Value().Value() == "921605900");
    CHECK(r.Value().Canonical() == "0192:921605900");
}

TEST_CASE("ParticipantIdentifier: rejects invalid parts", "[core][types]") {
    SECTION("empty scheme") {
        CHECK(ParticipantIdentifier::Create("", "921605900").IsErr());
    }
    SECTION("empty value") {
        CHECK(ParticipantIdentifier::Create("0192", "").IsErr());
    }
    SECTION("colon in scheme") {
        auto r = ParticipantIdentifier::Create("01:92", "921605900");
        REQUIRE(r.IsErr());
        CHECK(r.Error().find("':'") != std::string::npos);
    }
    SECTION("control character") {
        CHECK(ParticipantIdentifier::Create("0192", "9216\n05900").IsErr());
    }
}

TEST_CASE("ParticipantIdentifier: value may contain colons", "[core][types]") {
    auto r = ParticipantIdentifier::Create("9999", "a:b");
    REQUIRE(r.IsOk());
    CHECK(r.Value().Canonical() == "9999:a:b");
}

TEST_CASE("ParticipantIdentifier::Parse: splits at first colon", "[core][types]") {
    auto r = ParticipantIdentifier::Parse("0192:921605900");
    REQUIRE(r.IsOk());
    CHECK(r.Value().SchemeId() == "0192");
    CHECK(r.Value().Value() == "921605900");

    CHECK(ParticipantIdentifier::Parse("921605900").IsErr());
    CHECK(ParticipantIdentifier::Parse(":921605900").IsErr());
}

TEST_CASE("ParticipantIdentifier: equality and hashing", "[core][types]") {
    auto a = ParticipantIdentifier::Create("0192", "921605900").Value();
    auto b = ParticipantIdentifier::Parse("0192:921605900").Value();
    auto c = ParticipantIdentifier::Create("0088", "921605900").Value();
    CHECK(a == b);
    CHECK(a != c);

    std::unordered_set<ParticipantIdentifier> set{a, b, c};
    CHECK(set.size() == 2);
}
