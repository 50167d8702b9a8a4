#include <enum-set/define_enum.hh>
#include <enum-set/enum_set.hh>
#include <enum-set/ordinal_mapping.hh>

#include <nexus/test.hh>

#include "test_enums.hh"
#include "test_helpers.hh"

#include <string>
#include <vector>

using es_test::damage_kind;
using es_test::foo;
using es_test::legacy_mode;
using es_test::nothing;
using es_test::texture_usage;

// =========================================================================================================
// Broken hand-written mappings
// =========================================================================================================

namespace
{
enum class unmapped
{
    x,
    y,
};

// b and c both map to 1
enum class collide
{
    a,
    b,
    c,
};

// from_ordinal always answers with the first member
enum class forgetful
{
    a,
    b,
};

// ordinals start at 40
enum class shifted
{
    a,
    b,
};

// member list stops before the last member
enum class stage
{
    load,
    link,
    run,
};
ES_ORDINAL_MAPPING(stage, load, link);
} // namespace

template <>
struct es::ordinal_mapping<collide>
{
    static es::u32 to_ordinal(collide v) { return (es::u32(v) + 1) / 2; }
    static collide from_ordinal(es::u32 i) { return collide(i); }
};

template <>
struct es::ordinal_mapping<forgetful>
{
    static es::u32 to_ordinal(forgetful v) { return es::u32(v); }
    static forgetful from_ordinal(es::u32) { return forgetful::a; }
};

template <>
struct es::ordinal_mapping<shifted>
{
    static es::u32 to_ordinal(shifted v) { return es::u32(v) + 40; }
    static shifted from_ordinal(es::u32 i) { return shifted(i - 40); }
};

// =========================================================================================================
// Compile-time checks
// =========================================================================================================

static_assert(es::ordinal_enum<foo>);
static_assert(es::ordinal_enum<texture_usage>);
static_assert(es::ordinal_enum<legacy_mode>);
static_assert(es::ordinal_enum<es_test::http_status_class>);
static_assert(!es::ordinal_enum<unmapped>, "enums without mapping are not eligible");
static_assert(!es::ordinal_enum<int>, "only enumerations are eligible");

static_assert(es::counted_ordinal_enum<damage_kind>);
static_assert(!es::counted_ordinal_enum<es_test::http_status_class>, "hand-written mapping without member_count");

static_assert(es::ordinal_mapping<foo>::member_count == 3);
static_assert(es::ordinal_mapping<nothing>::member_count == 0);
static_assert(es::ordinal_mapping<es_test::wide>::member_count == 32);

static_assert(es::to_ordinal(damage_kind::frost) == 2);
static_assert(es::from_ordinal<damage_kind>(4) == damage_kind::poison);
static_assert(es::verify_ordinal_mapping(es::ordinal_mapping<damage_kind>::members()) == es::mapping_check::ok);
static_assert(es::verify_ordinal_mapping(es::ordinal_mapping<es_test::wide>::members()) == es::mapping_check::ok);

// =========================================================================================================
// Generated mappings
// =========================================================================================================

TEST("ordinal_mapping - ES_ENUM assigns declaration positions")
{
    CHECK(es::to_ordinal(foo::A) == 0);
    CHECK(es::to_ordinal(foo::B) == 1);
    CHECK(es::to_ordinal(foo::C) == 2);

    for (es::u32 i = 0; i < es::ordinal_mapping<damage_kind>::member_count; ++i)
        CHECK(es::to_ordinal(es::from_ordinal<damage_kind>(i)) == i);
}

TEST("ordinal_mapping - members in ordinal order")
{
    auto const members = es::ordinal_mapping<damage_kind>::members();

    REQUIRE(members.size() == 5);
    CHECK(members[0] == damage_kind::physical);
    CHECK(members[1] == damage_kind::fire);
    CHECK(members[4] == damage_kind::poison);

    CHECK(es::ordinal_mapping<nothing>::members().empty());
}

TEST("ordinal_mapping - member names")
{
    CHECK(es::ordinal_mapping<foo>::name(foo::B) == "B");
    CHECK(es::ordinal_mapping<damage_kind>::name(damage_kind::lightning) == "lightning");
    CHECK(es::ordinal_mapping<es_test::wide>::name(es_test::wide::v31) == "v31");

    // emitted next to the enum
    CHECK(to_string(damage_kind::fire) == "fire");
    CHECK(to_string(texture_usage::depth_target) == "depth_target");
}

TEST("ordinal_mapping - existing enums")
{
    SECTION("scoped")
    {
        CHECK(es::to_ordinal(texture_usage::sampled) == 0);
        CHECK(es::to_ordinal(texture_usage::depth_target) == 3);
        CHECK(es::from_ordinal<texture_usage>(2) == texture_usage::color_target);
        CHECK(es::ordinal_mapping<texture_usage>::member_count == 4);
    }

    SECTION("unscoped")
    {
        CHECK(es::to_ordinal(es_test::legacy_off) == 0);
        CHECK(es::to_ordinal(es_test::legacy_on) == 1);
        CHECK(es::from_ordinal<legacy_mode>(1) == es_test::legacy_on);

        es::enum_set<legacy_mode> s = {es_test::legacy_on};
        CHECK(s.to_string() == "{legacy_on}");
    }
}

TEST("ordinal_mapping - hand-written mapping with offset")
{
    using es_test::http_status_class;

    CHECK(es::to_ordinal(http_status_class::informational) == 0);
    CHECK(es::to_ordinal(http_status_class::server_error) == 4);
    CHECK(es::from_ordinal<http_status_class>(1) == http_status_class::success);
}

TEST("ordinal_mapping - from_ordinal without a member asserts")
{
#if ES_ASSERT_ENABLED
    CHECK_ES_ASSERTS(es::from_ordinal<foo>(3));
    CHECK_ES_ASSERTS(es::from_ordinal<damage_kind>(31));
#endif
    CHECK(!es_test::triggers_assertion([] { (void)es::from_ordinal<foo>(2); }));
}

TEST("ordinal_mapping - enums without members")
{
    // there is no member to map, any value reaching the mapping is a defect
    std::string message;
    CHECK(es_test::triggers_assertion([] { (void)es::to_ordinal(nothing{}); }, &message));
    CHECK(message.find("no values") != std::string::npos);

    // sets over them are usable, just always empty
    es::enum_set<nothing> s;
    CHECK(s.empty());
    CHECK(es::enum_set<nothing>::all().empty());
    CHECK(s.to_string() == "{}");
}

// =========================================================================================================
// Mapping verification
// =========================================================================================================

TEST("ordinal_mapping - verify accepts valid mappings")
{
    using es_test::http_status_class;

    CHECK(es::verify_ordinal_mapping(es::ordinal_mapping<foo>::members()) == es::mapping_check::ok);
    CHECK(es::verify_ordinal_mapping(es::ordinal_mapping<texture_usage>::members()) == es::mapping_check::ok);
    CHECK(es::verify_ordinal_mapping(es::ordinal_mapping<nothing>::members()) == es::mapping_check::ok);
    CHECK(es::verify_ordinal_mapping({http_status_class::informational, http_status_class::success,
                                      http_status_class::redirection, http_status_class::client_error,
                                      http_status_class::server_error})
          == es::mapping_check::ok);

    // order of the listed members is irrelevant
    CHECK(es::verify_ordinal_mapping({foo::C, foo::A, foo::B}) == es::mapping_check::ok);
}

TEST("ordinal_mapping - verify reports broken mappings")
{
    SECTION("duplicate ordinal")
    {
        CHECK(es::verify_ordinal_mapping({collide::a, collide::b, collide::c}) == es::mapping_check::duplicate_ordinal);
    }

    SECTION("roundtrip mismatch")
    {
        CHECK(es::verify_ordinal_mapping({forgetful::a, forgetful::b}) == es::mapping_check::roundtrip_mismatch);
    }

    SECTION("ordinal out of range")
    {
        CHECK(es::verify_ordinal_mapping({shifted::a, shifted::b}) == es::mapping_check::ordinal_out_of_range);
    }

    SECTION("too many members")
    {
        std::vector<es_test::too_wide> members;
        for (es::u32 i = 0; i < 40; ++i)
            members.push_back(es_test::too_wide(i));
        CHECK(es::verify_ordinal_mapping(members) == es::mapping_check::too_many_members);
    }

    SECTION("check names")
    {
        CHECK(std::string(es::to_string(es::mapping_check::ok)) == "ok");
        CHECK(std::string(es::to_string(es::mapping_check::duplicate_ordinal)) == "duplicate_ordinal");
    }
}

TEST("ordinal_mapping - broken mappings fail loudly in enum_set")
{
    es::enum_set<shifted> s;
    std::string message;

    CHECK(es_test::triggers_assertion([&] { s.insert(shifted::a); }, &message));
    CHECK(message.find("32") != std::string::npos);
    CHECK(s.empty());
}

TEST("ordinal_mapping - values that are not listed members assert at the boundary")
{
    SECTION("member list that stops early")
    {
        es::enum_set<stage> s;
        CHECK(s.insert(stage::link));

        std::string message;
        CHECK(es_test::triggers_assertion([&] { s.insert(stage::run); }, &message));
        CHECK(message.find("not a listed member") != std::string::npos);
        CHECK_ES_ASSERTS(s.contains(stage::run));
        CHECK_ES_ASSERTS(s.remove(stage::run));

        // the mask only ever holds listed members
        CHECK(s.bits() == 0b10u);
        CHECK(s.to_string() == "{link}");
        CHECK(es::enum_set<stage>::all().size() == 2);
        CHECK(s.is_subset(es::enum_set<stage>::all()));
    }

    SECTION("cast outside of the declared members")
    {
        es::enum_set<foo> s = {foo::A};
        CHECK_ES_ASSERTS(s.insert(foo(3)));
        CHECK_ES_ASSERTS(s.insert(foo(31)));
        CHECK_ES_ASSERTS(es::to_ordinal(foo(3)));

        CHECK(s == es::enum_set<foo>{foo::A});
        CHECK(s.to_string() == "{A}");
    }

    SECTION("listed members are unaffected")
    {
        CHECK(!es_test::triggers_assertion([] { (void)es::to_ordinal(foo::C); }));
        CHECK(!es_test::triggers_assertion([] { (void)es::to_ordinal(stage::link); }));
    }
}
