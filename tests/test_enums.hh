#pragma once

#include <enum-set/define_enum.hh>
#include <enum-set/ordinal_mapping.hh>

namespace es_test
{
ES_ENUM(foo, A, B, C);

ES_ENUM(damage_kind, physical, fire, frost, lightning, poison);

ES_ENUM(nothing);

// exactly the capacity of an enum_set
ES_ENUM(wide,
        v00, v01, v02, v03, v04, v05, v06, v07, v08, v09,
        v10, v11, v12, v13, v14, v15, v16, v17, v18, v19,
        v20, v21, v22, v23, v24, v25, v26, v27, v28, v29,
        v30, v31);

// declared by hand, mapping generated afterwards
enum class texture_usage
{
    sampled,
    storage,
    color_target,
    depth_target,
};
ES_ORDINAL_MAPPING(texture_usage, sampled, storage, color_target, depth_target);

// unscoped enums work too
enum legacy_mode
{
    legacy_off,
    legacy_on,
};
ES_ORDINAL_MAPPING(legacy_mode, legacy_off, legacy_on);

// hand-written mapping with an offset, no generator involved
enum class http_status_class : int
{
    informational = 1,
    success = 2,
    redirection = 3,
    client_error = 4,
    server_error = 5,
};

// more members than an enum_set supports, with a (broken) hand-written mapping that claims eligibility
enum class too_wide : es::u32
{
    // clang-format off
    v00, v01, v02, v03, v04, v05, v06, v07, v08, v09,
    v10, v11, v12, v13, v14, v15, v16, v17, v18, v19,
    v20, v21, v22, v23, v24, v25, v26, v27, v28, v29,
    v30, v31, v32, v33, v34, v35, v36, v37, v38, v39,
    // clang-format on
};
} // namespace es_test

template <>
struct es::ordinal_mapping<es_test::http_status_class>
{
    static es::u32 to_ordinal(es_test::http_status_class c) { return es::u32(c) - 1; }
    static es_test::http_status_class from_ordinal(es::u32 i) { return es_test::http_status_class(int(i) + 1); }
};

template <>
struct es::ordinal_mapping<es_test::too_wide>
{
    static es::u32 to_ordinal(es_test::too_wide v) { return es::u32(v); }
    static es_test::too_wide from_ordinal(es::u32 i) { return es_test::too_wide(i); }
};
