#pragma once
/// @file ValueCodec.hpp
/// @brief Kind-dispatched parse/format of bindable values

#include "structflag/record/FieldKind.hpp"
#include "structflag/util/Duration.hpp"
#include "structflag/util/textFormatUtil.hpp"

#include <string>
#include <system_error>

namespace StructFlag::util {

/// @brief Parse s into a bindable value
/// @tparam T One of the bindable kinds (see FieldKind)
/// @param s Input text
/// @param out Parsed value (unchanged on failure)
/// @param ec invalid_argument or result_out_of_range on failure
/// @return true on success
template <typename T> bool parseValue(const std::string& s, T& out, std::error_code& ec) {
    constexpr FieldKind kind = fieldKindOf<T>();
    if constexpr (kind == FieldKind::Bool) {
        return parseBool(s, out, ec);
    } else if constexpr (kind == FieldKind::Int) {
        return parseInt(s, out, ec);
    } else if constexpr (kind == FieldKind::Int64) {
        return parseInt64(s, out, ec);
    } else if constexpr (kind == FieldKind::Uint) {
        return parseUint(s, out, ec);
    } else if constexpr (kind == FieldKind::Uint64) {
        return parseUint64(s, out, ec);
    } else if constexpr (kind == FieldKind::Float64) {
        return parseFloat64(s, out, ec);
    } else if constexpr (kind == FieldKind::Duration) {
        return parseDuration(s, out, ec);
    } else if constexpr (kind == FieldKind::String) {
        ec.clear();
        out = s;
        return true;
    } else {
        static_assert(kind != FieldKind::Unsupported, "parseValue: unsupported field kind");
        return false;
    }
}

/// @brief Canonical text form of a bindable value
template <typename T> std::string formatValue(const T& v) {
    constexpr FieldKind kind = fieldKindOf<T>();
    if constexpr (kind == FieldKind::Bool) {
        return formatBool(v);
    } else if constexpr (kind == FieldKind::Int || kind == FieldKind::Int64 ||
                         kind == FieldKind::Uint || kind == FieldKind::Uint64) {
        return formatInteger(v);
    } else if constexpr (kind == FieldKind::Float64) {
        return formatFloat(v);
    } else if constexpr (kind == FieldKind::Duration) {
        return formatDuration(v);
    } else if constexpr (kind == FieldKind::String) {
        return v;
    } else {
        static_assert(kind != FieldKind::Unsupported, "formatValue: unsupported field kind");
        return std::string();
    }
}

} // namespace StructFlag::util
