#pragma once
/// @file FieldKind.hpp
/// @brief Closed set of bindable field kinds

#include "structflag/util/Duration.hpp"

#include <cstdint>
#include <string>
#include <type_traits>

namespace StructFlag {

// =============================================================================
// Field Kind
// =============================================================================

/// @brief Closed set of field kinds a flag can be bound to
enum class FieldKind {
    Bool,
    Int,      ///< int
    Int64,    ///< int64_t
    Uint,     ///< unsigned
    Uint64,   ///< uint64_t
    Float64,  ///< double
    Duration, ///< StructFlag::Duration
    String,   ///< std::string
    Unsupported
};

/// @brief Compile-time kind of a member type
template <typename T> constexpr FieldKind fieldKindOf() {
    using U = std::remove_cv_t<T>;
    if constexpr (std::is_same_v<U, bool>)
        return FieldKind::Bool;
    else if constexpr (std::is_same_v<U, int>)
        return FieldKind::Int;
    else if constexpr (std::is_same_v<U, int64_t>)
        return FieldKind::Int64;
    else if constexpr (std::is_same_v<U, unsigned>)
        return FieldKind::Uint;
    else if constexpr (std::is_same_v<U, uint64_t>)
        return FieldKind::Uint64;
    else if constexpr (std::is_same_v<U, double>)
        return FieldKind::Float64;
    else if constexpr (std::is_same_v<U, Duration>)
        return FieldKind::Duration;
    else if constexpr (std::is_same_v<U, std::string>)
        return FieldKind::String;
    else
        return FieldKind::Unsupported;
}

/// @brief Human-readable kind name, used in log and error messages
inline const char* fieldKindName(FieldKind kind) {
    switch (kind) {
    case FieldKind::Bool:
        return "bool";
    case FieldKind::Int:
        return "int";
    case FieldKind::Int64:
        return "int64";
    case FieldKind::Uint:
        return "uint";
    case FieldKind::Uint64:
        return "uint64";
    case FieldKind::Float64:
        return "float64";
    case FieldKind::Duration:
        return "duration";
    case FieldKind::String:
        return "string";
    case FieldKind::Unsupported:
        break;
    }
    return "unsupported";
}

} // namespace StructFlag
