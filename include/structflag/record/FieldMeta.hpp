/**
 * @file include/structflag/record/FieldMeta.hpp
 * @brief 레코드 필드 메타데이터(FieldMeta)와 SF_RECORD 매크로.
 * @details
 * - 레코드는 SF_RECORD(...) 안에 SF_FIELD / SF_FLAG / SF_JSON / SF_TAGS 로 필드를 선언 순서대로 나열합니다.
 * - structFields() 는 FieldMeta<T> 튜플을 돌려주며 const 레코드에서는 const 포인터를 담습니다.
 * - forEachField 는 fold expression 으로 튜플을 순회하고 콜백이 false 를 돌려주면 즉시 멈춥니다.
 */
#pragma once

#include "structflag/NameResolver.hpp"
#include "structflag/record/FieldKind.hpp"

#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace StructFlag {

// =============================================================================
// FieldMeta Template
// =============================================================================

/// @brief Field metadata structure
/// @tparam T Member type (const-qualified when taken from a const record)
template <typename T> struct FieldMeta {
    const char* name;    ///< Declared member name
    const char* flagTag; ///< Primary tag "name,description,default" ("" if absent)
    const char* jsonTag; ///< Secondary tag, first segment is a fallback name ("" if absent)
    T* ptr;              ///< Pointer to the member

    using value_type = std::remove_cv_t<T>;
    static constexpr FieldKind kind = fieldKindOf<T>();

    /// @brief Resolve the external flag name for this field
    ResolvedFlag resolve(const std::string& prefix) const {
        return resolveFlag(name, flagTag, jsonTag, prefix);
    }
};

// =============================================================================
// Helper Functions
// =============================================================================

/// @brief Create FieldMeta for a member
/// @param name Declared member name
/// @param member Reference to the member
/// @param flagTag Primary tag text
/// @param jsonTag Secondary tag text
template <typename T>
FieldMeta<T> makeField(const char* name, T& member, const char* flagTag = "",
                       const char* jsonTag = "") {
    return FieldMeta<T>{name, flagTag, jsonTag, &member};
}

// =============================================================================
// Record Detection & Tuple Utility Functions
// =============================================================================

/// @brief True when T declares its fields with SF_RECORD
template <typename T, typename = void> struct IsRecord : std::false_type {};

template <typename T>
struct IsRecord<T, std::void_t<decltype(std::declval<const T&>().structFields())>>
    : std::true_type {};

template <typename T> constexpr bool isRecordV = IsRecord<T>::value;

/// @brief Call fn on every field of a field tuple, in declaration order
/// @details fn returns bool. Iteration stops at the first false.
/// @return false if fn stopped the iteration
template <typename Tuple, typename Fn> bool forEachField(const Tuple& fields, Fn&& fn) {
    // fold expression의 && 단락 평가로 첫 실패 지점에서 순회를 멈춘다.
    return std::apply([&fn](const auto&... f) { return (fn(f) && ...); }, fields);
}

} // namespace StructFlag

// =============================================================================
// Simple Macros for Record Definition
// =============================================================================

/// @brief Declare a field without tags (the member name is the flag name)
#define SF_FIELD(member) StructFlag::makeField(#member, member)

/// @brief Declare a field with a primary tag "name,description,default"
#define SF_FLAG(member, tag) StructFlag::makeField(#member, member, tag, "")

/// @brief Declare a field with a secondary json tag "name[,options]"
#define SF_JSON(member, tag) StructFlag::makeField(#member, member, "", tag)

/// @brief Declare a field with both tags
#define SF_TAGS(member, flagTag, jsonTag) StructFlag::makeField(#member, member, flagTag, jsonTag)

/// @brief List the fields of a record, in declaration order
/// @details Generates structFields() for mutable and const access. Leaves access public.
/// @code
/// struct Options {
///     std::string host;
///     int port = 0;
///     SF_RECORD(SF_FIELD(host), SF_FLAG(port, "port,Listen port,8080"))
/// };
/// @endcode
#define SF_RECORD(...)                                                                             \
  public:                                                                                          \
    auto structFields() {                                                                          \
        return std::make_tuple(__VA_ARGS__);                                                       \
    }                                                                                              \
    auto structFields() const {                                                                    \
        return std::make_tuple(__VA_ARGS__);                                                       \
    }                                                                                              \
                                                                                                   \
  public:
