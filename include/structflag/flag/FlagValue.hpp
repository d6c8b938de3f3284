#pragma once
/// @file FlagValue.hpp
/// @brief Polymorphic flag value interface and the typed binding implementation

#include "structflag/record/FieldKind.hpp"
#include "structflag/util/ValueCodec.hpp"

#include <string>
#include <system_error>
#include <type_traits>
#include <utility>

namespace StructFlag {

/// @brief Value held by a registered flag
/// @details Implementations write into storage owned by the caller.
///          Custom value types may be registered through FlagSet::var().
class FlagValue {
  public:
    virtual ~FlagValue() = default;

    /// @brief Current value in canonical form
    virtual std::string toString() const = 0;

    /// @brief Parse and store a value
    /// @param s Text from the command line
    /// @param ec Parse error on failure
    /// @return true on success. Storage is unchanged on failure
    virtual bool set(const std::string& s, std::error_code& ec) = 0;

    /// @brief Type word shown by FlagSet::printDefaults ("" for booleans)
    virtual const char* typeName() const = 0;

    /// @brief Canonical form of the type's zero value
    virtual std::string zeroString() const = 0;

    /// @brief True when "-name" alone means "-name=true"
    virtual bool isBoolFlag() const { return false; }
};

/// @brief Binding of a flag to a caller-owned T
/// @tparam T One of the bindable kinds (see FieldKind)
template <typename T> class TypedValue : public FlagValue {
    static_assert(fieldKindOf<T>() != FieldKind::Unsupported,
                  "TypedValue: unsupported field kind");

  public:
    /// @brief Bind to *p and store the default
    /// @param p Caller-owned storage. Must outlive the binding
    /// @param value Default value, written to *p immediately
    TypedValue(T* p, T value) : p_(p) { *p_ = std::move(value); }

    std::string toString() const override { return util::formatValue(*p_); }

    bool set(const std::string& s, std::error_code& ec) override {
        T v{};
        if (!util::parseValue(s, v, ec))
            return false;
        *p_ = std::move(v);
        return true;
    }

    const char* typeName() const override {
        switch (fieldKindOf<T>()) {
        case FieldKind::Bool:
            return "";
        case FieldKind::Int:
        case FieldKind::Int64:
            return "int";
        case FieldKind::Uint:
        case FieldKind::Uint64:
            return "uint";
        case FieldKind::Float64:
            return "float";
        case FieldKind::Duration:
            return "duration";
        case FieldKind::String:
            return "string";
        case FieldKind::Unsupported:
            break;
        }
        return "value";
    }

    std::string zeroString() const override { return util::formatValue(T{}); }

    bool isBoolFlag() const override { return std::is_same_v<T, bool>; }

  private:
    T* p_;
};

} // namespace StructFlag
