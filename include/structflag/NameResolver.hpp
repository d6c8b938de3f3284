#pragma once
/// @file NameResolver.hpp
/// @brief Derives a field's flag name, description and default from its tags

#include <string>

namespace StructFlag {

/// @brief Parsed primary tag: "name,description,default"
struct FlagTag {
    std::string name;
    std::string description;
    std::string defaultValue;
};

/// @brief Result of name resolution for one field
struct ResolvedFlag {
    std::string name;         ///< Hyphenated, prefixed external name
    std::string description;  ///< From the primary tag, empty otherwise
    std::string defaultValue; ///< From the primary tag, empty otherwise
    bool skip = false;        ///< Field resolved to the "-" placeholder
};

/// @brief Split a primary tag into its components
/// @details Components past the third are ignored. Missing components stay empty.
FlagTag parseFlagTag(const std::string& tag);

/// @brief Join prefix and name as "prefix-name", or return name when prefix is empty
std::string makeFlagName(const std::string& prefix, const std::string& name);

/// @brief Replace every '_' with '-'
std::string hyphenate(std::string name);

/// @brief Resolve the external flag name of a field
/// @details Name precedence: primary tag name, then the first segment of the json tag, then
///          the declared name. Underscores become hyphens. A result of "-" sets skip and is
///          never prefixed.
/// @param declaredName Member name as written in the record
/// @param flagTag Primary tag text, may be empty
/// @param jsonTag Secondary tag text, may be empty
/// @param prefix Optional prefix, joined with '-'
ResolvedFlag resolveFlag(const std::string& declaredName, const std::string& flagTag,
                         const std::string& jsonTag, const std::string& prefix);

} // namespace StructFlag
