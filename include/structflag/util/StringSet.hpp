#pragma once
/// @file StringSet.hpp
/// @brief Set of resolved flag names used to exclude fields

#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

namespace StructFlag {

/// @brief Membership filter over resolved flag names
/// @details Names are compared after resolution: hyphenated and prefixed,
///          e.g. "test-yes-no" rather than "yes_no".
class StringSet {
  public:
    StringSet() = default;

    StringSet(std::initializer_list<std::string> names) : names_(names) {}

    explicit StringSet(const std::vector<std::string>& names)
        : names_(names.begin(), names.end()) {}

    /// @brief Checks membership
    bool contains(const std::string& name) const { return names_.count(name) != 0; }

    void insert(const std::string& name) { names_.insert(name); }

    size_t size() const noexcept { return names_.size(); }

    bool empty() const noexcept { return names_.empty(); }

    /// @brief Members under a dotted prefix, with the prefix segment removed
    /// @details Each member is split at its first '.'. When the leading segment equals
    ///          prefix the remainder is kept. {"db.host", "db.port", "log"} with "db"
    ///          yields {"host", "port"}. Members without '.' never match.
    /// @param prefix Leading segment to select
    /// @return New set with the remainders
    StringSet subSet(const std::string& prefix) const {
        StringSet out;
        for (const auto& name : names_) {
            size_t dot = name.find('.');
            if (dot == std::string::npos)
                continue;
            if (name.compare(0, dot, prefix) == 0)
                out.insert(name.substr(dot + 1));
        }
        return out;
    }

  private:
    std::unordered_set<std::string> names_;
};

} // namespace StructFlag
