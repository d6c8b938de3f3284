/**
 * @file include/structflag/StructFlags.hpp
 * @brief 레코드 필드를 FlagSet 에 바인딩하는 structToFlags.
 * @details
 * - 모든 필드를 먼저 검증한 뒤에만 등록하므로, 실패한 호출은 레지스트리와 레코드를 모두 변경하지 않습니다.
 * - 잘못된 태그 기본값은 기본적으로 경고 후 0 값으로 대체되며 BindOptions::strictDefaults 로 오류 처리할 수 있습니다.
 * - 지원하지 않는 필드 타입은 컴파일 타임에 분기되어 not_supported 로 보고됩니다.
 */
#pragma once

#include "structflag/flag/FlagSet.hpp"
#include "structflag/flag/FlagValue.hpp"
#include "structflag/record/FieldMeta.hpp"
#include "structflag/util/StringSet.hpp"
#include "structflag/util/ValueCodec.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <type_traits>
#include <vector>

namespace StructFlag {

/// @brief Options for structToFlags()
struct BindOptions {
    /// @brief Fail on a default value that does not parse
    /// @details When false, a malformed default is replaced by the zero value and a warning
    ///          is logged.
    bool strictDefaults = false;
};

/// @brief Register the fields of a record as flags
/// @details Each field is registered under its resolved name (see resolveFlag()) with the
///          description and default from its flag tag. The default is written into the field
///          at registration, and flags.parse() later overwrites fields that appear in the
///          arguments. Must be called before flags.parse().
///
///          Supported field types: bool, int, int64_t, unsigned, uint64_t, double, Duration,
///          std::string.
///
///          All fields are checked before any is registered, so on failure neither flags nor
///          record is modified.
/// @tparam Record Type declared with SF_RECORD
/// @param flags Registry to register into
/// @param prefix Name prefix, joined with '-' (empty for none)
/// @param record Record to bind. Must outlive the bindings in flags
/// @param ignored Resolved names to skip
/// @param ec Error code:
///        - invalid_argument: null record, invalid resolved name, malformed default (strict)
///        - not_supported: field type outside the supported set
///        - file_exists: resolved name already registered or repeated within the record
///        - result_out_of_range: default out of range (strict)
/// @param options Binding options
/// @return true on success
template <typename Record>
bool structToFlags(FlagSet& flags, const std::string& prefix, Record* record,
                   const StringSet& ignored, std::error_code& ec,
                   const BindOptions& options = BindOptions()) {
    static_assert(isRecordV<Record>,
                  "structToFlags: Record must declare its fields with SF_RECORD");
    ec.clear();
    if (!record) {
        spdlog::error("structToFlags: record must not be null");
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    struct PendingFlag {
        std::string name;
        std::string usage;
        std::function<std::unique_ptr<FlagValue>()> make;
    };
    std::vector<PendingFlag> pending;
    std::set<std::string> names;

    // 1단계: 모든 필드를 검증하고 등록 작업만 모아둔다.
    // TypedValue 생성 시 기본값이 필드에 기록되므로 실제 생성은 2단계까지 미룬다.
    auto fields = record->structFields();
    bool ok = forEachField(fields, [&](const auto& field) {
        using Meta = std::decay_t<decltype(field)>;
        using T = typename Meta::value_type;

        ResolvedFlag resolved = field.resolve(prefix);
        if (resolved.skip || ignored.contains(resolved.name)) {
            spdlog::debug("structToFlags: skipping field {} ({})", field.name, resolved.name);
            return true;
        }

        if constexpr (Meta::kind == FieldKind::Unsupported) {
            spdlog::error("structToFlags: invalid field type for field {} (-{})", field.name,
                          resolved.name);
            ec = std::make_error_code(std::errc::not_supported);
            return false;
        } else {
            if (!FlagSet::isValidName(resolved.name)) {
                spdlog::error("structToFlags: field {} resolves to invalid flag name '{}'",
                              field.name, resolved.name);
                ec = std::make_error_code(std::errc::invalid_argument);
                return false;
            }
            if (flags.lookup(resolved.name) || !names.insert(resolved.name).second) {
                spdlog::error("structToFlags: flag redefined: {}", resolved.name);
                ec = std::make_error_code(std::errc::file_exists);
                return false;
            }

            T def{};
            if (!resolved.defaultValue.empty()) {
                std::error_code parseEc;
                if (!util::parseValue(resolved.defaultValue, def, parseEc)) {
                    if (options.strictDefaults) {
                        spdlog::error("structToFlags: malformed default '{}' for -{} ({})",
                                      resolved.defaultValue, resolved.name, fieldKindName(Meta::kind));
                        ec = parseEc;
                        return false;
                    }
                    spdlog::warn("structToFlags: malformed default '{}' for -{} ({}), using zero "
                                 "value",
                                 resolved.defaultValue, resolved.name, fieldKindName(Meta::kind));
                    def = T{};
                }
            }

            T* ptr = field.ptr;
            pending.push_back(PendingFlag{resolved.name, resolved.description, [ptr, def]() {
                                              return std::unique_ptr<FlagValue>(
                                                  std::make_unique<TypedValue<T>>(ptr, def));
                                          }});
            return true;
        }
    });
    if (!ok)
        return false;

    // 2단계: 검증을 통과한 필드만 등록한다.
    for (auto& p : pending) {
        if (!flags.var(p.make(), p.name, p.usage, ec))
            return false;
        spdlog::debug("structToFlags: bound -{}", p.name);
    }
    return true;
}

/// @brief structToFlags() without ignored fields
template <typename Record>
bool structToFlags(FlagSet& flags, const std::string& prefix, Record* record,
                   std::error_code& ec) {
    return structToFlags(flags, prefix, record, StringSet(), ec);
}

} // namespace StructFlag
