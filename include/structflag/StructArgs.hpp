/**
 * @file include/structflag/StructArgs.hpp
 * @brief 레코드를 "-name=value" 인자 목록으로 변환하는 structToArgs.
 * @details
 * - 숫자, bool, Duration 값은 따옴표 없이, 그 외 값은 quote 로 감싸서 출력합니다.
 * - 레코드 값과 레코드 포인터를 모두 받으며 null 포인터는 에러 로그 후 빈 목록을 돌려줍니다.
 */
#pragma once

#include "structflag/record/FieldMeta.hpp"
#include "structflag/util/Duration.hpp"
#include "structflag/util/StringSet.hpp"
#include "structflag/util/textFormatUtil.hpp"

#include <spdlog/spdlog.h>

#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

namespace StructFlag {

namespace detail {

/// @brief Encode one field value for the command line
/// @details bool, integers, floats and durations are written bare. Everything else is
///          converted with operator<< (std::string as-is) and quoted.
template <typename T> std::string encodeArgValue(const T& v) {
    if constexpr (std::is_same_v<T, bool>) {
        return util::formatBool(v);
    } else if constexpr (std::is_integral_v<T>) {
        return util::formatInteger(v);
    } else if constexpr (std::is_floating_point_v<T>) {
        return util::formatFloat(v);
    } else if constexpr (std::is_same_v<T, Duration>) {
        return util::formatDuration(v);
    } else if constexpr (std::is_same_v<T, std::string>) {
        return util::quote(v);
    } else {
        std::ostringstream os;
        os << v;
        return util::quote(os.str());
    }
}

} // namespace detail

/// @brief Convert a record into arguments of the form "-field-name=value"
/// @details Field names are resolved as in resolveFlag(): flag tag name, then json tag name,
///          then the member name, with '_' replaced by '-'. With a prefix, arguments take the
///          form "-prefix-field-name=value". Fields resolved to "-" and fields whose resolved
///          name is in ignored are left out. Output follows declaration order.
///
///          record may also be a pointer to a record. A null pointer is logged and gives an
///          empty list.
///
///          Not every type written here can be bound by structToFlags().
/// @tparam Record Type declared with SF_RECORD, or a pointer to one
/// @param prefix Name prefix, joined with '-' (empty for none)
/// @param record Record to read
/// @param ignored Resolved names to skip
/// @return Argument list
template <typename Record>
std::vector<std::string> structToArgs(const std::string& prefix, const Record& record,
                                      const StringSet& ignored = {}) {
    if constexpr (std::is_pointer_v<Record>) {
        static_assert(isRecordV<std::remove_cv_t<std::remove_pointer_t<Record>>>,
                      "structToArgs: Record must point to a type declared with SF_RECORD");
        if (!record) {
            spdlog::error("structToArgs: record must not be null");
            return {};
        }
        return structToArgs(prefix, *record, ignored);
    } else {
        static_assert(isRecordV<Record>,
                      "structToArgs: Record must declare its fields with SF_RECORD");

        auto fields = record.structFields();
        std::vector<std::string> args;
        args.reserve(std::tuple_size_v<decltype(fields)>);

        forEachField(fields, [&](const auto& field) {
            using T = typename std::decay_t<decltype(field)>::value_type;
            ResolvedFlag resolved = field.resolve(prefix);
            if (resolved.skip || ignored.contains(resolved.name)) {
                spdlog::debug("structToArgs: skipping field {} ({})", field.name, resolved.name);
                return true;
            }
            args.push_back("-" + resolved.name + "=" + detail::encodeArgValue<T>(*field.ptr));
            return true;
        });
        return args;
    }
}

} // namespace StructFlag
