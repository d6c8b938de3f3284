/**
 * @file structFlagLib/NameResolver.cpp
 * @brief 플래그 태그 해석과 외부 플래그 이름 결정 구현.
 * @details
 * - 태그 문법은 "name,description,default" 이며 네 번째 이후 항목은 무시합니다.
 * - 이름 우선순위는 flag 태그 이름, json 태그 첫 항목, 선언된 멤버 이름 순입니다.
 * - "_" 는 "-" 로 바뀌고, 결과가 "-" 이면 접두어 없이 skip 으로 표시됩니다.
 * - 이 규칙은 structToArgs / structToFlags 양쪽의 출력 이름을 결정하므로 변경 시 두 경로를 함께 확인해야 합니다.
 */
#include "structflag/NameResolver.hpp"

#include <algorithm>

namespace StructFlag {

namespace {

const char* const kSkipPlaceholder = "-";

std::string firstSegment(const std::string& tag) { return tag.substr(0, tag.find(',')); }

} // namespace

FlagTag parseFlagTag(const std::string& tag) {
    FlagTag out;
    if (tag.empty())
        return out;

    // name,description,default 순서. 네 번째 이후 항목은 버린다.
    std::string* parts[] = {&out.name, &out.description, &out.defaultValue};
    size_t start = 0;
    for (std::string* part : parts) {
        size_t comma = tag.find(',', start);
        *part = tag.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::string makeFlagName(const std::string& prefix, const std::string& name) {
    if (prefix.empty())
        return name;
    return prefix + "-" + name;
}

std::string hyphenate(std::string name) {
    std::replace(name.begin(), name.end(), '_', '-');
    return name;
}

ResolvedFlag resolveFlag(const std::string& declaredName, const std::string& flagTag,
                         const std::string& jsonTag, const std::string& prefix) {
    ResolvedFlag out;
    FlagTag tag = parseFlagTag(flagTag);
    out.description = tag.description;
    out.defaultValue = tag.defaultValue;

    std::string name = declaredName;
    if (!tag.name.empty()) {
        name = tag.name;
    } else if (!jsonTag.empty()) {
        // json:",omitempty" 처럼 이름 부분이 비어 있으면 선언된 이름을 유지한다.
        std::string jsonName = firstSegment(jsonTag);
        if (!jsonName.empty())
            name = jsonName;
    }

    name = hyphenate(std::move(name));
    if (name == kSkipPlaceholder) {
        out.name = name;
        out.skip = true;
        return out;
    }
    out.name = makeFlagName(prefix, name);
    return out;
}

} // namespace StructFlag
