/**
 * @file structFlagLib/flag/FlagSet.cpp
 * @brief FlagSet 등록, 인자 파싱, 사용법 출력 구현.
 * @details
 * - 파싱 규칙은 Go flag 패키지와 같습니다: -x, --x, -x=v, -x v, "--" 종료, 첫 비플래그 인자에서 중단.
 * - 실패는 std::error_code 로 전달하며, ExitOnError 모드에서만 프로세스를 종료합니다 (help 0, 그 외 2).
 * - 사용자에게 보이는 메시지와 사용법은 output() 스트림으로, 내부 추적은 spdlog debug 로 남깁니다.
 * - printDefaults 출력 형식은 테스트가 문자 단위로 고정하고 있으므로 수정 시 FlagSetTest 를 함께 갱신해야 합니다.
 */
#include "structflag/flag/FlagSet.hpp"
#include "structflag/util/textFormatUtil.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <sstream>

namespace StructFlag {

namespace {

/// @brief Split a backquoted word out of the usage text
/// @details "a `file` to read" gives name "file" and usage "a file to read".
///          Without backquotes the value's type word is used as the name.
void unquoteUsage(const Flag& flag, std::string& name, std::string& usage) {
    usage = flag.usage;
    size_t open = usage.find('`');
    if (open != std::string::npos) {
        size_t close = usage.find('`', open + 1);
        if (close != std::string::npos) {
            name = usage.substr(open + 1, close - open - 1);
            usage = usage.substr(0, open) + name + usage.substr(close + 1);
            return;
        }
    }
    name = flag.value->typeName();
}

std::string valueErrorText(const std::error_code& ec) {
    if (ec == std::errc::result_out_of_range)
        return "value out of range";
    return "parse error";
}

} // namespace

FlagSet::FlagSet(std::string name, ErrorHandling errorHandling)
    : name_(std::move(name)), errorHandling_(errorHandling), output_(&std::cerr) {}

// =============================================================================
// Registration
// =============================================================================

bool FlagSet::isValidName(const std::string& name) {
    return !name.empty() && name[0] != '-' && name.find('=') == std::string::npos;
}

bool FlagSet::var(std::unique_ptr<FlagValue> value, const std::string& name,
                  const std::string& usage, std::error_code& ec) {
    ec.clear();
    if (!value || !isValidName(name)) {
        output() << "flag " << util::quote(name) << " has an invalid name\n";
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (formal_.count(name) != 0) {
        if (name_.empty())
            output() << "flag redefined: " << name << "\n";
        else
            output() << name_ << " flag redefined: " << name << "\n";
        ec = std::make_error_code(std::errc::file_exists);
        return false;
    }

    Flag flag;
    flag.name = name;
    flag.usage = usage;
    flag.defValue = value->toString();
    flag.value = std::move(value);
    spdlog::debug("FlagSet {}: registered -{} (default {})", name_, name, flag.defValue);
    formal_.emplace(name, std::move(flag));
    return true;
}

bool FlagSet::boolVar(bool* p, const std::string& name, bool value, const std::string& usage,
                      std::error_code& ec) {
    return var(std::make_unique<TypedValue<bool>>(p, value), name, usage, ec);
}

bool FlagSet::intVar(int* p, const std::string& name, int value, const std::string& usage,
                     std::error_code& ec) {
    return var(std::make_unique<TypedValue<int>>(p, value), name, usage, ec);
}

bool FlagSet::int64Var(int64_t* p, const std::string& name, int64_t value,
                       const std::string& usage, std::error_code& ec) {
    return var(std::make_unique<TypedValue<int64_t>>(p, value), name, usage, ec);
}

bool FlagSet::uintVar(unsigned* p, const std::string& name, unsigned value,
                      const std::string& usage, std::error_code& ec) {
    return var(std::make_unique<TypedValue<unsigned>>(p, value), name, usage, ec);
}

bool FlagSet::uint64Var(uint64_t* p, const std::string& name, uint64_t value,
                        const std::string& usage, std::error_code& ec) {
    return var(std::make_unique<TypedValue<uint64_t>>(p, value), name, usage, ec);
}

bool FlagSet::float64Var(double* p, const std::string& name, double value,
                         const std::string& usage, std::error_code& ec) {
    return var(std::make_unique<TypedValue<double>>(p, value), name, usage, ec);
}

bool FlagSet::durationVar(Duration* p, const std::string& name, Duration value,
                          const std::string& usage, std::error_code& ec) {
    return var(std::make_unique<TypedValue<Duration>>(p, value), name, usage, ec);
}

bool FlagSet::stringVar(std::string* p, const std::string& name, const std::string& value,
                        const std::string& usage, std::error_code& ec) {
    return var(std::make_unique<TypedValue<std::string>>(p, value), name, usage, ec);
}

// =============================================================================
// Parsing
// =============================================================================

bool FlagSet::parse(const std::vector<std::string>& arguments, std::error_code& ec) {
    ec.clear();
    parsed_ = true;
    args_ = arguments;

    bool more = true;
    while (more) {
        if (parseOne(more, ec))
            continue;
        if (!ec)
            break;

        if (errorHandling_ == ErrorHandling::ExitOnError) {
            // -h / -help 는 정상 종료, 나머지 파싱 오류는 종료 코드 2.
            std::exit(ec == std::errc::operation_canceled ? 0 : 2);
        }
        return false;
    }
    return true;
}

bool FlagSet::parse(int argc, char** argv, std::error_code& ec) {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i)
        arguments.emplace_back(argv[i]);
    return parse(arguments, ec);
}

// 인자 하나(값이 분리된 경우 두 개)를 소비한다.
// - 더 이상 플래그가 없으면 more=false, 반환 false, ec 비어 있음.
// - 오류면 반환 false, ec 설정.
bool FlagSet::parseOne(bool& more, std::error_code& ec) {
    more = false;
    if (args_.empty())
        return false;

    const std::string s = args_.front();
    if (s.size() < 2 || s[0] != '-')
        return false;

    size_t numMinuses = 1;
    if (s[1] == '-') {
        ++numMinuses;
        if (s.size() == 2) {
            // "--" 이후는 모두 일반 인자
            args_.erase(args_.begin());
            return false;
        }
    }

    std::string name = s.substr(numMinuses);
    if (name.empty() || name[0] == '-' || name[0] == '=')
        return fail(std::errc::invalid_argument, "bad flag syntax: " + s, ec);

    args_.erase(args_.begin());

    bool hasValue = false;
    std::string value;
    size_t eq = name.find('=', 1);
    if (eq != std::string::npos) {
        value = name.substr(eq + 1);
        hasValue = true;
        name.resize(eq);
    }

    auto it = formal_.find(name);
    if (it == formal_.end()) {
        if (name == "help" || name == "h") {
            printUsage();
            ec = std::make_error_code(std::errc::operation_canceled);
            return false;
        }
        return fail(std::errc::invalid_argument, "flag provided but not defined: -" + name, ec);
    }

    Flag& flag = it->second;
    std::error_code setEc;
    if (flag.value->isBoolFlag()) {
        if (hasValue) {
            if (!flag.value->set(value, setEc))
                return fail(std::errc::invalid_argument,
                            "invalid boolean value " + util::quote(value) + " for -" + name +
                                ": " + valueErrorText(setEc),
                            ec);
        } else if (!flag.value->set("true", setEc)) {
            return fail(std::errc::invalid_argument,
                        "invalid boolean flag " + name + ": " + valueErrorText(setEc), ec);
        }
    } else {
        if (!hasValue && !args_.empty()) {
            hasValue = true;
            value = args_.front();
            args_.erase(args_.begin());
        }
        if (!hasValue)
            return fail(std::errc::invalid_argument, "flag needs an argument: -" + name, ec);
        if (!flag.value->set(value, setEc)) {
            std::errc code = setEc == std::errc::result_out_of_range
                                 ? std::errc::result_out_of_range
                                 : std::errc::invalid_argument;
            return fail(code,
                        "invalid value " + util::quote(value) + " for flag -" + name + ": " +
                            valueErrorText(setEc),
                        ec);
        }
    }

    actual_.insert(name);
    more = true;
    return true;
}

bool FlagSet::fail(std::errc code, const std::string& message, std::error_code& ec) {
    spdlog::debug("FlagSet {}: {}", name_, message);
    output() << message << "\n";
    printUsage();
    ec = std::make_error_code(code);
    return false;
}

// =============================================================================
// Inspection
// =============================================================================

Flag* FlagSet::lookup(const std::string& name) {
    auto it = formal_.find(name);
    return it == formal_.end() ? nullptr : &it->second;
}

const Flag* FlagSet::lookup(const std::string& name) const {
    auto it = formal_.find(name);
    return it == formal_.end() ? nullptr : &it->second;
}

bool FlagSet::set(const std::string& name, const std::string& value, std::error_code& ec) {
    ec.clear();
    Flag* flag = lookup(name);
    if (!flag) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (!flag->value->set(value, ec))
        return false;
    actual_.insert(name);
    return true;
}

void FlagSet::visitAll(const std::function<void(const Flag&)>& fn) const {
    for (const auto& entry : formal_)
        fn(entry.second);
}

void FlagSet::visit(const std::function<void(const Flag&)>& fn) const {
    for (const auto& name : actual_) {
        auto it = formal_.find(name);
        if (it != formal_.end())
            fn(it->second);
    }
}

void FlagSet::printDefaults(std::ostream& os) const {
    visitAll([&os](const Flag& flag) {
        std::ostringstream b;
        b << "  -" << flag.name;

        std::string typeWord;
        std::string usage;
        unquoteUsage(flag, typeWord, usage);
        if (!typeWord.empty())
            b << " " << typeWord;

        // 짧은 boolean 플래그("  -x")는 같은 줄에 탭으로 설명을 붙인다.
        if (b.str().size() <= 4)
            b << "\t";
        else
            b << "\n    \t";

        size_t pos = 0;
        while ((pos = usage.find('\n', pos)) != std::string::npos) {
            usage.replace(pos, 1, "\n    \t");
            pos += 6;
        }
        b << usage;

        if (flag.defValue != flag.value->zeroString()) {
            if (std::string(flag.value->typeName()) == "string")
                b << " (default " << util::quote(flag.defValue) << ")";
            else
                b << " (default " << flag.defValue << ")";
        }
        os << b.str() << "\n";
    });
}

void FlagSet::printUsage() const {
    if (usage_) {
        usage_();
        return;
    }
    if (name_.empty())
        output() << "Usage:\n";
    else
        output() << "Usage of " << name_ << ":\n";
    printDefaults(output());
}

} // namespace StructFlag
