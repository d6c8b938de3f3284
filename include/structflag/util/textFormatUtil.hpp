/**
 * @file include/structflag/util/textFormatUtil.hpp
 * @brief 값 파서, 정규 포맷, 문자열 quote/unquote 유틸리티.
 * @details
 * - 모든 파서는 bool 반환과 std::error_code 출력 인자를 사용하며 실패 시 출력 값을 변경하지 않습니다.
 * - 앞쪽 공백과 문자열 전체를 소비하지 못하는 입력은 invalid_argument, 범위 초과는 result_out_of_range 입니다.
 * - 실수 포맷은 printf %g 배치의 최단 왕복 표현이며, 파서는 그 출력을 (subnormal 포함) 그대로 되읽을 수 있어야 합니다.
 * - quote 는 Go strconv.Quote 형식이며 unquote 는 그 역변환입니다.
 */
#pragma once

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>

namespace StructFlag::util {

// =============================================================================
// Parsing
// =============================================================================

/// @brief Parse a boolean
/// @details Accepts 1, t, T, TRUE, true, True, 0, f, F, FALSE, false, False.
inline bool parseBool(const std::string& s, bool& out, std::error_code& ec) {
    ec.clear();
    if (s == "1" || s == "t" || s == "T" || s == "TRUE" || s == "true" || s == "True") {
        out = true;
        return true;
    }
    if (s == "0" || s == "f" || s == "F" || s == "FALSE" || s == "false" || s == "False") {
        out = false;
        return true;
    }
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
}

// 숫자 문자열을 long long으로 엄격하게 변환한다.
// - 앞쪽 공백은 허용하지 않는다 (stoll은 공백을 건너뛰므로 먼저 검사).
// - 문자열 전체를 소비하지 못하면 실패로 간주한다.
// - 호출자는 ec를 통해 실패 원인(invalid_argument / result_out_of_range)을 분기할 수 있다.
inline bool parseLongLongStrict(const std::string& s, long long& out, std::error_code& ec) {
    ec.clear();
    if (s.empty() || std::isspace((unsigned char)s[0])) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos != s.size()) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    } catch (const std::out_of_range&) {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
    }
}

// unsigned 변환. 부호 문자('+', '-')는 허용하지 않는다.
// stoull은 "-1"을 wrap-around 해서 받아들이므로 부호 검사를 먼저 수행해야 한다.
inline bool parseULongLongStrict(const std::string& s, unsigned long long& out,
                                 std::error_code& ec) {
    ec.clear();
    if (s.empty() || !std::isdigit((unsigned char)s[0])) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(s, &pos, 10);
        if (pos != s.size()) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        out = v;
        return true;
    } catch (const std::invalid_argument&) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    } catch (const std::out_of_range&) {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
    }
}

/// @brief Parse a signed decimal integer into T with range check
template <typename T> bool parseSigned(const std::string& s, T& out, std::error_code& ec) {
    static_assert(std::is_signed_v<T> && std::is_integral_v<T>, "parseSigned: signed integer");
    long long v = 0;
    if (!parseLongLongStrict(s, v, ec))
        return false;
    if (v < (long long)std::numeric_limits<T>::min() ||
        v > (long long)std::numeric_limits<T>::max()) {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

/// @brief Parse an unsigned decimal integer into T with range check
template <typename T> bool parseUnsigned(const std::string& s, T& out, std::error_code& ec) {
    static_assert(std::is_unsigned_v<T> && std::is_integral_v<T>,
                  "parseUnsigned: unsigned integer");
    unsigned long long v = 0;
    if (!parseULongLongStrict(s, v, ec))
        return false;
    if (v > (unsigned long long)std::numeric_limits<T>::max()) {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
    }
    out = static_cast<T>(v);
    return true;
}

inline bool parseInt(const std::string& s, int& out, std::error_code& ec) {
    return parseSigned(s, out, ec);
}

inline bool parseInt64(const std::string& s, int64_t& out, std::error_code& ec) {
    return parseSigned(s, out, ec);
}

inline bool parseUint(const std::string& s, unsigned& out, std::error_code& ec) {
    return parseUnsigned(s, out, ec);
}

inline bool parseUint64(const std::string& s, uint64_t& out, std::error_code& ec) {
    return parseUnsigned(s, out, ec);
}

/// @brief Parse a 64-bit float
/// @details Decimal, exponent and hex forms plus inf/nan, as strtod reads them.
///          The whole string must be consumed. Results that underflow to a subnormal or
///          to zero are accepted, only overflow to +-HUGE_VAL is out of range.
inline bool parseFloat64(const std::string& s, double& out, std::error_code& ec) {
    ec.clear();
    if (s.empty() || std::isspace((unsigned char)s[0])) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    // 중간에 NUL 이 있으면 end 가 문자열 끝에 도달하지 못한다.
    if (end != begin + s.size()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }
    if (errno == ERANGE && (v == HUGE_VAL || v == -HUGE_VAL)) {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
    }
    out = v;
    return true;
}

// =============================================================================
// Formatting
// =============================================================================

inline std::string formatBool(bool v) { return v ? "true" : "false"; }

/// @brief Decimal form of any integer width
/// @note int8_t/uint8_t are printed as numbers, not characters
template <typename T> std::string formatInteger(T v) {
    static_assert(std::is_integral_v<T>, "formatInteger: integral type");
    char buf[32];
    std::to_chars_result res;
    if constexpr (std::is_signed_v<T>)
        res = std::to_chars(buf, buf + sizeof(buf), static_cast<long long>(v));
    else
        res = std::to_chars(buf, buf + sizeof(buf), static_cast<unsigned long long>(v));
    return std::string(buf, res.ptr);
}

/// @brief Shortest round-trip form of a float or double, in printf %g layout
/// @details Exponent form when the decimal exponent is below -4 or at least 6
///          (123456789 -> "1.23456789e+08", 1e-05 -> "1e-05"), plain decimal otherwise
///          (0.0001, 100000). Infinities are "+Inf" / "-Inf", NaN is "NaN".
template <typename T> std::string formatFloat(T v) {
    static_assert(std::is_floating_point_v<T>, "formatFloat: floating point type");
    if (std::isnan(v))
        return "NaN";
    if (std::isinf(v))
        return v > 0 ? "+Inf" : "-Inf";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    // 과학 표기 결과에서 지수를 읽어 %g 규칙(-4 <= exp < 6 이면 고정 소수점)을 적용한다.
    int exp = std::stoi(sci.substr(sci.find('e') + 1));
    if (exp < -4 || exp >= 6)
        return sci;

    res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
    return std::string(buf, res.ptr);
}

// =============================================================================
// Quoting
// =============================================================================

/// @brief Wrap a string in double quotes with backslash escapes
/// @details `"` and `\` are escaped, control characters use \a \b \f \n \r \t \v or \xNN.
///          Bytes >= 0x80 pass through unchanged (UTF-8 text stays readable).
/// @param in Raw string
/// @return Quoted string, e.g. `say "hi"` -> `"say \"hi\""`
inline std::string quote(const std::string& in) {
    static const char hex[] = "0123456789abcdef";
    std::string o;
    o.reserve(in.size() + 2);
    o.push_back('"');
    for (char ch : in) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (c) {
        case '"':
            o += "\\\"";
            break;
        case '\\':
            o += "\\\\";
            break;
        case '\a':
            o += "\\a";
            break;
        case '\b':
            o += "\\b";
            break;
        case '\f':
            o += "\\f";
            break;
        case '\n':
            o += "\\n";
            break;
        case '\r':
            o += "\\r";
            break;
        case '\t':
            o += "\\t";
            break;
        case '\v':
            o += "\\v";
            break;
        default:
            if (c < 0x20 || c == 0x7f) {
                o += "\\x";
                o.push_back(hex[c >> 4]);
                o.push_back(hex[c & 0x0f]);
            } else {
                o.push_back(ch);
            }
        }
    }
    o.push_back('"');
    return o;
}

/// @brief Inverse of quote()
/// @param in Quoted string including the surrounding double quotes
/// @param out Unescaped content
/// @param ec invalid_argument if quotes are missing or an escape is malformed
/// @return true on success
inline bool unquote(const std::string& in, std::string& out, std::error_code& ec) {
    ec.clear();
    if (in.size() < 2 || in.front() != '"' || in.back() != '"') {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    std::string s;
    const size_t end = in.size() - 1;
    for (size_t i = 1; i < end; ++i) {
        char c = in[i];
        if (c == '"') {
            // escape되지 않은 따옴표가 본문에 있으면 잘못된 입력이다.
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        if (c != '\\') {
            s.push_back(c);
            continue;
        }
        if (++i >= end) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        char e = in[i];
        switch (e) {
        case '"':
        case '\\':
            s.push_back(e);
            break;
        case 'a':
            s.push_back('\a');
            break;
        case 'b':
            s.push_back('\b');
            break;
        case 'f':
            s.push_back('\f');
            break;
        case 'n':
            s.push_back('\n');
            break;
        case 'r':
            s.push_back('\r');
            break;
        case 't':
            s.push_back('\t');
            break;
        case 'v':
            s.push_back('\v');
            break;
        case 'x': {
            if (i + 2 >= end) {
                ec = std::make_error_code(std::errc::invalid_argument);
                return false;
            }
            unsigned value = 0;
            auto res = std::from_chars(in.data() + i + 1, in.data() + i + 3, value, 16);
            if (res.ec != std::errc() || res.ptr != in.data() + i + 3) {
                ec = std::make_error_code(std::errc::invalid_argument);
                return false;
            }
            s.push_back(static_cast<char>(value));
            i += 2;
            break;
        }
        default:
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
    }
    out = std::move(s);
    return true;
}

} // namespace StructFlag::util
