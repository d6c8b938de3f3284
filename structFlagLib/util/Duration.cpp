/**
 * @file structFlagLib/util/Duration.cpp
 * @brief Go time.Duration 텍스트 형식의 포맷/파싱 구현.
 * @details
 * - 출력 형식은 1h30m0s, 1.5s, 300ms, 1.1µs 처럼 가장 큰 단위부터 쓰며 0 은 "0s" 입니다.
 * - 입력은 부호, 소수부, 단위(ns us µs μs ms s m h)의 나열이며 단위 없는 값은 "0" 만 허용합니다.
 * - int64 나노초 범위를 넘으면 result_out_of_range, 문법 오류는 invalid_argument 를 돌려줍니다.
 * - 실패 시 출력 인자는 변경하지 않습니다.
 */
#include "structflag/util/Duration.hpp"

#include <cstdint>
#include <cstring>

namespace StructFlag::util {

namespace {

constexpr uint64_t kNanosecond = 1;
constexpr uint64_t kMicrosecond = 1000 * kNanosecond;
constexpr uint64_t kMillisecond = 1000 * kMicrosecond;
constexpr uint64_t kSecond = 1000 * kMillisecond;
constexpr uint64_t kMinute = 60 * kSecond;
constexpr uint64_t kHour = 60 * kMinute;

// 2^63: int64 음수 최소값의 절대값. 파싱 중 overflow 판정 기준으로 사용한다.
constexpr uint64_t kOverflowLimit = uint64_t(1) << 63;

/// @brief Write fraction digits of v (prec digits) right-to-left into buf[0, w)
/// @details Trailing zeros are omitted, and the '.' is only written when a digit is.
/// @return New write index and v with the fraction removed
size_t fmtFrac(char* buf, size_t w, uint64_t& v, int prec) {
    bool print = false;
    for (int i = 0; i < prec; ++i) {
        int digit = static_cast<int>(v % 10);
        print = print || digit != 0;
        if (print) {
            buf[--w] = static_cast<char>('0' + digit);
        }
        v /= 10;
    }
    if (print) {
        buf[--w] = '.';
    }
    return w;
}

size_t fmtInt(char* buf, size_t w, uint64_t v) {
    if (v == 0) {
        buf[--w] = '0';
        return w;
    }
    while (v > 0) {
        buf[--w] = static_cast<char>('0' + v % 10);
        v /= 10;
    }
    return w;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

/// @brief Consume leading decimal digits
/// @return false on overflow
bool leadingInt(const std::string& s, size_t& pos, uint64_t& x) {
    x = 0;
    while (pos < s.size() && isDigit(s[pos])) {
        if (x > kOverflowLimit / 10)
            return false;
        x = x * 10 + static_cast<uint64_t>(s[pos] - '0');
        if (x > kOverflowLimit)
            return false;
        ++pos;
    }
    return true;
}

/// @brief Consume fraction digits after '.'
/// @details Digits past the representable precision are consumed and dropped.
void leadingFraction(const std::string& s, size_t& pos, uint64_t& x, double& scale) {
    x = 0;
    scale = 1;
    bool overflow = false;
    while (pos < s.size() && isDigit(s[pos])) {
        char c = s[pos++];
        if (overflow)
            continue;
        if (x > (kOverflowLimit - 1) / 10) {
            overflow = true;
            continue;
        }
        uint64_t y = x * 10 + static_cast<uint64_t>(c - '0');
        if (y > kOverflowLimit) {
            overflow = true;
            continue;
        }
        x = y;
        scale *= 10;
    }
}

bool unitValue(const std::string& unit, uint64_t& out) {
    struct Unit {
        const char* name;
        uint64_t value;
    };
    static const Unit units[] = {
        {"ns", kNanosecond},
        {"us", kMicrosecond},
        {"\xC2\xB5s", kMicrosecond}, // U+00B5 micro sign
        {"\xCE\xBCs", kMicrosecond}, // U+03BC greek small letter mu
        {"ms", kMillisecond},
        {"s", kSecond},
        {"m", kMinute},
        {"h", kHour},
    };
    for (const auto& u : units) {
        if (unit == u.name) {
            out = u.value;
            return true;
        }
    }
    return false;
}

} // namespace

std::string formatDuration(Duration d) {
    char buf[32];
    size_t w = sizeof(buf);

    const int64_t count = d.count();
    const bool neg = count < 0;
    uint64_t u = static_cast<uint64_t>(count);
    if (neg)
        u = 0 - u;

    if (u < kSecond) {
        // 1초 미만은 ns/µs/ms 중 하나의 단위로 소수부와 함께 표기한다.
        int prec = 0;
        buf[--w] = 's';
        --w;
        if (u == 0) {
            buf[w] = '0';
            return std::string(buf + w, sizeof(buf) - w);
        } else if (u < kMicrosecond) {
            prec = 0;
            buf[w] = 'n';
        } else if (u < kMillisecond) {
            prec = 3;
            --w; // "µ"는 UTF-8 2바이트
            std::memcpy(buf + w, "\xC2\xB5", 2);
        } else {
            prec = 6;
            buf[w] = 'm';
        }
        w = fmtFrac(buf, w, u, prec);
        w = fmtInt(buf, w, u);
    } else {
        buf[--w] = 's';
        w = fmtFrac(buf, w, u, 9);
        w = fmtInt(buf, w, u % 60);
        u /= 60;
        if (u > 0) {
            buf[--w] = 'm';
            w = fmtInt(buf, w, u % 60);
            u /= 60;
            if (u > 0) {
                buf[--w] = 'h';
                w = fmtInt(buf, w, u);
            }
        }
    }

    if (neg)
        buf[--w] = '-';
    return std::string(buf + w, sizeof(buf) - w);
}

bool parseDuration(const std::string& s, Duration& out, std::error_code& ec) {
    ec.clear();
    size_t pos = 0;
    uint64_t d = 0;
    bool neg = false;

    if (!s.empty() && (s[0] == '-' || s[0] == '+')) {
        neg = s[0] == '-';
        ++pos;
    }
    // 단위 없는 "0"은 특별히 허용한다.
    if (s.compare(pos, std::string::npos, "0") == 0) {
        out = Duration::zero();
        return true;
    }
    if (pos == s.size()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return false;
    }

    while (pos < s.size()) {
        // 각 항목은 [정수부][.소수부]단위 형식이어야 한다.
        if (!(s[pos] == '.' || isDigit(s[pos]))) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }

        uint64_t v = 0;
        size_t start = pos;
        if (!leadingInt(s, pos, v)) {
            ec = std::make_error_code(std::errc::result_out_of_range);
            return false;
        }
        bool pre = pos != start;

        uint64_t f = 0;
        double scale = 1;
        bool post = false;
        if (pos < s.size() && s[pos] == '.') {
            ++pos;
            start = pos;
            leadingFraction(s, pos, f, scale);
            post = pos != start;
        }
        if (!pre && !post) {
            // "." 단독 또는 ".s" 같은 입력
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }

        start = pos;
        while (pos < s.size() && s[pos] != '.' && !isDigit(s[pos]))
            ++pos;
        if (pos == start) {
            // 단위 누락
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }
        uint64_t unit = 0;
        if (!unitValue(s.substr(start, pos - start), unit)) {
            ec = std::make_error_code(std::errc::invalid_argument);
            return false;
        }

        if (v > kOverflowLimit / unit) {
            ec = std::make_error_code(std::errc::result_out_of_range);
            return false;
        }
        v *= unit;
        if (f > 0) {
            v += static_cast<uint64_t>(static_cast<double>(f) *
                                       (static_cast<double>(unit) / scale));
            if (v > kOverflowLimit) {
                ec = std::make_error_code(std::errc::result_out_of_range);
                return false;
            }
        }
        d += v;
        if (d > kOverflowLimit) {
            ec = std::make_error_code(std::errc::result_out_of_range);
            return false;
        }
    }

    if (neg) {
        // d == 2^63 인 경우에도 unsigned 경유로 INT64_MIN을 안전하게 만든다.
        out = Duration(static_cast<int64_t>(0 - d));
        return true;
    }
    if (d > kOverflowLimit - 1) {
        ec = std::make_error_code(std::errc::result_out_of_range);
        return false;
    }
    out = Duration(static_cast<int64_t>(d));
    return true;
}

} // namespace StructFlag::util
