/**
 * @file include/structflag/flag/FlagSet.hpp
 * @brief 명령행 플래그 레지스트리 선언.
 * @details
 * - 플래그는 이름 순으로 보관되며 *Var 등록 시 기본값이 호출자 저장소에 즉시 기록됩니다.
 * - FlagSet 은 FlagValue 를 소유하지만 값이 가리키는 저장소는 소유하지 않습니다.
 * - 오류 코드 규약은 클래스 문서를 참고하십시오.
 */
#pragma once

#include "structflag/flag/FlagValue.hpp"
#include "structflag/util/Duration.hpp"

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>

namespace StructFlag {

/// @brief One registered flag
struct Flag {
    std::string name;                 ///< Name as it appears on the command line
    std::string usage;                ///< Help message
    std::unique_ptr<FlagValue> value; ///< Binding to caller storage
    std::string defValue;             ///< Default value as text, captured at registration
};

/// @brief Set of named flags with a parse step
/// @details Flags are registered with the *Var functions, which write the default into the
///          bound storage right away. parse() then overwrites the storage of every flag that
///          appears in the arguments.
///
///          Accepted syntax:
///          - `-flag`, `--flag` (boolean flags only)
///          - `-flag=value`, `--flag=value`
///          - `-flag value` (non-boolean flags only)
///
///          Parsing stops at the first non-flag argument, at "-", or after "--".
///
///          Error codes:
///          - registration: file_exists on duplicate name, invalid_argument on bad name
///          - parse: invalid_argument (undefined flag, bad syntax, missing value, bad value),
///            result_out_of_range (value out of range), operation_canceled (-h / -help)
class FlagSet {
  public:
    /// @brief What parse() does on failure
    enum class ErrorHandling {
        ContinueOnError, ///< Return false and set ec
        ExitOnError      ///< std::exit(2), or std::exit(0) for -h / -help
    };

    explicit FlagSet(std::string name,
                     ErrorHandling errorHandling = ErrorHandling::ContinueOnError);

    FlagSet(const FlagSet&) = delete;
    FlagSet& operator=(const FlagSet&) = delete;

    const std::string& name() const { return name_; }
    ErrorHandling errorHandling() const { return errorHandling_; }

    /// @brief Destination for usage and error messages (default std::cerr)
    void setOutput(std::ostream& os) { output_ = &os; }
    std::ostream& output() const { return *output_; }

    /// @brief Replace the usage printer called on parse errors and -help
    void setUsage(std::function<void()> usage) { usage_ = std::move(usage); }

    // =========================================================================
    // Registration
    // =========================================================================

    /// @brief Register a flag with an arbitrary value implementation
    /// @param value Value binding. Ownership moves to the set
    /// @param name Flag name. Must be non-empty, must not start with '-' or contain '='
    /// @param usage Help message
    /// @param ec file_exists if the name is taken, invalid_argument if it is malformed
    /// @return true on success
    bool var(std::unique_ptr<FlagValue> value, const std::string& name, const std::string& usage,
             std::error_code& ec);

    bool boolVar(bool* p, const std::string& name, bool value, const std::string& usage,
                 std::error_code& ec);
    bool intVar(int* p, const std::string& name, int value, const std::string& usage,
                std::error_code& ec);
    bool int64Var(int64_t* p, const std::string& name, int64_t value, const std::string& usage,
                  std::error_code& ec);
    bool uintVar(unsigned* p, const std::string& name, unsigned value, const std::string& usage,
                 std::error_code& ec);
    bool uint64Var(uint64_t* p, const std::string& name, uint64_t value,
                   const std::string& usage, std::error_code& ec);
    bool float64Var(double* p, const std::string& name, double value, const std::string& usage,
                    std::error_code& ec);
    bool durationVar(Duration* p, const std::string& name, Duration value,
                     const std::string& usage, std::error_code& ec);
    bool stringVar(std::string* p, const std::string& name, const std::string& value,
                   const std::string& usage, std::error_code& ec);

    /// @brief True if name can be registered (non-empty, no leading '-', no '=')
    static bool isValidName(const std::string& name);

    // =========================================================================
    // Parsing
    // =========================================================================

    /// @brief Parse flags from arguments (program name excluded)
    /// @param arguments Command-line arguments
    /// @param ec Error code set on failure
    /// @return true on success
    bool parse(const std::vector<std::string>& arguments, std::error_code& ec);

    /// @brief Parse flags from main()'s argv. argv[0] is skipped
    bool parse(int argc, char** argv, std::error_code& ec);

    bool parsed() const { return parsed_; }

    /// @brief Arguments left after the flags
    const std::vector<std::string>& args() const { return args_; }
    size_t nArg() const { return args_.size(); }

    /// @brief i-th remaining argument, or "" when out of range
    std::string arg(size_t i) const { return i < args_.size() ? args_[i] : std::string(); }

    /// @brief Number of flags set by parse() or set()
    size_t nFlag() const { return actual_.size(); }

    // =========================================================================
    // Inspection
    // =========================================================================

    /// @brief Find a registered flag
    /// @return Flag or nullptr
    Flag* lookup(const std::string& name);
    const Flag* lookup(const std::string& name) const;

    /// @brief Set a registered flag as if it appeared on the command line
    /// @param ec invalid_argument if no such flag, or the value's parse error
    bool set(const std::string& name, const std::string& value, std::error_code& ec);

    /// @brief True if the flag was set by parse() or set()
    bool isSet(const std::string& name) const { return actual_.count(name) != 0; }

    /// @brief Visit all registered flags in name order
    void visitAll(const std::function<void(const Flag&)>& fn) const;

    /// @brief Visit the flags that were set, in name order
    void visit(const std::function<void(const Flag&)>& fn) const;

    /// @brief Print every flag with its type, usage and non-zero default
    void printDefaults(std::ostream& os) const;

    /// @brief Print the usage message to output()
    void printUsage() const;

  private:
    bool parseOne(bool& more, std::error_code& ec);
    bool fail(std::errc code, const std::string& message, std::error_code& ec);

    std::string name_;
    ErrorHandling errorHandling_;
    std::ostream* output_;
    std::function<void()> usage_;

    std::map<std::string, Flag> formal_;
    std::set<std::string> actual_;
    std::vector<std::string> args_;
    bool parsed_ = false;
};

} // namespace StructFlag
