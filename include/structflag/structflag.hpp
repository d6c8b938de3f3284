#pragma once

/**
 * @file structflag.hpp
 * @brief Main convenience header for StructFlag
 *
 * Include this single header to access all library functionality.
 *
 * @example Basic Usage
 * @code
 * #include <structflag/structflag.hpp>
 *
 * struct Options {
 *     std::string host = "localhost";
 *     int port = 0;
 *     StructFlag::Duration timeout{};
 *     SF_RECORD(SF_FIELD(host),
 *               SF_JSON(port, "listen_port"),
 *               SF_FLAG(timeout, "timeout,Request timeout,5s"))
 * };
 *
 * int main(int argc, char** argv) {
 *     Options opts;
 *     std::error_code ec;
 *     StructFlag::FlagSet flags(argv[0], StructFlag::FlagSet::ErrorHandling::ExitOnError);
 *     if (!StructFlag::structToFlags(flags, "", &opts, ec))
 *         return 1;
 *     if (!flags.parse(argc, argv, ec))
 *         return 2;
 *     // opts.timeout == 5s unless -timeout was given
 *     auto args = StructFlag::structToArgs("", opts);
 *     // {"-host=\"localhost\"", "-listen-port=0", "-timeout=5s"}
 * }
 * @endcode
 */

// =============================================================================
// Record Types
// =============================================================================
#include "record/FieldKind.hpp"
#include "record/FieldMeta.hpp"

// =============================================================================
// Conversion
// =============================================================================
#include "NameResolver.hpp"
#include "StructArgs.hpp"
#include "StructFlags.hpp"

// =============================================================================
// Flag Registry
// =============================================================================
#include "flag/FlagSet.hpp"
#include "flag/FlagValue.hpp"

// =============================================================================
// Utilities
// =============================================================================
#include "util/Duration.hpp"
#include "util/StringSet.hpp"
#include "util/ValueCodec.hpp"
#include "util/textFormatUtil.hpp"

/**
 * @namespace StructFlag
 * @brief Root namespace for the StructFlag library
 *
 * Key components:
 * - Records: FieldMeta, SF_RECORD / SF_FIELD / SF_FLAG / SF_JSON / SF_TAGS
 * - Conversion: structToArgs, structToFlags, resolveFlag
 * - Registry: FlagSet, FlagValue, TypedValue
 * - Utilities: StringSet, Duration, util::quote / util::parse*
 */
namespace StructFlag {

// Version information
constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 0;
constexpr int VERSION_PATCH = 0;
constexpr const char* VERSION_STRING = "1.0.0";

} // namespace StructFlag
