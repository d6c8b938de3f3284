#include <iostream>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>

#include "records/ServerConfig.hpp"

using namespace StructFlag;

// Usage:
//   structflag_example [-log-level=level] [server flags...] [args...]
//
// Binds ServerConfig to flags, parses the command line, and prints the effective
// configuration back as arguments, e.g.
//   structflag_example -port=9000 -read-timeout=1m30s
int main(int argc, char** argv) {
    std::error_code ec;

    // 1. -log-level sets spdlog verbosity after parsing.
    FlagSet flags(argc > 0 ? argv[0] : "structflag_example",
                  FlagSet::ErrorHandling::ExitOnError);

    std::string logLevel = "info";
    if (!flags.stringVar(&logLevel, "log-level", "info", "spdlog `level` (trace..off)", ec)) {
        std::cerr << "log-level: " << ec.message() << "\n";
        return 1;
    }

    // 2. Server fields. secret is excluded by its "-" tag, data-dir explicitly.
    ServerConfig config;
    BindOptions options;
    options.strictDefaults = true;
    if (!structToFlags(flags, "", &config, {"data-dir"}, ec, options)) {
        std::cerr << "bind: " << ec.message() << "\n";
        return 1;
    }

    // ExitOnError: 파싱 실패 시 exit(2), -help 는 exit(0)
    if (!flags.parse(argc, argv, ec))
        return 2;
    spdlog::set_level(spdlog::level::from_str(logLevel));

    spdlog::info("listening on {}:{} (read timeout {})", config.listen_addr, config.port,
                 util::formatDuration(config.read_timeout));

    // 3. Effective configuration as a command line for a child process.
    std::cout << "effective arguments:\n";
    for (const auto& arg : structToArgs("", config))
        std::cout << "  " << arg << "\n";

    std::cout << "explicitly set:";
    flags.visit([](const Flag& flag) { std::cout << " -" << flag.name; });
    std::cout << "\n";

    for (size_t i = 0; i < flags.nArg(); ++i)
        std::cout << "arg[" << i << "] = " << flags.arg(i) << "\n";
    return 0;
}
