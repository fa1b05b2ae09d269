#include "runtime/CommandLine.hpp"
#include "types/Error.hpp"

#include <fmt/core.h>
#include <vector>

using namespace gm::types;

namespace gm::runtime {

namespace {

// Value of an option given either as "--opt value" or "--opt=value"
std::string takeValue(const std::string_view arg, const std::string_view name, int& i, const int argc,
                      const char* const argv[]) {
    if (arg.size() > name.size() && arg[name.size()] == '=') return std::string(arg.substr(name.size() + 1));
    if (i + 1 >= argc) throw Error(ErrorKind::InvalidArgument, fmt::format("option {} requires a value", name));
    return argv[++i];
}

bool matches(const std::string_view arg, const std::string_view name) {
    return arg == name || (arg.starts_with(name) && arg.size() > name.size() && arg[name.size()] == '=');
}

}

CommandLine parseCommandLine(const int argc, const char* const argv[]) {
    CommandLine cmd;
    std::vector<std::string> positionals;
    bool optionsDone = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (optionsDone || arg.empty() || arg.front() != '-' || arg == "-") {
            positionals.emplace_back(arg);
            continue;
        }

        if (arg == "--") optionsDone = true;
        else if (arg == "-h" || arg == "--help") cmd.help = true;
        else if (arg == "-d" || arg == "--debug") cmd.debug = true;
        else if (arg == "-r") cmd.reference = takeValue(arg, "-r", i, argc, argv);
        else if (matches(arg, "--ref")) cmd.reference = takeValue(arg, "--ref", i, argc, argv);
        else if (arg == "-c") cmd.configPath = takeValue(arg, "-c", i, argc, argv);
        else if (matches(arg, "--config")) cmd.configPath = takeValue(arg, "--config", i, argc, argv);
        else throw Error(ErrorKind::InvalidArgument, fmt::format("unknown option {}", arg));
    }

    if (cmd.reference && cmd.reference->empty()) throw Error(ErrorKind::InvalidArgument, "reference must not be empty");
    if (cmd.help) return cmd;

    if (positionals.size() != 2)
        throw Error(ErrorKind::InvalidArgument,
                    fmt::format("expected <git_path> and <mount_path>, got {} argument(s)", positionals.size()));

    cmd.gitPath = positionals[0];
    cmd.mountPath = positionals[1];
    return cmd;
}

std::string usage(const std::string_view program) {
    return fmt::format(
        "Usage: {} [options] <git_path> <mount_path>\n"
        "\n"
        "Mount a git repository read-only at a fixed reference.\n"
        "\n"
        "Options:\n"
        "  -r, --ref <name>      branch, tag or commit id to mount (default: HEAD)\n"
        "  -c, --config <file>   configuration file (default: /etc/gitmount/config.yaml)\n"
        "  -d, --debug           libfuse debug output and debug logging\n"
        "  -h, --help            show this help and exit\n",
        program);
}

}
