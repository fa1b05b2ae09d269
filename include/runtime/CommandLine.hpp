#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gm::runtime {

struct CommandLine {
    std::filesystem::path gitPath;
    std::filesystem::path mountPath;
    std::optional<std::string> reference;
    std::optional<std::filesystem::path> configPath;
    bool debug = false;
    bool help = false;
};

// Throws types::Error(InvalidArgument) for unknown options, missing values or wrong arity.
// With -h/--help set, positionals are not required.
CommandLine parseCommandLine(int argc, const char* const argv[]);

std::string usage(std::string_view program);

}
