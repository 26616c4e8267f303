#ifndef KEYGATE_CLI_COMMANDS_HPP
#define KEYGATE_CLI_COMMANDS_HPP

#include "protocol/gateconfig.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace cli {

constexpr int EXIT_ACCEPTED = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_USAGE = 2;

struct Options {
    std::string command;
    std::string candidate;
    std::optional<std::string> date;
    std::optional<std::string> mode;
    std::optional<std::string> config_path;
};

void usage(std::ostream& out);

// Parses argv[1..]. Flags a command does not take are usage errors.
bool parse_args(const std::vector<std::string>& args, Options& opts);

int run_derive(const Options& opts, std::ostream& out);
int run_check(const Options& opts, std::ostream& out);

// Prompts for a key until one is accepted (exit 0) or input ends (exit 1).
int run_login(const protocol::GateConfig& config, std::istream& in, std::ostream& out);

// Full dispatch: parse, run, map errors to exit codes.
int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace cli

#endif // KEYGATE_CLI_COMMANDS_HPP
