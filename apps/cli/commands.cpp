#include "commands.hpp"

#include "protocol/calendar.hpp"
#include "protocol/keyderiver.hpp"
#include "protocol/keyvalidator.hpp"
#include "helpers.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace cli {

namespace {

protocol::CalendarDate resolve_date(const Options& opts) {
    return opts.date ? protocol::parse_date(*opts.date) : protocol::local_today();
}

protocol::GateConfig load_config(const Options& opts) {
    protocol::GateConfig config;
    if (opts.config_path) {
        std::ifstream in(*opts.config_path);
        if (!in) {
            throw protocol::ConfigError("Cannot open config file: " + *opts.config_path);
        }
        std::stringstream buf;
        buf << in.rdbuf();
        config = protocol::GateConfig::from_env_string(buf.str());
    }
    // --date wins over KEYGATE_DATE
    if (opts.date) {
        config.date_override = protocol::parse_date(*opts.date);
    }
    return config;
}

} // namespace

void usage(std::ostream& out) {
    out << "Usage:\n"
        << "  keygate derive [--date YYYY-MM-DD] [--mode normal|shared]\n"
        << "  keygate check <key> [--date YYYY-MM-DD]\n"
        << "  keygate login [--config FILE] [--date YYYY-MM-DD]\n";
}

bool parse_args(const std::vector<std::string>& args, Options& opts) {
    if (args.empty()) return false;
    opts.command = args[0];

    const bool is_derive = opts.command == "derive";
    const bool is_check = opts.command == "check";
    const bool is_login = opts.command == "login";
    if (!is_derive && !is_check && !is_login) return false;

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto next = [&](std::optional<std::string>& dst) {
            if (dst || i + 1 >= args.size()) return false;
            dst = args[++i];
            return true;
        };

        if (arg == "--date") {
            if (!next(opts.date)) return false;
        } else if (arg == "--mode" && is_derive) {
            if (!next(opts.mode)) return false;
        } else if (arg == "--config" && is_login) {
            if (!next(opts.config_path)) return false;
        } else if (is_check && opts.candidate.empty() && arg.rfind("--", 0) != 0) {
            opts.candidate = arg;
        } else {
            return false;
        }
    }
    return !is_check || !opts.candidate.empty();
}

int run_derive(const Options& opts, std::ostream& out) {
    using namespace protocol::keyderiver;

    auto date = resolve_date(opts);
    Mode mode = parse_mode(opts.mode.value_or("normal"));
    if (mode == Mode::Normal) {
        for (const auto& digest : derive_normal(date)) out << digest << "\n";
    } else {
        out << derive_shared(date) << "\n";
    }
    return EXIT_ACCEPTED;
}

int run_check(const Options& opts, std::ostream& out) {
    using protocol::keyvalidator::AccessTier;

    auto tier = protocol::keyvalidator::validate(opts.candidate, resolve_date(opts));
    out << protocol::keyvalidator::tier_name(tier) << "\n";
    return tier == AccessTier::Rejected ? EXIT_REJECTED : EXIT_ACCEPTED;
}

int run_login(const protocol::GateConfig& config, std::istream& in, std::ostream& out) {
    using protocol::keyvalidator::AccessTier;

    protocol::keyvalidator::KeyValidator validator(config.date_source());

    std::string line;
    while (true) {
        out << "Key: " << std::flush;
        if (!std::getline(in, line)) {
            out << "\n";
            return EXIT_REJECTED;
        }

        AccessTier tier = validator.validate(line);
        if (tier == AccessTier::Rejected) {
            out << "Incorrect Key!" << std::endl;
            continue;
        }

        std::string model = protocol::model_for_tier(config, tier).value_or("");
        if (tier == AccessTier::Elevated) {
            out << "Shared key accepted. Switching to " << model << "." << std::endl;
        }
        out << "Model: " << model << std::endl;
        return EXIT_ACCEPTED;
    }
}

int run(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    Options opts;
    if (!parse_args(args, opts)) {
        usage(err);
        return EXIT_USAGE;
    }

    try {
        keygate::utils::ensure_sodium_init();

        if (opts.command == "derive") return run_derive(opts, out);
        if (opts.command == "check") return run_check(opts, out);
        return run_login(load_config(opts), in, out);
    } catch (const protocol::CalendarError& e) {
        err << "Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const protocol::ConfigError& e) {
        err << "Config error: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const protocol::keyderiver::InvalidModeError& e) {
        err << "Error: " << e.what() << std::endl;
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << std::endl;
        return EXIT_REJECTED;
    }
}

} // namespace cli
