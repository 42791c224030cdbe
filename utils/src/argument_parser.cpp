#include "argument_parser.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace prd {

ArgumentParser::ArgumentParser(const std::string& program_name, const std::string& description)
    : program_name_(program_name), description_(description) {}

void ArgumentParser::add_argument(const std::string& name, const std::string& help) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    positional_args_.push_back(arg);
}

void ArgumentParser::add_option(const std::string& name, const std::string& help, const std::string& default_value) {
    add_option(name, help, default_value, {});
}

void ArgumentParser::add_option(const std::string& name, const std::string& help, const std::string& default_value,
                                const std::vector<std::string>& choices) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.default_value = default_value;
    arg.choices = choices;

    if (!default_value.empty() && !accepts(arg, default_value)) {
        std::cerr << "Warning: Default value '" << default_value << "' for option '" << name
                  << "' is not one of its choices." << std::endl;
    }
    optional_args_[name] = arg;
}

void ArgumentParser::add_flag(const std::string& name, const std::string& help) {
    Argument arg;
    arg.name = name;
    arg.help = help;
    arg.is_flag = true;
    arg.default_value = "false";
    optional_args_[name] = arg;
}

bool ArgumentParser::accepts(const Argument& arg, const std::string& value) const {
    return arg.choices.empty() || std::find(arg.choices.begin(), arg.choices.end(), value) != arg.choices.end();
}

bool ArgumentParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args(argv, argv + argc);

    for (const auto& arg : args) {
        if (arg == "-h" || arg == "--help") {
            print_help();
            return false;
        }
    }

    size_t npositional = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg.rfind("--kokkos-", 0) == 0) {
            continue;
        }

        if (arg[0] != '-' || arg.size() == 1) {
            if (npositional >= positional_args_.size()) {
                std::cerr << "Too many positional arguments" << std::endl;
                print_help();
                return false;
            }
            positional_args_[npositional++].value = arg;
            continue;
        }

        std::string name = arg.substr(arg[1] == '-' ? 2 : 1);
        auto it = optional_args_.find(name);
        if (it == optional_args_.end()) {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_help();
            return false;
        }

        Argument& option = it->second;
        if (option.is_flag) {
            option.value = "true";
            continue;
        }

        if (i + 1 >= args.size() || args[i + 1][0] == '-') {
            std::cerr << "Option " << arg << " requires a value" << std::endl;
            print_help();
            return false;
        }

        const std::string& value = args[++i];
        if (!accepts(option, value)) {
            std::cerr << "Error: Invalid value '" << value << "' for option '" << name << "'." << std::endl;
            std::cerr << "Valid values are:";
            for (const auto& choice : option.choices) {
                std::cerr << " '" << choice << "'";
            }
            std::cerr << std::endl;
            print_help();
            return false;
        }
        option.value = value;
    }

    if (npositional < positional_args_.size()) {
        std::cerr << "Not enough positional arguments" << std::endl;
        print_help();
        return false;
    }

    for (auto& pair : optional_args_) {
        if (pair.second.value.empty()) {
            pair.second.value = pair.second.default_value;
        }
    }
    return true;
}

std::string ArgumentParser::get_positional(size_t index) const {
    return index < positional_args_.size() ? positional_args_[index].value : "";
}

std::string ArgumentParser::get_option(const std::string& name) const {
    auto it = optional_args_.find(name);
    return it != optional_args_.end() ? it->second.value : "";
}

bool ArgumentParser::get_flag(const std::string& name) const {
    auto it = optional_args_.find(name);
    return it != optional_args_.end() && it->second.is_flag && it->second.value == "true";
}

size_t ArgumentParser::get_count(const std::string& name) const {
    std::string value = get_option(name);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("Option --" + name + " expects a non-negative integer, got: '" + value + "'");
    }
    return static_cast<size_t>(std::stoul(value));
}

void ArgumentParser::print_help() const {
    std::cerr << "Usage: " << program_name_;
    for (const auto& arg : positional_args_) {
        std::cerr << " <" << arg.name << ">";
    }
    if (!optional_args_.empty()) {
        std::cerr << " [options]";
    }
    std::cerr << std::endl << std::endl << description_ << std::endl << std::endl;

    if (!positional_args_.empty()) {
        std::cerr << "Positional arguments:" << std::endl;
        for (const auto& arg : positional_args_) {
            std::cerr << "  " << arg.name << "\t" << arg.help << std::endl;
        }
        std::cerr << std::endl;
    }

    std::cerr << "Optional arguments:" << std::endl;
    std::cerr << "  -h, --help\tShow this help message and exit" << std::endl;
    for (const auto& pair : optional_args_) {
        const Argument& arg = pair.second;
        std::cerr << "  --" << arg.name << (arg.is_flag ? "" : " VALUE") << "\t" << arg.help;
        if (!arg.is_flag && !arg.default_value.empty()) {
            std::cerr << " (default: " << arg.default_value << ")";
        }
        if (!arg.choices.empty()) {
            std::cerr << " [choices:";
            for (const auto& choice : arg.choices) {
                std::cerr << " " << choice;
            }
            std::cerr << "]";
        }
        std::cerr << std::endl;
    }
}

ArgumentParser ArgumentParser::prd_fire_sizing_parser(const std::string& program_name) {
    ArgumentParser parser(program_name, "Fire-case relief device sizing (API 2000 / API 520 / API 526)");

    parser.add_argument("case_file", "HDF5 case file with a /CASE group");

    parser.add_option("output", "HDF5 result file to write");
    parser.add_option("sweep_points", "Number of evenly spaced fill volumes to sweep (0 disables)", "0");
    parser.add_option("profile_points", "Number of head profile samples to write (0 disables)", "0");
    parser.add_option("device", "Kokkos execution space for the fill sweep", "serial", {"serial", "openmp"});
    parser.add_flag("verbose", "Echo the case inputs and intermediate results");

    return parser;
}

} // namespace prd
