#pragma once

#include <map>
#include <string>
#include <vector>

namespace prd {

/**
 * @brief Minimal command-line parser: positional arguments, --name VALUE options and --name flags.
 *
 * Arguments starting with --kokkos- are left to Kokkos::initialize.
 */
class ArgumentParser {
public:
    struct Argument {
        std::string name;
        std::string help;
        bool is_flag = false;
        std::string default_value;
        std::string value;
        std::vector<std::string> choices;   // empty means any value is accepted
    };

    ArgumentParser(const std::string& program_name, const std::string& description);

    // Required positional argument, in declaration order
    void add_argument(const std::string& name, const std::string& help);

    void add_option(const std::string& name, const std::string& help, const std::string& default_value = "");

    // Option restricted to a list of values
    void add_option(const std::string& name, const std::string& help, const std::string& default_value,
                    const std::vector<std::string>& choices);

    void add_flag(const std::string& name, const std::string& help);

    /**
     * @brief Parse argv. Prints usage to std::cerr and returns false on --help or bad input.
     */
    bool parse(int argc, char* argv[]);

    std::string get_positional(size_t index) const;
    std::string get_option(const std::string& name) const;
    bool get_flag(const std::string& name) const;

    /**
     * @brief Value of an option as a non-negative count.
     * @throws std::invalid_argument if the value is not a non-negative integer.
     */
    size_t get_count(const std::string& name) const;

    void print_help() const;

    // Parser for the prd_fire_sizing driver
    static ArgumentParser prd_fire_sizing_parser(const std::string& program_name);

private:
    bool accepts(const Argument& arg, const std::string& value) const;

    std::string program_name_;
    std::string description_;
    std::vector<Argument> positional_args_;
    std::map<std::string, Argument> optional_args_;
};

} // namespace prd
