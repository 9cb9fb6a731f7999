#pragma once

#include <map>
#include <string>
#include <vector>

namespace chanmux::core {

class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);
    
    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");
    
    // Accepts "--name value", "--name=value", "-n value", "-nvalue" and
    // bundled flags such as "-hv". Anything else is positional.
    bool parse(int argc, char* argv[]);
    
    // Short and long names are both accepted
    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    
    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }
    
    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string short_name;
        std::string long_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };
    
    // Each consumes argv[index] and, for a separate value, advances index
    bool parse_long_option(int argc, char* argv[], int& index);
    bool parse_short_options(int argc, char* argv[], int& index);
    
    const Option* find_option(const std::string& name) const;
    
    std::string program_name_;
    std::vector<Option> options_;
    std::map<std::string, std::string> parsed_options_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
