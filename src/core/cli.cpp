#include "chanmux/core/cli.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace chanmux::core {

CommandLineParser::CommandLineParser(const std::string& program_name) 
    : program_name_(program_name) {
    
    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true, "chanmux.conf");
    add_option("", "verbose", "Enable verbose logging");
    
    add_option("", "host", "Control endpoint host (send: connect to, receive: listen on)", true);
    add_option("p", "port", "Control endpoint port", true);
    add_option("n", "channels", "Number of data channels, must match on both ends", true);
    add_option("s", "chunk-size", "Chunk size in bytes (send)", true);
    add_option("", "bind", "Address the data channels listen on (send)", true);
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name, 
                                  const std::string& description, bool has_value, 
                                  const std::string& default_value) {
    options_.push_back(Option{short_name, long_name.empty() ? short_name : long_name,
                              description, has_value, default_value});
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();
    
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        
        bool parsed = true;
        if (arg.starts_with("--")) {
            parsed = parse_long_option(argc, argv, i);
        } else if (arg.size() > 1 && arg.front() == '-') {
            parsed = parse_short_options(argc, argv, i);
        } else {
            positional_args_.push_back(arg);
        }
        
        if (!parsed) {
            return false;
        }
    }
    return true;
}

bool CommandLineParser::parse_long_option(int argc, char* argv[], int& index) {
    std::string arg = argv[index];
    auto separator = arg.find('=');
    std::string name = arg.substr(2, separator == std::string::npos ? std::string::npos : separator - 2);
    
    const Option* option = find_option(name);
    if (!option || option->long_name != name) {
        error_ = "Unknown option: --" + name;
        return false;
    }
    
    if (!option->has_value) {
        if (separator != std::string::npos) {
            error_ = "Option --" + name + " does not take a value";
            return false;
        }
        parsed_options_[name] = "true";
        return true;
    }
    
    if (separator != std::string::npos) {
        parsed_options_[name] = arg.substr(separator + 1);
    } else if (index + 1 < argc) {
        parsed_options_[name] = argv[++index];
    } else {
        error_ = "Option --" + name + " requires a value";
        return false;
    }
    return true;
}

bool CommandLineParser::parse_short_options(int argc, char* argv[], int& index) {
    std::string arg = argv[index];
    
    for (std::size_t position = 1; position < arg.size(); ++position) {
        std::string flag(1, arg[position]);
        const Option* option = find_option(flag);
        if (!option || option->short_name != flag) {
            error_ = "Unknown option: -" + flag;
            return false;
        }
        
        if (!option->has_value) {
            parsed_options_[option->long_name] = "true";
            continue;
        }
        
        // The rest of the argument, or else the next one, is the value
        if (position + 1 < arg.size()) {
            parsed_options_[option->long_name] = arg.substr(position + 1);
        } else if (index + 1 < argc) {
            parsed_options_[option->long_name] = argv[++index];
        } else {
            error_ = "Option -" + flag + " requires a value";
            return false;
        }
        return true;
    }
    return true;
}

const CommandLineParser::Option* CommandLineParser::find_option(const std::string& name) const {
    auto it = std::find_if(options_.begin(), options_.end(), [&name](const Option& option) {
        return option.long_name == name || (!option.short_name.empty() && option.short_name == name);
    });
    return it != options_.end() ? &*it : nullptr;
}

bool CommandLineParser::has_option(const std::string& name) const {
    const Option* option = find_option(name);
    return option && parsed_options_.count(option->long_name) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const Option* option = find_option(name);
    if (!option) {
        return default_value;
    }
    
    auto it = parsed_options_.find(option->long_name);
    if (it != parsed_options_.end()) {
        return it->second;
    }
    return option->default_value.empty() ? default_value : option->default_value;
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    std::cout << "Options:\n";
    
    for (const auto& option : options_) {
        std::string synopsis = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        synopsis += "--" + option.long_name;
        if (option.has_value) {
            synopsis += " <value>";
        }
        
        std::cout << "  " << std::left << std::setw(26) << synopsis << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " version 1.0.0\n";
    std::cout << "Built with C++20\n";
}

}
