#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace chanmux::core {

// key=value settings shared by the engines and the command line front end.
class Config {
public:
    static Config& instance();
    
    Config() = default;
    
    // Reads "key = value" lines; blank lines and '#' comments are skipped,
    // lines without a key are reported and ignored. Returns false only when
    // the file cannot be opened.
    bool load_from_file(const std::string& filename);
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    // The whole value must be a decimal integer in range, otherwise the
    // default is returned
    int get_int(const std::string& key, int default_value = 0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    
    void set_defaults();
    void clear() { values_.clear(); }

private:
    static std::optional<std::pair<std::string, std::string>> parse_line(const std::string& line);
    
    std::map<std::string, std::string> values_;
};

}
