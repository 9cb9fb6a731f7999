#include "chanmux/core/config.hpp"
#include "chanmux/core/logger.hpp"
#include "chanmux/core/utils.hpp"
#include <charconv>
#include <fstream>

namespace chanmux::core {

Config& Config::instance() {
    static Config instance;
    return instance;
}

bool Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_WARN("Cannot open configuration file {}", filename);
        return false;
    }
    
    std::string line;
    std::size_t line_number = 0;
    std::size_t loaded = 0;
    while (std::getline(file, line)) {
        line_number++;
        auto stripped = utils::StringUtils::trim(line);
        if (stripped.empty() || stripped.front() == '#') {
            continue;
        }
        
        auto entry = parse_line(stripped);
        if (!entry) {
            LOG_WARN("{}:{}: ignoring malformed setting '{}'", filename, line_number, stripped);
            continue;
        }
        values_[entry->first] = entry->second;
        loaded++;
    }
    
    LOG_DEBUG("Loaded {} settings from {}", loaded, filename);
    return true;
}

std::optional<std::pair<std::string, std::string>> Config::parse_line(const std::string& line) {
    auto separator = line.find('=');
    if (separator == std::string::npos) {
        return std::nullopt;
    }
    
    auto key = utils::StringUtils::trim(line.substr(0, separator));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(key, utils::StringUtils::trim(line.substr(separator + 1)));
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    if (!value || value->empty()) {
        return default_value;
    }
    
    int parsed = 0;
    const char* first = value->data();
    const char* last = first + value->size();
    auto [end, error] = std::from_chars(first, last, parsed);
    if (error != std::errc() || end != last) {
        LOG_WARN("Setting {}='{}' is not an integer, using {}", key, *value, default_value);
        return default_value;
    }
    return parsed;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    return get(key).value_or(default_value);
}

void Config::set_defaults() {
    values_["transfer.chunk_size"] = "65536";
    values_["transfer.channels"] = "4";
    values_["transfer.resubmission_timeout_ms"] = "1000";
    values_["control.host"] = "127.0.0.1";
    values_["control.port"] = "9400";
    values_["data.address"] = "127.0.0.1";
    values_["log.level"] = "info";
    values_["log.file"] = "chanmux.log";
}

}
