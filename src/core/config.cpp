#include "filejet/core/config.hpp"
#include "filejet/core/logger.hpp"
#include "filejet/core/utils.hpp"
#include <charconv>
#include <fstream>
#include <set>

namespace filejet::core {

namespace {
    const std::vector<Setting> SETTINGS = {
        {"node.id", nullptr, "Session id this node listens on (6 digits); random when unset"},
        {"rendezvous.database", "filejet_rendezvous.db", "SQLite database shared with the peer"},
        {"rendezvous.poll_interval_ms", "200", "How often the rendezvous database is polled"},
        {"network.ice_servers", "stun:stun.l.google.com:19302", "Comma separated STUN/TURN urls"},
        {"network.bind_address", "0.0.0.0", "Address the data listener binds to"},
        {"network.advertised_hosts", "127.0.0.1", "Comma separated hosts offered as candidates"},
        {"transfer.chunk_size", "16384", "Bytes per data message"},
        {"transfer.buffer_threshold", "262144", "Pause sending above this many buffered bytes"},
        {"transfer.buffer_low_threshold", "131072", "Resume sending at or below this many buffered bytes"},
        {"transfer.output_dir", ".", "Directory received files are saved to"},
        {"log.level", "info", "trace, debug, info, warn, error, critical or off"},
        {"log.file", "filejet.log", "Log file path"},
    };
    
    template<typename T>
    std::optional<T> parse_number(const std::string& text) {
        T value{};
        auto end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc() || ptr != end || text.empty()) {
            return std::nullopt;
        }
        return value;
    }
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

const std::vector<Setting>& Config::settings() {
    return SETTINGS;
}

const Setting* Config::find_setting(const std::string& key) {
    for (const auto& setting : SETTINGS) {
        if (key == setting.key) {
            return &setting;
        }
    }
    return nullptr;
}

Result Config::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return Result(ErrorCode::INVALID_INPUT, "Cannot read configuration file " + filename);
    }
    
    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        line = utils::StringUtils::trim(line);
        
        if (line.empty() || line[0] == '#') {
            continue;
        }
        
        auto eq_pos = line.find('=');
        std::string key = eq_pos == std::string::npos ? "" : utils::StringUtils::trim(line.substr(0, eq_pos));
        if (key.empty()) {
            LOG_WARN("{}:{}: expected key=value, line ignored", filename, line_number);
            continue;
        }
        if (!find_setting(key)) {
            LOG_WARN("{}:{}: unknown setting '{}'", filename, line_number, key);
        }
        
        values_[key] = utils::StringUtils::trim(line.substr(eq_pos + 1));
    }
    
    return Result();
}

Result Config::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return Result(ErrorCode::INVALID_INPUT, "Cannot write configuration file " + filename);
    }
    
    file << "# FileJet configuration\n";
    
    std::set<std::string> written;
    for (const auto& setting : SETTINGS) {
        auto it = values_.find(setting.key);
        if (it == values_.end()) {
            continue;
        }
        file << "\n# " << setting.description << "\n" << it->first << "=" << it->second << "\n";
        written.insert(it->first);
    }
    
    bool header = false;
    for (const auto& [key, value] : values_) {
        if (written.count(key)) {
            continue;
        }
        if (!header) {
            file << "\n# Other settings\n";
            header = true;
        }
        file << key << "=" << value << "\n";
    }
    
    if (!file) {
        return Result(ErrorCode::INVALID_INPUT, "Failed writing configuration file " + filename);
    }
    return Result();
}

void Config::set(const std::string& key, const std::string& value) {
    values_[key] = value;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Config::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    auto lower = utils::StringUtils::to_lower(*value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

int Config::get_int(const std::string& key, int default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    auto parsed = parse_number<int>(*value);
    return parsed ? *parsed : default_value;
}

std::size_t Config::get_size(const std::string& key, std::size_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;
    
    auto parsed = parse_number<std::size_t>(*value);
    if (!parsed || *parsed == 0) {
        LOG_WARN("Ignoring {} = '{}', expected a positive number", key, *value);
        return default_value;
    }
    return *parsed;
}

std::string Config::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    return value ? *value : default_value;
}

std::vector<std::string> Config::get_list(const std::string& key, const std::string& default_value) const {
    auto items = utils::StringUtils::split_list(get_string(key, default_value));
    if (items.empty()) {
        return utils::StringUtils::split_list(default_value);
    }
    return items;
}

void Config::set_defaults() {
    for (const auto& setting : SETTINGS) {
        if (setting.default_value) {
            values_[setting.key] = setting.default_value;
        }
    }
}

} // namespace filejet::core
