#pragma once

#include "filejet/core/result.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace filejet::core {

// A key FileJet reads. Settings without a default stay unset until a file or
// the command line provides them.
struct Setting {
    const char* key;
    const char* default_value;
    const char* description;
};

class Config {
public:
    static Config& instance();
    
    Config() = default;
    
    // Malformed lines and unknown keys are logged with their line number and
    // skipped or kept respectively; only an unreadable file is an error.
    Result load_from_file(const std::string& filename);
    
    // Known settings come first, each preceded by its description.
    Result save_to_file(const std::string& filename) const;
    
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    
    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    std::size_t get_size(const std::string& key, std::size_t default_value) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    std::vector<std::string> get_list(const std::string& key, const std::string& default_value = "") const;
    
    void set_defaults();
    void clear() { values_.clear(); }
    
    static const std::vector<Setting>& settings();
    static const Setting* find_setting(const std::string& key);

private:
    std::map<std::string, std::string> values_;
};

} // namespace filejet::core
