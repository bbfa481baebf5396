/**
 * @file config.cpp
 * @brief Config 类实现
 */

#include "base/config.hpp"
#include "base/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ironlink {

namespace {

std::string strip(const std::string& text) {
    const char* blanks = " \t\r\n\f\v";
    const size_t begin = text.find_first_not_of(blanks);
    if (begin == std::string::npos) {
        return "";
    }
    const size_t end = text.find_last_not_of(blanks);
    return text.substr(begin, end - begin + 1);
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void warn_invalid(const char* what, const std::string& section, const std::string& key,
                  const std::string& value) {
    LOG_WARN() << "[Config] Invalid " << what << " for " << section << "." << key
               << ": '" << value << "', using default";
}

} // namespace

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::load(const std::string& filename) {
    std::ifstream file(filename);

    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
    if (!file) {
        LOG_ERROR() << "[Config] Could not open config file " << filename;
        return false;
    }

    std::string section;
    std::string raw;
    int line_no = 0;
    size_t entries = 0;
    while (std::getline(file, raw)) {
        ++line_no;
        const std::string line = strip(raw);
        if (line.empty() || line.front() == ';' || line.front() == '#') {
            continue;
        }
        if (line.front() == '[') {
            if (line.back() != ']') {
                LOG_WARN() << "[Config] " << filename << ":" << line_no << " unterminated section header";
                continue;
            }
            section = strip(line.substr(1, line.size() - 2));
            continue;
        }
        const size_t eq = line.find('=');
        const std::string key = eq == std::string::npos ? "" : strip(line.substr(0, eq));
        if (key.empty()) {
            LOG_WARN() << "[Config] " << filename << ":" << line_no << " ignored, expected key = value";
            continue;
        }
        data_[section][key] = strip(line.substr(eq + 1));
        ++entries;
    }
    LOG_DEBUG() << "[Config] Loaded " << entries << " entries from " << filename;
    return true;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

const std::string* Config::find(const std::string& section, const std::string& key) const {
    auto sec = data_.find(section);
    if (sec == data_.end()) {
        return nullptr;
    }
    auto it = sec->second.find(key);
    return it == sec->second.end() ? nullptr : &it->second;
}

bool Config::has(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find(section, key) != nullptr;
}

std::string Config::get(const std::string& section, const std::string& key, const std::string& default_value) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string* value = find(section, key);
    return value ? *value : default_value;
}

int Config::get_int(const std::string& section, const std::string& key, int default_value) {
    const std::string text = get(section, key);
    if (text.empty()) {
        return default_value;
    }
    try {
        size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // 落到下面的 WARN
    }
    warn_invalid("integer", section, key, text);
    return default_value;
}

double Config::get_double(const std::string& section, const std::string& key, double default_value) {
    const std::string text = get(section, key);
    if (text.empty()) {
        return default_value;
    }
    try {
        size_t used = 0;
        const double value = std::stod(text, &used);
        if (used == text.size()) {
            return value;
        }
    } catch (const std::exception&) {
        // 落到下面的 WARN
    }
    warn_invalid("number", section, key, text);
    return default_value;
}

bool Config::get_bool(const std::string& section, const std::string& key, bool default_value) {
    const std::string text = lowercase(get(section, key));
    if (text == "true" || text == "yes" || text == "on" || text == "1") {
        return true;
    }
    if (text == "false" || text == "no" || text == "off" || text == "0") {
        return false;
    }
    if (!text.empty()) {
        warn_invalid("boolean", section, key, text);
    }
    return default_value;
}

std::chrono::milliseconds Config::get_duration(const std::string& section, const std::string& key,
                                               std::chrono::milliseconds default_value) {
    const std::string text = lowercase(get(section, key));
    if (text.empty()) {
        return default_value;
    }

    size_t digits = 0;
    while (digits < text.size() && std::isdigit(static_cast<unsigned char>(text[digits]))) {
        ++digits;
    }
    const std::string unit = strip(text.substr(digits));
    long long scale = 0;
    if (unit.empty() || unit == "ms") {
        scale = 1;
    } else if (unit == "s") {
        scale = 1000;
    } else if (unit == "m") {
        scale = 60 * 1000;
    }

    if (digits == 0 || digits > 9 || scale == 0) {
        warn_invalid("duration", section, key, text);
        return default_value;
    }
    return std::chrono::milliseconds(std::stoll(text.substr(0, digits)) * scale);
}

std::vector<std::string> Config::get_list(const std::string& section, const std::string& key,
                                          const std::string& default_value) {
    std::vector<std::string> items;
    std::istringstream in(get(section, key, default_value));
    std::string item;
    while (std::getline(in, item, ',')) {
        item = strip(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace ironlink
