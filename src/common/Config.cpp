#include "apisim/common/Config.h"
#include "apisim/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace apisim {
namespace common {

namespace {

std::string Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::map<std::string, Config::Section> Config::Parse(std::istream& in) {
    std::map<std::string, Section> parsed;
    std::string line, section = "global";
    while (std::getline(in, line)) {
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[' && line.back() == ']') {
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) continue;
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        if (!key.empty()) parsed[section][key] = value;
    }
    return parsed;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    auto parsed = Parse(file);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
        loadedFilename_ = filename;
    }

    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    auto parsed = Parse(in);
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

void Config::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
    loadedFilename_.clear();
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[section][key] = value;
}

std::optional<std::string> Config::LoadedFilename() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (loadedFilename_.empty()) return std::nullopt;
    return loadedFilename_;
}

std::string Config::GetString(const std::string& section, const std::string& key,
                              const std::string& defaultVal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? defaultVal : kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        LOG_WARN << "Config [" << section << "] " << key << " is not an integer: " << val;
        return defaultVal;
    }
}

double Config::GetDouble(const std::string& section, const std::string& key, double defaultVal) const {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        return std::stod(val);
    } catch (const std::logic_error&) {
        LOG_WARN << "Config [" << section << "] " << key << " is not a number: " << val;
        return defaultVal;
    }
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) const {
    std::string val = GetString(section, key, "");
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    return defaultVal;
}

bool Config::HasSection(const std::string& section) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.count(section) > 0;
}

std::vector<std::pair<std::string, Config::Section>> Config::GetSectionsWithPrefix(const std::string& prefix) const {
    std::vector<std::pair<std::string, Section>> out;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : settings_) {
        if (kv.first.rfind(prefix, 0) != 0) continue;
        out.push_back({kv.first, kv.second});
    }
    return out;
}

} // namespace common
} // namespace apisim
