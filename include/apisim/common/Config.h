#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "apisim/common/noncopyable.h"

namespace apisim {
namespace common {

// Process-wide INI store: "[section]" headers, "key = value" lines,
// '#' and ';' comments. Keys before the first header land in [global].
class Config : noncopyable {
public:
    using Section = std::map<std::string, std::string>;

    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);
    void Clear();

    void SetString(const std::string& section, const std::string& key, const std::string& value);

    std::optional<std::string> LoadedFilename() const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key,
                          const std::string& defaultVal = "") const;
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;
    double GetDouble(const std::string& section, const std::string& key, double defaultVal = 0.0) const;
    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

    bool HasSection(const std::string& section) const;

    // Get sections whose name starts with prefix, returning (section_name, key->value) pairs.
    std::vector<std::pair<std::string, Section>> GetSectionsWithPrefix(const std::string& prefix) const;

private:
    Config() = default;

    static std::map<std::string, Section> Parse(std::istream& in);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    std::map<std::string, Section> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace apisim
