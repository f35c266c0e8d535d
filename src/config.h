#ifndef FACESIFT_CONFIG_H
#define FACESIFT_CONFIG_H

#include <string>
#include <map>
#include <optional>
#include <vector>

namespace facesift {

// INI-style configuration: [section] key = value, '#' or ';' comments.
// Values from successive load() calls are merged; later files win.
class Config {
public:
    Config() = default;

    // Process-wide instance used by the CLI
    static Config& getInstance();

    bool load(const std::string& path);

    std::optional<std::string> getString(const std::string& section, const std::string& key) const;
    std::optional<int> getInt(const std::string& section, const std::string& key) const;
    std::optional<double> getDouble(const std::string& section, const std::string& key) const;
    std::optional<bool> getBool(const std::string& section, const std::string& key) const;

    // Comma-separated list, entries trimmed, empty entries dropped
    std::optional<std::vector<std::string>> getList(const std::string& section, const std::string& key) const;

    void set(const std::string& section, const std::string& key, const std::string& value);

    // Validation errors from the last load()
    std::vector<std::string> getValidationErrors() const { return validation_errors_; }

private:
    std::map<std::string, std::map<std::string, std::string>> data_;
    std::vector<std::string> validation_errors_;

    static std::string trim(const std::string& str);
    bool validate();
    bool validateInt(const std::string& section, const std::string& key, int min_val, int max_val);
    bool validateDouble(const std::string& section, const std::string& key, double min_val, double max_val);
    bool validateBool(const std::string& section, const std::string& key);
};

} // namespace facesift

#endif // FACESIFT_CONFIG_H
