#pragma once

#include "RunSettings.h"

#include <wx/fileconf.h>

#include <memory>
#include <string>

namespace YtMerge {

// Persistent settings in a wxFileConfig INI file
class SettingsManager {
public:
    // Empty path = defaultSettingsPath()
    explicit SettingsManager(const std::string& path = "");
    ~SettingsManager();

    // Writes pending changes, then rereads the file; a missing file is not an error
    bool Load();
    bool Save();

    std::string GetString(const std::string& key, const std::string& defaultValue = "") const;
    int GetInt(const std::string& key, int defaultValue = 0) const;
    double GetDouble(const std::string& key, double defaultValue = 0.0) const;
    bool GetBool(const std::string& key, bool defaultValue = false) const;

    void SetString(const std::string& key, const std::string& value);
    void SetInt(const std::string& key, int value);
    void SetDouble(const std::string& key, double value);
    void SetBool(const std::string& key, bool value);

    bool Has(const std::string& key) const;

    const std::string& getPath() const { return m_path; }
    std::string getLastError() const { return m_lastError; }

    static std::string defaultSettingsPath();

private:
    void open();

    std::string m_path;
    std::unique_ptr<wxFileConfig> m_config;
    std::string m_lastError;
};

// Copy recognised keys from the settings file over the given run settings
void applySettings(const SettingsManager& manager, RunSettings& settings);

// Store run settings under the keys applySettings reads
void storeSettings(const RunSettings& settings, SettingsManager& manager);

} // namespace YtMerge
