#include "SettingsManager.h"
#include "utils/DebugLogger.h"

#include <wx/filename.h>

#include <cstdlib>
#include <filesystem>

namespace YtMerge {

namespace fs = std::filesystem;

namespace {

wxString toWx(const std::string& text) {
    return wxString::FromUTF8(text.c_str());
}

std::string fromWx(const wxString& text) {
    return std::string(text.ToUTF8().data());
}

} // namespace

SettingsManager::SettingsManager(const std::string& path)
    : m_path(path.empty() ? defaultSettingsPath() : path)
{
    open();
}

SettingsManager::~SettingsManager() {
    if (m_config) {
        m_config->Flush();
    }
}

std::string SettingsManager::defaultSettingsPath() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return (fs::path(xdg) / "ytmerge" / "settings.ini").string();
    }
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return (fs::path(home) / ".config" / "ytmerge" / "settings.ini").string();
    }
    return "ytmerge_settings.ini";
}

void SettingsManager::open() {
    // wxFileConfig resolves relative names against the home directory
    std::error_code ec;
    fs::path file = fs::absolute(m_path, ec);
    if (ec) file = m_path;

    // The old config flushes on destruction, so it must go before the file is reread
    m_config.reset();
    m_config = std::make_unique<wxFileConfig>("ytmerge", wxEmptyString, toWx(file.string()),
                                              wxEmptyString, wxCONFIG_USE_LOCAL_FILE);
    m_config->SetExpandEnvVars(false);
}

bool SettingsManager::Load() {
    m_lastError.clear();
    std::error_code ec;
    if (fs::exists(m_path, ec) && !wxFileName::IsFileReadable(toWx(m_path))) {
        m_lastError = "Could not open settings file: " + m_path;
        return false;
    }
    open();
    return true;
}

bool SettingsManager::Save() {
    m_lastError.clear();
    fs::path p(m_path);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
            m_lastError = "Could not create settings directory: " + ec.message();
            return false;
        }
    }

    if (!m_config->Flush()) {
        m_lastError = "Could not write settings file: " + m_path;
        DebugLogger::getInstance().write("[Settings] " + m_lastError);
        return false;
    }
    return true;
}

std::string SettingsManager::GetString(const std::string& key, const std::string& defaultValue) const {
    return fromWx(m_config->Read(toWx(key), toWx(defaultValue)));
}

int SettingsManager::GetInt(const std::string& key, int defaultValue) const {
    return static_cast<int>(m_config->ReadLong(toWx(key), defaultValue));
}

double SettingsManager::GetDouble(const std::string& key, double defaultValue) const {
    return m_config->ReadDouble(toWx(key), defaultValue);
}

bool SettingsManager::GetBool(const std::string& key, bool defaultValue) const {
    return m_config->ReadBool(toWx(key), defaultValue);
}

void SettingsManager::SetString(const std::string& key, const std::string& value) {
    m_config->Write(toWx(key), toWx(value));
}

void SettingsManager::SetInt(const std::string& key, int value) {
    m_config->Write(toWx(key), static_cast<long>(value));
}

void SettingsManager::SetDouble(const std::string& key, double value) {
    m_config->Write(toWx(key), value);
}

void SettingsManager::SetBool(const std::string& key, bool value) {
    m_config->Write(toWx(key), value);
}

bool SettingsManager::Has(const std::string& key) const {
    return m_config->HasEntry(toWx(key));
}

void applySettings(const SettingsManager& manager, RunSettings& settings) {
    settings.resolution = manager.GetString("resolution", settings.resolution);
    settings.outputPath = manager.GetString("output", settings.outputPath);
    settings.outputFormat = manager.GetString("format", settings.outputFormat);
    settings.enableTransitions = manager.GetBool("transitions", settings.enableTransitions);
    settings.fadeDuration = manager.GetDouble("fade_duration", settings.fadeDuration);
    settings.backgroundMusic = manager.GetString("music", settings.backgroundMusic);
    settings.musicVolume = manager.GetDouble("music_volume", settings.musicVolume);
    settings.maxConcurrentDownloads = manager.GetInt("max_downloads", settings.maxConcurrentDownloads);
    settings.cacheDir = manager.GetString("cache_dir", settings.cacheDir);
    settings.skipCachedDownloads = manager.GetBool("skip_cached_downloads", settings.skipCachedDownloads);
}

void storeSettings(const RunSettings& settings, SettingsManager& manager) {
    manager.SetString("resolution", settings.resolution);
    manager.SetString("output", settings.outputPath);
    manager.SetString("format", settings.outputFormat);
    manager.SetBool("transitions", settings.enableTransitions);
    manager.SetDouble("fade_duration", settings.fadeDuration);
    manager.SetString("music", settings.backgroundMusic);
    manager.SetDouble("music_volume", settings.musicVolume);
    manager.SetInt("max_downloads", settings.maxConcurrentDownloads);
    manager.SetString("cache_dir", settings.cacheDir);
    manager.SetBool("skip_cached_downloads", settings.skipCachedDownloads);
}

} // namespace YtMerge
