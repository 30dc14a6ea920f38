#include "localization.hpp"
#include "utils.hpp"

#include <climits>
#include <cstdlib>
#include <fstream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
    std::unordered_map<std::string, std::string> translations;
    std::unordered_map<std::string, std::string> missing_key_placeholders;
    std::mutex missing_mutex;

    fs::path get_executable_dir() {
        char result[PATH_MAX];
        ssize_t count = readlink("/proc/self/exe", result, PATH_MAX - 1);
        if (count != -1) {
            result[count] = '\0';
            return fs::path(result).parent_path();
        }
        return fs::current_path();
    }

    std::string detect_language() {
        const char* lang_env = getenv("LANG");
        if (lang_env && std::string(lang_env).starts_with("zh")) {
            return "zh";
        }
        return "en";
    }

    bool load_strings(const std::string& lang, const fs::path& base_dir) {
        std::ifstream file(base_dir / (lang + ".txt"));
        if (!file.is_open()) {
            if (lang != "en") {
                return load_strings("en", base_dir);
            }
            return false;
        }

        std::string line;
        while (std::getline(file, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#') continue;
            size_t pos = line.find('=');
            if (pos != std::string::npos) {
                translations[line.substr(0, pos)] = line.substr(pos + 1);
            }
        }
        return true;
    }
}

void init_localization(const fs::path& l10n_dir) {
    translations.clear();
    if (!load_strings(detect_language(), l10n_dir)) {
        log_warning("Could not open localization files in " + l10n_dir.string());
    }
}

void init_localization() {
    fs::path relative_l10n_dir = get_executable_dir() / ".." / "l10n";
    if (fs::is_directory(relative_l10n_dir)) {
        init_localization(relative_l10n_dir);
    } else {
        init_localization(fs::path(BULKDL_L10N_DIR));
    }
}

const std::string& get_string(const std::string& key) {
    auto it = translations.find(key);
    if (it != translations.end()) {
        return it->second;
    }
    std::lock_guard<std::mutex> lock(missing_mutex);
    auto missing_it = missing_key_placeholders.find(key);
    if (missing_it == missing_key_placeholders.end()) {
        missing_it = missing_key_placeholders.emplace(key, "[MISSING_STRING: " + key + "]").first;
    }
    return missing_it->second;
}
