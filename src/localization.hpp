#pragma once

#include <filesystem>
#include <format>
#include <string>
#include <string_view>

void init_localization();
// Loads translations from an explicit directory instead of the default search path.
void init_localization(const std::filesystem::path& l10n_dir);
const std::string& get_string(const std::string& key);

// Variadic template for string formatting using std::format
template<typename... Args>
std::string string_format(const std::string& key, Args&&... args) {
    try {
        return std::vformat(get_string(key), std::make_format_args(args...));
    } catch (const std::format_error& e) {
        return get_string("error.format_failed") + " [" + key + "]: " + e.what();
    }
}
