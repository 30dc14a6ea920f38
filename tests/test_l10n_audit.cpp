#include <gtest/gtest.h>
#include "localization.hpp"
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <vector>

namespace fs = std::filesystem;

class L10nIntegrityTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_localization(fs::path(BULKDL_SOURCE_DIR) / "l10n");
    }

    std::set<std::string> extract_keys_from_source(const fs::path& src_dir) {
        std::set<std::string> keys;
        std::regex key_regex("(?:get_string|string_format)\\s*\\(\\s*\"([^\"]+)\"");

        for (auto const& dir_entry : fs::recursive_directory_iterator(src_dir)) {
            if (dir_entry.is_regular_file() && (dir_entry.path().extension() == ".cpp" || dir_entry.path().extension() == ".hpp")) {
                std::ifstream f(dir_entry.path());
                std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
                auto words_begin = std::sregex_iterator(content.begin(), content.end(), key_regex);
                auto words_end = std::sregex_iterator();
                for (std::sregex_iterator i = words_begin; i != words_end; ++i) {
                    keys.insert((*i)[1].str());
                }
            }
        }
        return keys;
    }
};

TEST_F(L10nIntegrityTest, AllSourceKeysExistInTranslations) {
    auto source_keys = extract_keys_from_source(fs::path(BULKDL_SOURCE_DIR) / "src");
    ASSERT_FALSE(source_keys.empty());

    // Looked up by the logging prefix helpers.
    for (const char* k : {"info.log_prefix", "warning.prefix", "error.prefix"}) source_keys.insert(k);

    std::vector<std::string> missing_keys;
    for (const auto& key : source_keys) {
        if (get_string(key).find("[MISSING_STRING:") != std::string::npos) {
            missing_keys.push_back(key);
        }
    }

    std::string error_msg = "The following keys are missing in localization files: ";
    for (const auto& k : missing_keys) error_msg += k + ", ";

    EXPECT_TRUE(missing_keys.empty()) << error_msg;
}

TEST_F(L10nIntegrityTest, MissingKeyRendersPlaceholder) {
    EXPECT_EQ(get_string("no.such.key"), "[MISSING_STRING: no.such.key]");
}

TEST_F(L10nIntegrityTest, FormatsPlaceholders) {
    EXPECT_EQ(string_format("error.terminal_http_error", 404, "http://x/b.png"), "404 for: http://x/b.png");
}

TEST_F(L10nIntegrityTest, FormatFailureUsesTranslatedPrefix) {
    std::string text = string_format("error.terminal_http_error", 404);
    EXPECT_EQ(text.rfind(get_string("error.format_failed") + " [error.terminal_http_error]", 0), 0u) << text;
}
