#include "url.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>

namespace {
    struct CurlUrlDeleter {
        void operator()(CURLU* handle) const {
            if (handle) {
                curl_url_cleanup(handle);
            }
        }
    };
    using CurlUrlHandle = std::unique_ptr<CURLU, CurlUrlDeleter>;

    std::optional<std::string> get_part(CURLU* handle, CURLUPart part) {
        char* value = nullptr;
        if (curl_url_get(handle, part, &value, 0) != CURLUE_OK || value == nullptr) {
            return std::nullopt;
        }
        std::string out(value);
        curl_free(value);
        return out;
    }

    bool iequals(const std::string& a, const std::string& b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
        });
    }
}

bool is_valid_url(const std::string& url) {
    if (url.empty()) {
        return false;
    }
    if (std::any_of(url.begin(), url.end(), [](char c) { return std::isspace(static_cast<unsigned char>(c)); })) {
        return false;
    }

    CurlUrlHandle handle(curl_url());
    if (!handle) {
        return false;
    }
    // No CURLU_DEFAULT_SCHEME: a missing scheme is a parse failure.
    if (curl_url_set(handle.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return false;
    }

    auto scheme = get_part(handle.get(), CURLUPART_SCHEME);
    if (!scheme || !(iequals(*scheme, "http") || iequals(*scheme, "https"))) {
        return false;
    }
    auto host = get_part(handle.get(), CURLUPART_HOST);
    return host && !host->empty();
}

std::string url_filename(const std::string& url) {
    size_t pos = url.rfind('/');
    if (pos == std::string::npos) {
        return url;
    }
    return url.substr(pos + 1);
}
