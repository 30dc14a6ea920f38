#include "writer.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "url.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

namespace fs = std::filesystem;

std::uintmax_t write_file(const fs::path& directory, const std::string& filename, const std::string& body) {
    if (filename.empty() || filename == "." || filename == "..") {
        throw BulkdlException(string_format("error.bad_output_filename", filename));
    }

    fs::path output_path = directory / filename;
    std::ofstream ofile(output_path, std::ios::binary | std::ios::trunc);
    if (!ofile) {
        throw BulkdlException(string_format("error.create_file_failed", output_path.string()) + ": " + strerror(errno));
    }
    ofile.write(body.data(), static_cast<std::streamsize>(body.size()));
    ofile.close();
    if (!ofile) {
        throw BulkdlException(string_format("error.write_file_failed", output_path.string()));
    }
    return body.size();
}

Outcome write_download(const fs::path& directory, const std::string& url, const std::string& body) {
    std::string filename = url_filename(url);
    try {
        std::uintmax_t bytes = write_file(directory, filename, body);
        return Outcome::success(url, filename, bytes);
    } catch (const BulkdlException& e) {
        return Outcome::filesystem_error(url, e.what());
    }
}
