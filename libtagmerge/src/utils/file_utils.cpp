//
// Created by Giuseppe Francione on 19/10/26.
//

#include <filesystem>
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/tag_error.hpp"
#include <algorithm>
#include <cctype>
#include <memory>

namespace tagmerge {

    namespace {
        // raii wrapper for file pointers
        struct FileCloser {
            void operator()(FILE *f) const { if (f) std::fclose(f); }
        };
        using unique_FILE = std::unique_ptr<FILE, FileCloser>;
    } // namespace

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);
        return _wfopen(path.wstring().c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    std::vector<unsigned char> read_file_bytes(const std::filesystem::path& path) {
        unique_FILE fp(open_file(path, "rb"));
        if (!fp) {
            Logger::log(LogLevel::Error, "Can't open file: " + path.string(), "file_utils");
            throw TagError(ErrorKind::Io, "cannot open file: " + path.string());
        }

        std::vector<unsigned char> data;
        unsigned char buffer[64 * 1024];
        std::size_t n = 0;
        while ((n = std::fread(buffer, 1, sizeof(buffer), fp.get())) > 0) {
            data.insert(data.end(), buffer, buffer + n);
        }
        if (std::ferror(fp.get())) {
            Logger::log(LogLevel::Error, "Read error on file: " + path.string(), "file_utils");
            throw TagError(ErrorKind::Io, "cannot read file: " + path.string());
        }
        return data;
    }

    std::string mime_from_extension(const std::filesystem::path& path) {
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (ext == ".png") return "image/png";
        if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
        if (ext == ".webp") return "image/webp";
        if (ext == ".gif") return "image/gif";
        return {};
    }

    std::string cover_mime_for(const std::filesystem::path& path, const std::string_view explicit_mime) {
        if (!explicit_mime.empty()) {
            return std::string(explicit_mime);
        }
        std::string mime = mime_from_extension(path);
        if (mime.empty()) {
            Logger::log(LogLevel::Error, "Unknown image type: " + path.string(), "file_utils");
            throw TagError(ErrorKind::PictureEncode,
                           "cannot guess the image type of " + path.string() + ", pass --cover-mime");
        }
        return mime;
    }

} // namespace tagmerge
