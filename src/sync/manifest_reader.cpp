#include "sync/manifest_reader.hpp"

#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <system_error>

namespace luasync {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

// Returns the byte offset of the first invalid sequence, or npos.
size_t FindInvalidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<std::uint8_t>(s[i]);
        size_t len = 0;
        std::uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            len = 2;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4;
            cp = c & 0x07;
        } else {
            return i;
        }
        if (i + len > s.size()) return i;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<std::uint8_t>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // Overlong forms, surrogates and out-of-range code points.
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return i;
        }
        i += len;
    }
    return std::string_view::npos;
}

} // namespace

Result ManifestReader::Read(const std::filesystem::path& path, std::vector<std::string>& out) const {
    out.clear();

    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return Result::Fail(ErrorKind::ManifestReadError,
                            "cannot stat manifest " + path.string() + ": " + ec.message());
    }
    if (!exists) {
        return Result::Fail(ErrorKind::ManifestMissing, "manifest not found: " + path.string());
    }
    if (std::filesystem::is_directory(path, ec)) {
        return Result::Fail(ErrorKind::ManifestReadError, "manifest is a directory: " + path.string());
    }

    std::ifstream is(path, std::ios::binary);
    if (!is.good()) {
        return Result::Fail(ErrorKind::ManifestReadError, "cannot open manifest: " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
    if (is.bad()) {
        return Result::Fail(ErrorKind::ManifestReadError, "read failed: " + path.string());
    }

    auto res = Parse(content, out);
    if (!res.is_ok()) {
        return Result::Fail(res.kind, res.msg + " in " + path.string());
    }

    LogDebug("manifest %s: %zu entries", path.string().c_str(), out.size());
    return Result::Ok();
}

Result ManifestReader::Parse(std::string_view content, std::vector<std::string>& out) const {
    out.clear();

    if (StartsWith(content, kUtf8Bom)) content.remove_prefix(kUtf8Bom.size());

    if (const size_t bad = FindInvalidUtf8(content); bad != std::string_view::npos) {
        return Result::Fail(ErrorKind::ManifestReadError,
                            "invalid UTF-8 at byte " + std::to_string(bad));
    }

    while (!content.empty()) {
        const size_t nl = content.find('\n');
        const std::string_view line = Trim(content.substr(0, nl));
        if (!line.empty()) out.emplace_back(line);
        if (nl == std::string_view::npos) break;
        content.remove_prefix(nl + 1);
    }
    return Result::Ok();
}

std::vector<std::string> ActiveEntries(const std::vector<std::string>& entries) {
    std::vector<std::string> active;
    active.reserve(entries.size());
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(active),
                 [](const std::string& e) { return !IsCommentEntry(e); });
    return active;
}

std::vector<std::string> DefaultManifestTemplate() {
    std::vector<std::string> names = {
        "TVSources.zip",
        "YT.lua",
        "beeline-timeshift_ext.lua",
        "beeline-tv.lua",
        "beeline-tv_pls.lua",
        "dropbox.lua",
        "edem-timeshift_ext.lua",
        "filmix.lua",
        "hdrezka.lua",
        "inetcom.lua",
        "inetcom_pls.lua",
        "iviru.lua",
        "kinopoisk.lua",
        "kinopoisk_films-a_pls.lua",
        "kinopoisk_serials-a_pls.lua",
        "mediavitrina.lua",
        "ok.lua",
        "playerjs.lua",
        "psevdotv.bond_007.lua",
        "psevdotv.film_ussr.lua",
        "psevdotv.ivi_kinoteatr.lua",
        "psevdotv.jackie_chan.lua",
        "psevdotv_pls.lua",
        "regions_pls.lua",
        "rutube.lua",
        "rutv.lua",
        "rutv_pls.lua",
        "salomtv.lua",
        "salomtv_pls.lua",
        "smartKZ.lua",
        "smartKZ_pls.lua",
        "telegram.lua",
        "wink-timeshift_ext.lua",
        "wink-tv.lua",
        "wink-tv_pls.lua",
        "yandex+radio_pls.lua",
        "yandex-timeshift_ext.lua",
    };
    std::sort(names.begin(), names.end());
    return names;
}

Result WriteManifestTemplate(const std::filesystem::path& path) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result::Fail(ErrorKind::FileSystemError,
                                "create_directories failed: " + path.parent_path().string() + ": " +
                                    ec.message());
        }
    }

    std::string content;
    const auto names = DefaultManifestTemplate();
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) content.push_back('\n');
        content += names[i];
    }

    FileWriter writer;
    auto res = FileWriter::Open(path.string(), writer);
    if (!res.is_ok()) return res;

    res = writer.WriteAll({reinterpret_cast<const std::uint8_t*>(content.data()), content.size()});
    if (!res.is_ok()) return res;

    return writer.Close();
}

} // namespace luasync
