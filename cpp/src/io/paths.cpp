// ==============================================================================
// paths.cpp - Нормализация путей и рабочих директорий
// ==============================================================================

#include "bridge/paths.hpp"

#include "bridge/platform.hpp"

#include <iomanip>
#include <openssl/sha.h>
#include <sstream>
#include <system_error>

namespace bridge::io {

namespace {

// Системные директории, которые нельзя сканировать по явному запросу
const char* const SYSTEM_DIRS[] = {
    "/etc",     "/usr",       "/var",     "/bin",           "/sbin",
    "/System",  "/Library",   "/Windows", "/Program Files", "/Program Files (x86)",
    "C:\\Windows", "C:\\Program Files", "C:\\Program Files (x86)",
};

/// Убрать завершающий разделитель ("/a/b/" -> "/a/b"), корень не трогаем
std::filesystem::path strip_trailing_separator(std::filesystem::path p) {
    if (!p.has_filename() && p.has_relative_path()) {
        return p.parent_path();
    }
    return p;
}

}  // namespace

std::filesystem::path expand_home(std::string_view input) {
    if (input == "~") {
        return platform::home_dir();
    }
    if (input.size() >= 2 && input[0] == '~' && (input[1] == '/' || input[1] == '\\')) {
        return platform::home_dir() / platform::path_from_utf8(input.substr(2));
    }
    return platform::path_from_utf8(input);
}

std::filesystem::path normalize_path(std::string_view input) {
    std::filesystem::path p = expand_home(input);

    std::error_code ec;
    if (p.is_relative()) {
        std::filesystem::path base = std::filesystem::current_path(ec);
        if (!ec) {
            p = base / p;
        }
    }

    std::filesystem::path canonical = std::filesystem::canonical(p, ec);
    if (!ec) {
        return canonical;
    }

    // Путь не существует или недоступен: только лексическая нормализация
    return strip_trailing_separator(p.lexically_normal());
}

std::string normalize_path_string(std::string_view input) {
    return platform::path_to_utf8(normalize_path(input));
}

std::string sha256_hex(std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::ostringstream stream;
    stream << std::hex << std::setfill('0');
    for (unsigned char c : digest) {
        stream << std::setw(2) << static_cast<int>(c);
    }
    return stream.str();
}

std::string hash_path(std::string_view input) {
    return sha256_hex(normalize_path_string(input));
}

bool is_system_directory(const std::filesystem::path& normalized) {
    const std::string candidate = platform::path_to_utf8(normalized.lexically_normal());
    for (const char* dir : SYSTEM_DIRS) {
        const std::string sys(dir);
        if (candidate == sys) {
            return true;
        }
        if (candidate.size() > sys.size() && candidate.compare(0, sys.size(), sys) == 0 &&
            (candidate[sys.size()] == '/' || candidate[sys.size()] == '\\')) {
            return true;
        }
    }
    return false;
}

}  // namespace bridge::io
