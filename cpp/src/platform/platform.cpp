// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика (_WIN32 / POSIX) изолирована здесь.
//
// ==============================================================================

#include "bridge/platform.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <sys/stat.h>
#include <sys/types.h>
#include <windows.h>
#else
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace bridge::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    // Windows: UTF-8 -> UTF-16 для native path
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || value[0] == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::filesystem::path home_dir() {
#ifdef _WIN32
    if (auto profile = get_env("USERPROFILE")) {
        return path_from_utf8(*profile);
    }
#endif
    if (auto home = get_env("HOME")) {
        return path_from_utf8(*home);
    }
    return {};
}

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

std::int64_t file_mtime_ns(const std::filesystem::path& p, std::error_code& ec) {
    ec.clear();
#ifdef _WIN32
    struct _stat64 st;
    if (_wstat64(p.c_str(), &st) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return 0;
    }
    return static_cast<std::int64_t>(st.st_mtime) * 1000000000LL;
#else
    struct stat st;
    if (::lstat(p.c_str(), &st) != 0) {
        ec = std::error_code(errno, std::generic_category());
        return 0;
    }
#ifdef __APPLE__
    const auto& ts = st.st_mtimespec;
#else
    const auto& ts = st.st_mtim;
#endif
    return static_cast<std::int64_t>(ts.tv_sec) * 1000000000LL +
           static_cast<std::int64_t>(ts.tv_nsec);
#endif
}

std::string format_iso8601_utc(std::int64_t unix_ns) {
    // floor-деление, чтобы время до 1970 не округлялось вверх
    std::int64_t secs = unix_ns / 1000000000LL;
    std::int64_t rem = unix_ns % 1000000000LL;
    if (rem < 0) {
        secs -= 1;
        rem += 1000000000LL;
    }
    const int millis = static_cast<int>(rem / 1000000LL);

    std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ", tm_utc.tm_year + 1900,
                  tm_utc.tm_mon + 1, tm_utc.tm_mday, tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec,
                  millis);
    return buf;
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace bridge::platform
