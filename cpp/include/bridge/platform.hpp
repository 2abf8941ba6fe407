// ==============================================================================
// bridge/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - TTY detection для цветного вывода
// - Домашняя директория и переменные окружения
// - Время модификации файла с наносекундной точностью и ISO-8601 форматирование
//
// Вся платформенная специфика (_WIN32 / POSIX) изолирована здесь.
//
// ==============================================================================

#ifndef BRIDGE_PLATFORM_HPP
#define BRIDGE_PLATFORM_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace bridge::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

/// Значение переменной окружения; пустое значение считается отсутствующим
std::optional<std::string> get_env(const char* name);

/// Домашняя директория пользователя (HOME / USERPROFILE)
/// Пустой path, если определить не удалось
std::filesystem::path home_dir();

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Время модификации файла в наносекундах от Unix epoch.
/// Симлинки не разыменовываются (lstat).
std::int64_t file_mtime_ns(const std::filesystem::path& p, std::error_code& ec);

/// Форматировать Unix-время (нс) как "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string format_iso8601_utc(std::int64_t unix_ns);

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Linux", "macOS", "Windows" или "Unknown"
std::string os_name();

}  // namespace bridge::platform

#endif  // BRIDGE_PLATFORM_HPP
