// ==============================================================================
// bridge/paths.hpp - Нормализация путей и рабочих директорий
// ==============================================================================
//
// Назначение:
// - Раскрытие ведущего "~" в домашнюю директорию
// - Нормализация cwd-строк для сравнения (canonical, fallback на absolute)
// - Стабильный хэш нормализованного пути (ключ директорий Gemini)
// - Защита от сканирования системных директорий
//
// Нормализация тотальна: для любого синтаксически валидного пути возвращается
// результат, ошибки файловой системы не пробрасываются.
//
// ==============================================================================

#ifndef BRIDGE_PATHS_HPP
#define BRIDGE_PATHS_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace bridge::io {

/// Заменить ведущий "~" или "~/" на домашнюю директорию.
/// "~user/..." не раскрывается.
std::filesystem::path expand_home(std::string_view input);

/// Нормализовать путь:
/// 1. expand_home
/// 2. относительный путь разрешается от текущей директории процесса
/// 3. canonical (симлинки, "..") если путь существует
/// 4. иначе absolute + lexically_normal без завершающего разделителя
std::filesystem::path normalize_path(std::string_view input);

/// normalize_path в виде UTF-8 строки (для сравнения cwd)
std::string normalize_path_string(std::string_view input);

/// SHA-256 (hex, lowercase) от normalize_path_string(input)
std::string hash_path(std::string_view input);

/// SHA-256 (hex, lowercase) произвольных байтов
std::string sha256_hex(std::string_view data);

/// true, если путь совпадает с системной директорией или лежит внутри неё
/// (/etc, /usr, /var, /bin, /sbin, /System, /Library, C:\Windows, ...)
bool is_system_directory(const std::filesystem::path& normalized);

}  // namespace bridge::io

#endif  // BRIDGE_PATHS_HPP
