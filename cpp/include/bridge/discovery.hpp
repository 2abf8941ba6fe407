// ==============================================================================
// bridge/discovery.hpp - Поиск файлов сессий
// ==============================================================================
//
// Назначение:
// - Обход директории (рекурсивно или один уровень) с предикатом по пути
// - Ограничение MAX_SCAN_FILES просмотренных записей на вызов (файлы и
//   директории, совпавшие или нет): после достижения лимита чтение директорий
//   прекращается, а не обрезается постфактум
// - Директории обходятся в порядке имён по убыванию: датированные
//   поддиректории и файлы с меткой времени в имени просматриваются первыми
// - Симлинки внутри корня не разыменовываются (ни файлы, ни директории)
// - Детерминированный порядок: mtime по убыванию, при равенстве путь по возрастанию
// - Несуществующий корень -> пустой результат, не ошибка
//
// ==============================================================================

#ifndef BRIDGE_DISCOVERY_HPP
#define BRIDGE_DISCOVERY_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace bridge::io {

/// Максимум записей директорий, просматриваемых за один обход
constexpr std::size_t MAX_SCAN_FILES = 1000;

// ----------------------------------------------------------------------------
// FileEntry - кандидат на чтение
// ----------------------------------------------------------------------------

struct FileEntry {
    std::filesystem::path path;
    std::int64_t mtime_ns = 0;  // время модификации, нс от Unix epoch
};

/// Предикат отбора файла (полный путь)
using FilePredicate = std::function<bool(const std::filesystem::path&)>;

// ----------------------------------------------------------------------------
// DiscoveryOptions
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Спускаться в поддиректории
    bool recursive = false;

    /// Лимит просмотренных записей (по умолчанию MAX_SCAN_FILES)
    std::size_t max_files = MAX_SCAN_FILES;
};

/// Найти файлы под root, удовлетворяющие predicate
///
/// @param root Корневая директория
/// @param predicate Фильтр по полному пути файла
/// @param opt Рекурсия и лимит
/// @return Файлы, отсортированные по mtime (новые первыми), затем по пути
///
/// Нечитаемые поддиректории пропускаются молча.
std::vector<FileEntry> scan_files(const std::filesystem::path& root, const FilePredicate& predicate,
                                  const DiscoveryOptions& opt = {});

/// Обход нескольких корней с общим лимитом просмотренных записей.
/// Корни обходятся в заданном порядке; несуществующие пропускаются.
std::vector<FileEntry> scan_roots(const std::vector<std::filesystem::path>& roots,
                                  const FilePredicate& predicate, const DiscoveryOptions& opt = {});

/// Отсортировать: mtime по убыванию, при равенстве путь по возрастанию
void sort_by_mtime_desc(std::vector<FileEntry>& files);

// ----------------------------------------------------------------------------
// Предикаты
// ----------------------------------------------------------------------------

/// Расширение файла (с точкой, например ".jsonl") совпадает
bool has_extension(const std::filesystem::path& path, const char* ext);

/// UTF-8 представление пути содержит подстроку
bool path_contains(const std::filesystem::path& path, const std::string& needle);

}  // namespace bridge::io

#endif  // BRIDGE_DISCOVERY_HPP
