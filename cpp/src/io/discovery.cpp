// ==============================================================================
// discovery.cpp - Поиск файлов сессий
// ==============================================================================
//
// Обход без рекурсии (явный стек), поэтому глубина дерева не ограничена стеком
// вызовов. Счётчик просмотренных записей общий для всего обхода: он
// останавливает и чтение текущей директории, и спуск в следующие.
//
// ==============================================================================

#include "bridge/discovery.hpp"

#include "bridge/platform.hpp"

#include <algorithm>
#include <system_error>

namespace bridge::io {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Прочитать записи одной директории, не больше чем позволяет счётчик visited.
/// Результат упорядочен по имени по убыванию.
/// Ошибка чтения -> пустой список (директория пропускается).
std::vector<std::filesystem::directory_entry> read_dir_bounded(const std::filesystem::path& dir,
                                                               std::size_t& visited,
                                                               std::size_t max_visited) {
    std::vector<std::filesystem::directory_entry> entries;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return entries;
    }

    for (; it != std::filesystem::directory_iterator() && visited < max_visited;
         it.increment(ec)) {
        if (ec) {
            break;
        }
        entries.push_back(*it);
        ++visited;
    }

    std::sort(entries.begin(), entries.end(),
              [](const std::filesystem::directory_entry& a,
                 const std::filesystem::directory_entry& b) { return b.path() < a.path(); });
    return entries;
}

bool is_dir(const std::filesystem::path& path) {
    std::error_code ec;
    return !path.empty() && std::filesystem::is_directory(path, ec) && !ec;
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

void sort_by_mtime_desc(std::vector<FileEntry>& files) {
    std::sort(files.begin(), files.end(), [](const FileEntry& a, const FileEntry& b) {
        if (a.mtime_ns != b.mtime_ns) {
            return a.mtime_ns > b.mtime_ns;
        }
        return a.path < b.path;
    });
}

std::vector<FileEntry> scan_files(const std::filesystem::path& root, const FilePredicate& predicate,
                                  const DiscoveryOptions& opt) {
    return scan_roots({root}, predicate, opt);
}

std::vector<FileEntry> scan_roots(const std::vector<std::filesystem::path>& roots,
                                  const FilePredicate& predicate, const DiscoveryOptions& opt) {
    std::vector<FileEntry> result;

    // Стек: первый корень на вершине
    std::vector<std::filesystem::path> pending;
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        if (is_dir(*it)) {
            pending.push_back(*it);
        }
    }

    std::size_t visited = 0;

    while (!pending.empty() && visited < opt.max_files) {
        std::filesystem::path dir = std::move(pending.back());
        pending.pop_back();

        std::vector<std::filesystem::path> subdirs;

        for (const auto& entry : read_dir_bounded(dir, visited, opt.max_files)) {
            std::error_code entry_ec;
            auto status = entry.symlink_status(entry_ec);
            if (entry_ec || std::filesystem::is_symlink(status)) {
                // Симлинки не разыменовываем: защита от выхода за корень и циклов
                continue;
            }

            if (std::filesystem::is_directory(status)) {
                if (opt.recursive) {
                    subdirs.push_back(entry.path());
                }
                continue;
            }

            if (!std::filesystem::is_regular_file(status) || !predicate(entry.path())) {
                continue;
            }

            std::int64_t mtime = platform::file_mtime_ns(entry.path(), entry_ec);
            if (entry_ec) {
                continue;
            }
            result.push_back(FileEntry{entry.path(), mtime});
        }

        // Обратный порядок: первая из прочитанных поддиректорий обходится первой
        for (auto it = subdirs.rbegin(); it != subdirs.rend(); ++it) {
            pending.push_back(std::move(*it));
        }
    }

    sort_by_mtime_desc(result);
    return result;
}

// ----------------------------------------------------------------------------
// Предикаты
// ----------------------------------------------------------------------------

bool has_extension(const std::filesystem::path& path, const char* ext) {
    return path.extension() == ext;
}

bool path_contains(const std::filesystem::path& path, const std::string& needle) {
    return platform::path_to_utf8(path).find(needle) != std::string::npos;
}

}  // namespace bridge::io
