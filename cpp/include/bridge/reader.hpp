// ==============================================================================
// bridge/reader.hpp - Reader Framework (JSON / JSON Lines)
// ==============================================================================
//
// Назначение:
// - Унифицированное чтение файлов сессий: JSON-документ или JSON Lines
// - Жёсткий потолок размера файла (MAX_FILE_SIZE), проверяется до чтения
// - JSONL: битые строки пропускаются и считаются, итерация не прерывается
// - JSONL: хвост последних RAW_TAIL_LINES непустых строк для fallback-вывода
// - Режим sniff: сначала JSON-документ, затем JSON Lines (файлы без явного формата)
//
// ==============================================================================

#ifndef BRIDGE_READER_HPP
#define BRIDGE_READER_HPP

#include <bridge/value.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridge::io {

/// Потолок размера файла сессии: 50 MiB
constexpr std::uintmax_t MAX_FILE_SIZE = 50ULL * 1024ULL * 1024ULL;

/// Сколько последних сырых строк хранит JSONL Reader
constexpr std::size_t RAW_TAIL_LINES = 20;

/// Максимальная вложенность массивов/объектов в одном JSON-значении
constexpr std::size_t MAX_JSON_DEPTH = 512;

// ----------------------------------------------------------------------------
// DocumentKind - формат файла
// ----------------------------------------------------------------------------

enum class DocumentKind {
    Json,    // один JSON-документ (.json)
    Jsonl,   // JSON Lines (.jsonl)
    Unknown  // неизвестный формат
};

/// Определить DocumentKind по расширению файла (case-insensitive)
DocumentKind document_kind_from_path(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Document - одна запись с метаданными
// ----------------------------------------------------------------------------

struct Document {
    DocumentKind kind = DocumentKind::Unknown;

    /// Содержимое записи
    Value data;

    /// Путь к исходному файлу (UTF-8)
    std::string source;

    /// Номер строки (JSONL); для JSON-документа не задан
    std::optional<std::uint64_t> record_id;
};

// ----------------------------------------------------------------------------
// ReaderError
// ----------------------------------------------------------------------------

enum class ReaderErrorKind {
    FileNotFound,       // Файл не найден
    TooLarge,           // Превышен MAX_FILE_SIZE
    ParseError,         // Весь файл не разбирается в ожидаемом формате
    UnsupportedFormat,  // Неподдерживаемое расширение
    IoError             // Прочие ошибки ввода-вывода
};

struct ReaderError {
    ReaderErrorKind kind = ReaderErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to load file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Reader
// ----------------------------------------------------------------------------

struct ReaderResult {
    bool ok = false;
    std::unique_ptr<class Reader> reader;
    ReaderError error;

    explicit operator bool() const { return ok; }
};

/// Использование:
/// @code
///   auto result = Reader::open(path);
///   if (!result) {
///       return result.error;
///   }
///   Document doc;
///   while (result.reader->next(doc)) {
///       // обработка записи
///   }
/// @endcode
class Reader {
public:
    virtual ~Reader() = default;

    /// Открыть файл и создать Reader
    ///
    /// @param file Путь к файлу
    /// @param sniff_format true: игнорировать расширение, пробовать JSON, затем JSONL
    ///
    /// Алгоритм:
    /// 1. Файл существует, иначе FileNotFound
    /// 2. Размер <= MAX_FILE_SIZE, иначе TooLarge (файл не читается)
    /// 3. Выбор парсера по расширению (или sniff)
    static ReaderResult open(const std::filesystem::path& file, bool sniff_format = false);

    /// Получить следующую запись
    /// @return false, если записи закончились
    virtual bool next(Document& out) = 0;

    virtual DocumentKind kind() const = 0;

    virtual const std::filesystem::path& path() const = 0;

    /// Ошибка загрузки (если была)
    virtual const std::optional<ReaderError>& last_error() const = 0;

    /// Число пропущенных неразборчивых строк (JSONL)
    virtual std::uint64_t skipped_lines() const { return 0; }

    /// Последние RAW_TAIL_LINES непустых строк, прочитанных до текущего момента
    virtual std::vector<std::string> raw_tail() const { return {}; }

protected:
    Reader() = default;
};

/// Создать JSON Reader (один документ на файл)
std::unique_ptr<Reader> create_json_reader(const std::filesystem::path& path);

/// Создать JSONL Reader
std::unique_ptr<Reader> create_jsonl_reader(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Проверить размер файла до чтения
std::optional<ReaderError> check_file_size(const std::filesystem::path& path,
                                           std::uintmax_t limit = MAX_FILE_SIZE);

/// Прочитать файл целиком (с проверкой размера)
std::optional<ReaderError> read_file_text(const std::filesystem::path& path, std::string& out,
                                          std::uintmax_t limit = MAX_FILE_SIZE);

/// Разобрать JSON-текст в Value
/// @return nullopt при ошибке разбора (текст ошибки в *error, если задан)
std::optional<Value> parse_json(std::string_view text, std::string* error = nullptr);

}  // namespace bridge::io

#endif  // BRIDGE_READER_HPP
