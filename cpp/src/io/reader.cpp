// ==============================================================================
// reader.cpp - Реализация Reader Framework
// ==============================================================================
//
// JSON-документ читается целиком (после проверки размера).
// JSON Lines читается построчно: ошибка в строке не прерывает итерацию,
// строка учитывается в skipped_lines().
//
// ==============================================================================

#include <bridge/platform.hpp>
#include <bridge/reader.hpp>
#include <cctype>
#include <deque>
#include <fstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <system_error>

namespace bridge::io {

// ============================================================================
// DocumentKind функции
// ============================================================================

DocumentKind document_kind_from_path(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (ext == ".json") {
        return DocumentKind::Json;
    }
    if (ext == ".jsonl") {
        return DocumentKind::Jsonl;
    }
    return DocumentKind::Unknown;
}

// ============================================================================
// ReaderError и вспомогательные функции
// ============================================================================

std::string ReaderError::format() const {
    return "failed to load file '" + path + "' - " + message;
}

std::optional<ReaderError> check_file_size(const std::filesystem::path& path,
                                           std::uintmax_t limit) {
    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        return ReaderError{ReaderErrorKind::IoError, ec.message(), platform::path_to_utf8(path)};
    }
    if (size > limit) {
        return ReaderError{ReaderErrorKind::TooLarge,
                           "exceeds " + std::to_string(limit / (1024 * 1024)) + "MB size limit",
                           platform::path_to_utf8(path)};
    }
    return std::nullopt;
}

std::optional<ReaderError> read_file_text(const std::filesystem::path& path, std::string& out,
                                          std::uintmax_t limit) {
    if (auto err = check_file_size(path, limit)) {
        return err;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ReaderError{ReaderErrorKind::IoError, "could not open file",
                           platform::path_to_utf8(path)};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return ReaderError{ReaderErrorKind::IoError, "read failed", platform::path_to_utf8(path)};
    }
    out = buffer.str();
    return std::nullopt;
}

namespace {

/// Позиция, на которой вложенность скобок вне строк превышает max_depth;
/// npos если превышения нет
std::size_t find_depth_overflow(std::string_view text, std::size_t max_depth) {
    std::size_t depth = 0;
    bool in_string = false;
    bool escaped = false;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
        } else if (c == '[' || c == '{') {
            if (++depth > max_depth) {
                return i;
            }
        } else if ((c == ']' || c == '}') && depth > 0) {
            --depth;
        }
    }
    return std::string_view::npos;
}

}  // namespace

std::optional<Value> parse_json(std::string_view text, std::string* error) {
    // Value::from_rapidjson рекурсивен: глубина ограничивается до разбора
    std::size_t overflow = find_depth_overflow(text, MAX_JSON_DEPTH);
    if (overflow != std::string_view::npos) {
        if (error != nullptr) {
            *error = "Nesting exceeds " + std::to_string(MAX_JSON_DEPTH) + " levels at offset " +
                     std::to_string(overflow);
        }
        return std::nullopt;
    }

    rapidjson::Document doc;
    doc.Parse<rapidjson::kParseIterativeFlag>(text.data(), text.size());
    if (doc.HasParseError()) {
        if (error != nullptr) {
            *error = std::string(rapidjson::GetParseError_En(doc.GetParseError())) +
                     " at offset " + std::to_string(doc.GetErrorOffset());
        }
        return std::nullopt;
    }
    return Value::from_rapidjson(doc);
}

// ============================================================================
// JsonReader - один JSON-документ на файл
// ============================================================================

class JsonReader : public Reader {
public:
    explicit JsonReader(std::filesystem::path path) : path_(std::move(path)) {}

    void load() {
        std::string content;
        if (auto err = read_file_text(path_, content)) {
            error_ = std::move(err);
            return;
        }

        std::string parse_error;
        auto parsed = parse_json(content, &parse_error);
        if (!parsed) {
            error_ = ReaderError{ReaderErrorKind::ParseError, "JSON parse error: " + parse_error,
                                 platform::path_to_utf8(path_)};
            return;
        }

        value_ = std::move(*parsed);
        has_single_ = true;
    }

    bool next(Document& out) override {
        if (!has_single_) {
            return false;
        }
        out.kind = DocumentKind::Json;
        out.data = std::move(value_);
        out.source = platform::path_to_utf8(path_);
        out.record_id = std::nullopt;
        has_single_ = false;
        return true;
    }

    DocumentKind kind() const override { return DocumentKind::Json; }
    const std::filesystem::path& path() const override { return path_; }
    const std::optional<ReaderError>& last_error() const override { return error_; }

private:
    std::filesystem::path path_;
    Value value_;
    std::optional<ReaderError> error_;
    bool has_single_ = false;
};

std::unique_ptr<Reader> create_json_reader(const std::filesystem::path& path) {
    auto reader = std::make_unique<JsonReader>(path);
    // Ошибка загрузки доступна через last_error()
    reader->load();
    return reader;
}

// ============================================================================
// JsonlReader - JSON Lines, построчно
// ============================================================================

class JsonlReader : public Reader {
public:
    explicit JsonlReader(std::filesystem::path path) : path_(std::move(path)) {}

    void load() {
        if (auto err = check_file_size(path_)) {
            error_ = std::move(err);
            return;
        }
        file_.open(path_, std::ios::binary);
        if (!file_.is_open()) {
            error_ = ReaderError{ReaderErrorKind::IoError, "could not open file",
                                 platform::path_to_utf8(path_)};
            return;
        }
        loaded_ = true;
    }

    bool next(Document& out) override {
        if (!loaded_) {
            return false;
        }

        std::string line;
        while (std::getline(file_, line)) {
            ++line_number_;

            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            // Пустые строки не считаются ни записями, ни ошибками
            if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }

            remember(line);

            auto parsed = parse_json(line);
            if (!parsed) {
                ++skipped_;
                continue;
            }

            out.kind = DocumentKind::Jsonl;
            out.data = std::move(*parsed);
            out.source = platform::path_to_utf8(path_);
            out.record_id = line_number_;
            return true;
        }
        return false;
    }

    DocumentKind kind() const override { return DocumentKind::Jsonl; }
    const std::filesystem::path& path() const override { return path_; }
    const std::optional<ReaderError>& last_error() const override { return error_; }
    std::uint64_t skipped_lines() const override { return skipped_; }

    std::vector<std::string> raw_tail() const override {
        return std::vector<std::string>(tail_.begin(), tail_.end());
    }

private:
    void remember(const std::string& line) {
        tail_.push_back(line);
        if (tail_.size() > RAW_TAIL_LINES) {
            tail_.pop_front();
        }
    }

    std::filesystem::path path_;
    std::ifstream file_;
    std::optional<ReaderError> error_;
    std::deque<std::string> tail_;

    bool loaded_ = false;
    std::uint64_t line_number_ = 0;
    std::uint64_t skipped_ = 0;
};

std::unique_ptr<Reader> create_jsonl_reader(const std::filesystem::path& path) {
    auto reader = std::make_unique<JsonlReader>(path);
    reader->load();
    return reader;
}

// ============================================================================
// Reader::open - фабричный метод
// ============================================================================

ReaderResult Reader::open(const std::filesystem::path& file, bool sniff_format) {
    ReaderResult result;
    result.ok = false;

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec) || ec) {
        result.error = ReaderError{ReaderErrorKind::FileNotFound, "file not found",
                                   platform::path_to_utf8(file)};
        return result;
    }

    if (auto err = check_file_size(file)) {
        result.error = *err;
        return result;
    }

    DocumentKind kind = sniff_format ? DocumentKind::Unknown : document_kind_from_path(file);

    switch (kind) {
    case DocumentKind::Json:
        result.reader = create_json_reader(file);
        break;
    case DocumentKind::Jsonl:
        result.reader = create_jsonl_reader(file);
        break;
    case DocumentKind::Unknown:
        if (!sniff_format) {
            result.error = ReaderError{ReaderErrorKind::UnsupportedFormat,
                                       "file type is not currently supported",
                                       platform::path_to_utf8(file)};
            return result;
        }
        // Порядок: JSON-документ, затем JSON Lines
        result.reader = create_json_reader(file);
        if (result.reader->last_error() &&
            result.reader->last_error()->kind == ReaderErrorKind::ParseError) {
            result.reader = create_jsonl_reader(file);
        }
        break;
    }

    if (result.reader->last_error()) {
        result.error = *result.reader->last_error();
        result.reader.reset();
        return result;
    }

    result.ok = true;
    return result;
}

}  // namespace bridge::io
