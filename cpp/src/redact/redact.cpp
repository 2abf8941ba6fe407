// ==============================================================================
// redact.cpp - Удаление секретов из текста
// ==============================================================================
//
// Все сканеры работают с байтами (UTF-8 не декодируется): формы секретов
// состоят только из ASCII, а байты >= 0x80 никогда не входят в классы символов.
//
// ==============================================================================

#include "bridge/redact.hpp"

#include <cstddef>

namespace bridge::redact {

namespace {

// ----------------------------------------------------------------------------
// Классы символов
// ----------------------------------------------------------------------------

bool is_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool is_word(char c) {
    return is_alnum(c) || c == '_';
}

bool is_base64url(char c) {
    return is_word(c) || c == '-';
}

bool is_alnum_dash(char c) {
    return is_alnum(c) || c == '-';
}

bool is_upper_or_digit(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool is_upper_or_space(char c) {
    return (c >= 'A' && c <= 'Z') || c == ' ';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_inline_space(char c) {
    return c == ' ' || c == '\t';
}

bool is_bearer_char(char c) {
    return is_alnum(c) || c == '.' || c == '_' || c == '-';
}

bool is_connection_body_char(char c) {
    return !is_space(c) && c != '"' && c != '\'';
}

bool is_unquoted_value_char(char c) {
    return !is_space(c) && c != ',' && c != ';' && c != '"' && c != '\'';
}

char to_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// ----------------------------------------------------------------------------
// Примитивы сопоставления
// ----------------------------------------------------------------------------

bool starts_with_at(std::string_view text, std::size_t pos, std::string_view prefix) {
    return pos <= text.size() && text.size() - pos >= prefix.size() &&
           text.compare(pos, prefix.size(), prefix) == 0;
}

/// prefix задаётся в нижнем регистре
bool starts_with_at_icase(std::string_view text, std::size_t pos, std::string_view prefix) {
    if (pos > text.size() || text.size() - pos < prefix.size()) {
        return false;
    }
    for (std::size_t k = 0; k < prefix.size(); ++k) {
        if (to_lower(text[pos + k]) != prefix[k]) {
            return false;
        }
    }
    return true;
}

std::size_t run_length(std::string_view text, std::size_t pos, bool (*pred)(char)) {
    std::size_t n = 0;
    while (pos + n < text.size() && pred(text[pos + n])) {
        ++n;
    }
    return n;
}

bool word_boundary_before(std::string_view text, std::size_t pos) {
    return pos == 0 || !is_word(text[pos - 1]);
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ----------------------------------------------------------------------------
// Таблицы форм
// ----------------------------------------------------------------------------

constexpr std::string_view PEM_BEGIN = "-----BEGIN";
constexpr std::string_view PEM_END = "-----END";
constexpr std::string_view PEM_DASHES = "-----";
constexpr std::string_view PEM_PRIVATE_LABEL = "PRIVATE KEY";
constexpr std::size_t PEM_MAX_LABEL = 40;

const std::string_view PEM_KEY_TYPES[] = {"RSA ", "EC ", "DSA ", "OPENSSH ", "ENCRYPTED "};

// Длинные схемы раньше коротких: "postgresql" перед "postgres"
const std::string_view CONNECTION_SCHEMES[] = {
    "postgresql", "postgres", "mongodb+srv", "mongodb", "mysql",
    "rediss",     "redis",    "amqps",       "amqp",
};

struct KeyPrefix {
    std::string_view prefix;
    bool (*body)(char);
    std::size_t min_body;
};

const KeyPrefix PROVIDER_KEYS[] = {
    {"github_pat_", is_word, 20},
    {"sk-", is_base64url, 20},
    {"ghp_", is_word, 20},
    {"gho_", is_word, 20},
    {"ghs_", is_word, 20},
    {"ghr_", is_word, 20},
    {"ghu_", is_word, 20},
    {"AIza", is_base64url, 20},
    {"xoxb-", is_alnum_dash, 10},
    {"xoxp-", is_alnum_dash, 10},
    {"xoxs-", is_alnum_dash, 10},
    {"xoxa-", is_alnum_dash, 10},
};

const std::string_view CLOUD_KEY_PREFIXES[] = {"AKIA", "ASIA"};
constexpr std::size_t CLOUD_KEY_BODY = 16;

constexpr std::size_t JWT_MIN_SEGMENT = 10;
constexpr std::size_t BEARER_MIN_TOKEN = 10;

const std::string_view SECRET_KEYWORDS[] = {
    "api_key", "api-key", "apikey", "password", "passwd", "secret", "token",
};

constexpr std::string_view KEY_SUFFIX = "key";

// ----------------------------------------------------------------------------
// PEM
// ----------------------------------------------------------------------------

/// Длина заголовка "-----BEGIN [TYPE ]PRIVATE KEY-----" с позиции pos, 0 если не он
std::size_t match_pem_private_header(std::string_view text, std::size_t pos) {
    if (!starts_with_at(text, pos, PEM_BEGIN)) {
        return 0;
    }
    std::size_t i = pos + PEM_BEGIN.size();
    std::size_t ws = run_length(text, i, is_space);
    if (ws == 0) {
        return 0;
    }
    i += ws;
    for (std::string_view type : PEM_KEY_TYPES) {
        if (starts_with_at(text, i, type)) {
            i += type.size();
            break;
        }
    }
    if (!starts_with_at(text, i, PEM_PRIVATE_LABEL)) {
        return 0;
    }
    i += PEM_PRIVATE_LABEL.size();
    if (!starts_with_at(text, i, PEM_DASHES)) {
        return 0;
    }
    return i + PEM_DASHES.size() - pos;
}

/// Позиция сразу после "-----END ... PRIVATE KEY-----"; text.size() если маркера нет
std::size_t find_pem_block_end(std::string_view text, std::size_t from) {
    std::size_t search = from;
    while (search < text.size()) {
        std::size_t end = text.find(PEM_END, search);
        if (end == std::string_view::npos) {
            break;
        }
        std::size_t label_start = end + PEM_END.size();
        std::size_t label_len = run_length(text, label_start, is_upper_or_space);
        std::string_view label = text.substr(label_start, label_len);
        if (label_len <= PEM_MAX_LABEL && ends_with(label, PEM_PRIVATE_LABEL) &&
            starts_with_at(text, label_start + label_len, PEM_DASHES)) {
            return label_start + label_len + PEM_DASHES.size();
        }
        search = label_start;
    }
    return text.size();
}

// ----------------------------------------------------------------------------
// JWT
// ----------------------------------------------------------------------------

std::size_t match_jwt(std::string_view text, std::size_t pos) {
    if (!starts_with_at(text, pos, "eyJ") || !word_boundary_before(text, pos)) {
        return 0;
    }
    std::size_t i = pos + 3;
    std::size_t seg = run_length(text, i, is_base64url);
    if (seg < JWT_MIN_SEGMENT) {
        return 0;
    }
    i += seg;
    for (int k = 0; k < 2; ++k) {
        if (i >= text.size() || text[i] != '.') {
            return 0;
        }
        ++i;
        seg = run_length(text, i, is_base64url);
        if (seg < JWT_MIN_SEGMENT) {
            return 0;
        }
        i += seg;
    }
    return i - pos;
}

// ----------------------------------------------------------------------------
// Присваивания
// ----------------------------------------------------------------------------

/// Длина ключевого слова вместе с необязательным суффиксом "key", "_key" или "-key"
std::size_t match_secret_keyword(std::string_view text, std::size_t pos) {
    for (std::string_view keyword : SECRET_KEYWORDS) {
        if (!starts_with_at_icase(text, pos, keyword)) {
            continue;
        }
        std::size_t len = keyword.size();
        std::size_t sep = pos + len;
        if (sep < text.size() && (text[sep] == '_' || text[sep] == '-')) {
            ++sep;
        }
        if (starts_with_at_icase(text, sep, KEY_SUFFIX)) {
            len = sep + KEY_SUFFIX.size() - pos;
        }
        return len;
    }
    return 0;
}

/// Значение целиком является плейсхолдером одного из сканеров
bool is_placeholder_value(std::string_view value) {
    if (value == PLACEHOLDER || value == PLACEHOLDER_JWT || value == PLACEHOLDER_PEM) {
        return true;
    }
    if (!ends_with(value, PLACEHOLDER)) {
        return false;
    }
    const std::size_t placeholder_len = std::string_view(PLACEHOLDER).size();
    std::string_view prefix = value.substr(0, value.size() - placeholder_len);
    for (const KeyPrefix& key : PROVIDER_KEYS) {
        if (prefix == key.prefix) {
            return true;
        }
    }
    for (std::string_view cloud : CLOUD_KEY_PREFIXES) {
        if (prefix == cloud) {
            return true;
        }
    }
    for (std::string_view scheme : CONNECTION_SCHEMES) {
        if (prefix.size() == scheme.size() + 3 && starts_with_at_icase(prefix, 0, scheme) &&
            ends_with(prefix, "://")) {
            return true;
        }
    }
    return prefix == "Bearer ";
}

}  // namespace

// ----------------------------------------------------------------------------
// Сканеры
// ----------------------------------------------------------------------------

std::string redact_pem_private_keys(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t header = text[i] == '-' ? match_pem_private_header(text, i) : 0;
        if (header > 0) {
            out += PLACEHOLDER_PEM;
            i = find_pem_block_end(text, i + header);
            continue;
        }
        out += text[i];
        ++i;
    }
    return out;
}

std::string redact_jwts(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        std::size_t len = text[i] == 'e' ? match_jwt(text, i) : 0;
        if (len > 0) {
            out += PLACEHOLDER_JWT;
            i += len;
            continue;
        }
        out += text[i];
        ++i;
    }
    return out;
}

std::string redact_connection_strings(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        bool matched = false;
        if (word_boundary_before(text, i)) {
            for (std::string_view scheme : CONNECTION_SCHEMES) {
                if (!starts_with_at_icase(text, i, scheme) ||
                    !starts_with_at(text, i + scheme.size(), "://")) {
                    continue;
                }
                std::size_t body_start = i + scheme.size() + 3;
                std::size_t body = run_length(text, body_start, is_connection_body_char);
                std::string_view body_text = text.substr(body_start, body);

                // Схема сохраняет исходный регистр
                out.append(text.substr(i, scheme.size() + 3));
                if (body == 0 || body_text == PLACEHOLDER) {
                    i = body_start;
                } else {
                    out += PLACEHOLDER;
                    i = body_start + body;
                }
                matched = true;
                break;
            }
        }
        if (!matched) {
            out += text[i];
            ++i;
        }
    }
    return out;
}

std::string redact_provider_keys(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        bool matched = false;
        if (word_boundary_before(text, i)) {
            for (const KeyPrefix& key : PROVIDER_KEYS) {
                if (!starts_with_at(text, i, key.prefix)) {
                    continue;
                }
                std::size_t body_start = i + key.prefix.size();
                std::size_t body = run_length(text, body_start, key.body);
                if (body < key.min_body) {
                    continue;
                }
                out.append(key.prefix);
                out += PLACEHOLDER;
                i = body_start + body;
                matched = true;
                break;
            }
        }
        if (!matched) {
            out += text[i];
            ++i;
        }
    }
    return out;
}

std::string redact_cloud_access_keys(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        bool matched = false;
        if (text[i] == 'A' && word_boundary_before(text, i)) {
            for (std::string_view prefix : CLOUD_KEY_PREFIXES) {
                if (!starts_with_at(text, i, prefix)) {
                    continue;
                }
                std::size_t body_start = i + prefix.size();
                std::size_t body = run_length(text, body_start, is_upper_or_digit);
                std::size_t after = body_start + CLOUD_KEY_BODY;
                // Ровно 16 символов и граница слова после них
                if (body < CLOUD_KEY_BODY || (after < text.size() && is_word(text[after]))) {
                    continue;
                }
                out.append(prefix);
                out += PLACEHOLDER;
                i = after;
                matched = true;
                break;
            }
        }
        if (!matched) {
            out += text[i];
            ++i;
        }
    }
    return out;
}

std::string redact_bearer_tokens(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (starts_with_at_icase(text, i, "bearer") && word_boundary_before(text, i)) {
            std::size_t ws_start = i + 6;
            std::size_t ws = run_length(text, ws_start, is_space);
            std::size_t token = ws > 0 ? run_length(text, ws_start + ws, is_bearer_char) : 0;
            if (token >= BEARER_MIN_TOKEN) {
                out += "Bearer ";
                out += PLACEHOLDER;
                i = ws_start + ws + token;
                continue;
            }
        }
        out += text[i];
        ++i;
    }
    return out;
}

std::string redact_secret_assignments(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    const std::size_t n = text.size();
    std::size_t i = 0;
    while (i < n) {
        std::size_t keyword = match_secret_keyword(text, i);
        if (keyword == 0) {
            out += text[i];
            ++i;
            continue;
        }

        std::size_t j = i + keyword;
        // Ключ в кавычках: "password": "..."
        if (j < n && (text[j] == '"' || text[j] == '\'')) {
            ++j;
        }
        j += run_length(text, j, is_inline_space);
        if (j >= n || (text[j] != ':' && text[j] != '=')) {
            out += text[i];
            ++i;
            continue;
        }
        ++j;
        j += run_length(text, j, is_inline_space);

        std::size_t value_start = j;
        std::size_t value_end = j;
        if (j < n && (text[j] == '"' || text[j] == '\'')) {
            value_start = j + 1;
            std::size_t close = text.find(text[j], value_start);
            if (close == std::string_view::npos) {
                // Незакрытая кавычка: значение до конца строки
                close = text.find('\n', value_start);
                if (close == std::string_view::npos) {
                    close = n;
                }
            }
            value_end = close;
        } else {
            value_end = j + run_length(text, j, is_unquoted_value_char);
        }

        std::string_view value = text.substr(value_start, value_end - value_start);
        out.append(text.substr(i, value_start - i));
        // Частично очищенное значение заменяется целиком
        if (!value.empty() && !is_placeholder_value(value)) {
            out += PLACEHOLDER;
        } else {
            out.append(value);
        }
        i = value_end;
    }
    return out;
}

// ----------------------------------------------------------------------------
// Конвейер
// ----------------------------------------------------------------------------

const std::vector<Scanner>& pipeline() {
    static const std::vector<Scanner> scanners = {
        {"pem_private_key", redact_pem_private_keys},
        {"jwt", redact_jwts},
        {"connection_string", redact_connection_strings},
        {"provider_key", redact_provider_keys},
        {"cloud_access_key", redact_cloud_access_keys},
        {"bearer_token", redact_bearer_tokens},
        {"secret_assignment", redact_secret_assignments},
    };
    return scanners;
}

std::string redact(std::string_view text) {
    std::string current(text);
    for (const Scanner& scanner : pipeline()) {
        current = scanner.apply(current);
    }
    return current;
}

}  // namespace bridge::redact
