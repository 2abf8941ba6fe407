// ==============================================================================
// bridge/redact.hpp - Удаление секретов из текста
// ==============================================================================
//
// Назначение:
// - Чистая функция text -> text, применяется последней перед выдачей контента
// - Упорядоченный конвейер независимых сканеров, по одному на форму секрета
// - Идемпотентность: redact(redact(x)) == redact(x)
// - Плейсхолдеры ("[REDACTED]", "[REDACTED_JWT]", ...) не изменяются
//
// Порядок сканеров фиксирован:
//   1. pem_private_key   -----BEGIN ... PRIVATE KEY----- ... -----END ...-----
//   2. jwt               eyJ<...>.<...>.<...>
//   3. connection_string postgres://, mysql://, mongodb://, redis://, amqp:// ...
//   4. provider_key      sk-, ghp_/gho_/ghs_/ghr_/ghu_, github_pat_, AIza, xox?-
//   5. cloud_access_key  AKIA/ASIA + 16 [A-Z0-9]
//   6. bearer_token      Bearer <token>
//   7. secret_assignment api_key=..., token: ..., "password": "..."
//
// Каждый сканер идёт по байтам слева направо и на каждом шаге продвигается
// хотя бы на один байт, поэтому завершается на любом (в том числе обрезанном) вводе.
//
// ==============================================================================

#ifndef BRIDGE_REDACT_HPP
#define BRIDGE_REDACT_HPP

#include <string>
#include <string_view>
#include <vector>

namespace bridge::redact {

// ----------------------------------------------------------------------------
// Плейсхолдеры
// ----------------------------------------------------------------------------

constexpr const char* PLACEHOLDER = "[REDACTED]";
constexpr const char* PLACEHOLDER_JWT = "[REDACTED_JWT]";
constexpr const char* PLACEHOLDER_PEM = "[REDACTED_PEM_KEY]";

// ----------------------------------------------------------------------------
// Конвейер
// ----------------------------------------------------------------------------

/// Функция одного сканера
using ScanFn = std::string (*)(std::string_view);

struct Scanner {
    const char* name;
    ScanFn apply;
};

/// Сканеры в порядке применения
const std::vector<Scanner>& pipeline();

/// Применить весь конвейер
std::string redact(std::string_view text);

// ----------------------------------------------------------------------------
// Отдельные сканеры
// ----------------------------------------------------------------------------

/// Блоки PEM только типа PRIVATE KEY (RSA/EC/DSA/OPENSSH/ENCRYPTED или без типа).
/// Без END-маркера блок считается обрезанным и удаляется до конца текста.
std::string redact_pem_private_keys(std::string_view text);

/// eyJ + >=10, '.', >=10, '.', >=10 символов base64url
std::string redact_jwts(std::string_view text);

/// scheme://<всё до пробела или кавычки> -> scheme://[REDACTED]
std::string redact_connection_strings(std::string_view text);

/// Известные префиксы API-ключей; префикс остаётся видимым
std::string redact_provider_keys(std::string_view text);

/// AKIA/ASIA + ровно 16 символов [A-Z0-9] на границе слова
std::string redact_cloud_access_keys(std::string_view text);

/// bearer (без учёта регистра) + пробелы + >=10 символов [A-Za-z0-9._-]
std::string redact_bearer_tokens(std::string_view text);

/// keyword [quote] [ws] (':' | '=') [ws] value -> значение заменяется на [REDACTED]
std::string redact_secret_assignments(std::string_view text);

}  // namespace bridge::redact

#endif  // BRIDGE_REDACT_HPP
