// ==============================================================================
// bridge/error.hpp - Таксономия ошибок
// ==============================================================================
//
// Ошибки уровня файла или запроса возвращаются типизированно
// (std::variant<T, BridgeError>). Ошибки отдельных строк JSONL обрабатываются
// на месте и в BridgeError не попадают.
//
// ==============================================================================

#ifndef BRIDGE_ERROR_HPP
#define BRIDGE_ERROR_HPP

#include <string>

namespace bridge {

enum class ErrorKind {
    NotFound,          // Нет базовой директории или подходящего файла
    ParseFailed,       // Файл целиком не разбирается
    InvalidHandoff,    // Некорректный handoff-пакет
    UnsupportedAgent,  // Неизвестный агент
    UnsupportedMode,   // Неизвестный режим отчёта
    IoError,           // Прочие ошибки ввода-вывода, превышение размера
    EmptySession       // Схема корректна, но ходов нет
};

/// Код для структурированного вывода: "NOT_FOUND", "PARSE_FAILED", ...
const char* error_kind_to_code(ErrorKind kind);

struct BridgeError {
    ErrorKind kind = ErrorKind::IoError;
    std::string message;

    /// Одна строка: "<CODE>: <message>"
    std::string format() const;
};

}  // namespace bridge

#endif  // BRIDGE_ERROR_HPP
