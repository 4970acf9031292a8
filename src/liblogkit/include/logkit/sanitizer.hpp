/**
 * @file sanitizer.hpp
 * @date October 2026
 * @brief Очистка текста сообщений и имён логгеров.
 *
 * @details
 * Обе функции тотальны: определены для любой последовательности байт,
 * не выполняют ввода-вывода и не генерируют исключений, кроме
 * std::bad_alloc.
 */

#pragma once

#include <string>

namespace logkit {

/// Имя файла для пустого имени логгера.
constexpr const char* kFallbackFilename = "logger";

/**
 * @brief Удаляет emoji и управляющие символы, заменяет спецсимволы на ASCII
 *
 * @details
 *  - emoji-диапазоны (U+1F300..1F6FF, флаги, U+2600..27BF, геометрические
 *    фигуры U+25A0..25FF, U+2B00..2BFF, селекторы вариантов U+FE0E/FE0F,
 *    ZWJ и всё за пределами BMP) удаляются;
 *  - стрелки, тире, многоточие, типографские кавычки и NBSP заменяются
 *    ASCII-эквивалентами ("→" становится "-->");
 *  - управляющие символы C0 (кроме TAB и LF), DEL и C1 удаляются, поэтому
 *    сообщение не может вставить ESC-последовательность в терминал;
 *  - каждый байт некорректного UTF-8 заменяется на '?'.
 *
 * Идемпотентна: sanitizeMessage(sanitizeMessage(x)) == sanitizeMessage(x).
 */
std::string sanitizeMessage(const std::string& text);

/// sanitizeMessage() для имени логгера; TAB и LF дополнительно заменяются пробелом.
std::string sanitizeLoggerName(const std::string& name);

/**
 * @brief Преобразует имя логгера в безопасное имя файла
 *
 * Каждый символ вне [A-Za-z0-9._-] заменяется одним '_'.
 * Пустая строка даёт kFallbackFilename.
 */
std::string safeFilename(const std::string& name);

}  // namespace logkit
