#pragma once

#include <cstdint>
#include <string_view>

namespace ml::longlong {

/**
 * @brief 64-битное значение, разбитое на два 32-битных слова.
 *
 * Протокол бэкенда переносит только 32-битные поля, поэтому размеры файлов,
 * номера кадров и закладки передаются парой слов.
 */
struct Words {
    uint32_t low = 0;
    uint32_t high = 0;
};

Words encode(uint64_t value);
uint64_t decode(uint32_t low, uint32_t high);

// Токены приходят десятичными строками; знаковые значения трактуются как 32 бита
uint64_t decode(std::string_view low, std::string_view high);

// Разбор одного слова. Не-число или выход за 32 бита -> ProtocolError
uint32_t parse_word(std::string_view token);

} // namespace ml::longlong
