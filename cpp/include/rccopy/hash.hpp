// ==============================================================================
// rccopy/hash.hpp - Hash Engine
// ==============================================================================
//
// Назначение:
// - Закрытый набор алгоритмов контрольных сумм (MD5 | SHA-1 | xxHash64)
// - Единая таблица дескрипторов: имя, тег MHL, ширина hex, конструктор
// - Потоковое хеширование по чанкам (результат не зависит от разбиения)
//
// Библиотеки:
// - OpenSSL EVP: MD5, SHA-1
// - libxxhash: XXH64 (seed 0, канонический big-endian вывод)
//
// ==============================================================================

#ifndef RCCOPY_HASH_HPP
#define RCCOPY_HASH_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rccopy::hash {

// ----------------------------------------------------------------------------
// Algorithm
// ----------------------------------------------------------------------------

enum class Algorithm { Md5, Sha1, Xxh64 };

// ----------------------------------------------------------------------------
// Hasher - инкрементальный хешер
// ----------------------------------------------------------------------------

/// Инкрементальный хешер. Экземпляр одноразовый: после finalize() не используется.
class Hasher {
public:
    virtual ~Hasher() = default;

    /// Добавить очередной чанк данных
    /// @throws std::runtime_error при ошибке библиотеки
    virtual void update(const void* data, std::size_t size) = 0;

    /// Завершить вычисление и вернуть lowercase hex фиксированной ширины
    virtual std::string finalize() = 0;

protected:
    Hasher() = default;
};

// ----------------------------------------------------------------------------
// Таблица алгоритмов
// ----------------------------------------------------------------------------

struct AlgorithmInfo {
    Algorithm algorithm;
    const char* name;       // имя в CLI/конфиге: "md5", "sha1", "xxhash64"
    const char* mhl_tag;    // имя элемента в MHL: "md5", "sha1", "xxhash64be"
    std::size_t hex_width;  // 32, 40, 16
    std::unique_ptr<Hasher> (*make)();
};

/// Все поддерживаемые алгоритмы в фиксированном порядке
const std::array<AlgorithmInfo, 3>& algorithms();

/// Дескриптор алгоритма
const AlgorithmInfo& info(Algorithm algorithm);

/// Разобрать имя алгоритма ("md5" | "sha1" | "xxhash64")
/// @throws std::invalid_argument для любого другого значения
Algorithm parse_algorithm(std::string_view name);

/// Найти алгоритм по имени элемента MHL ("xxhash64be" и т.д.)
std::optional<Algorithm> algorithm_from_mhl_tag(std::string_view tag);

/// Имя алгоритма для пользователя
std::string to_string(Algorithm algorithm);

/// Создать новый хешер
std::unique_ptr<Hasher> make_hasher(Algorithm algorithm);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Хеш буфера целиком
std::string hash_bytes(Algorithm algorithm, std::string_view data);

/// Байты -> lowercase hex
std::string to_hex(const unsigned char* data, std::size_t size);

/// Проверить, что строка - корректный дайджест алгоритма (ширина + hex)
bool is_valid_digest(Algorithm algorithm, std::string_view digest);

}  // namespace rccopy::hash

#endif  // RCCOPY_HASH_HPP
