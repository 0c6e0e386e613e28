#pragma once

#include <stdexcept>
#include <string>

namespace inventory::domain {

/**
 * @brief Нарушен инвариант склада 0 <= reserved <= quantity
 *
 * Недостижимо при корректной работе координатора. Если всё же случилось -
 * операция прерывается, ошибка логируется, HTTP отвечает 500.
 */
class InvariantViolation : public std::runtime_error {
public:
    explicit InvariantViolation(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace inventory::domain
