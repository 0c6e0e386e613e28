#pragma once

#include "domain/Timestamp.hpp"

namespace inventory::ports::output {

/**
 * @brief Источник времени
 *
 * В production - SystemClock, в тестах - ручные часы,
 * чтобы проверять истечение TTL без sleep.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() const = 0;
};

} // namespace inventory::ports::output
