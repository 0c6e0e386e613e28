#pragma once

#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Согласованный снимок остатка товара
 *
 * Все три числа взяты в один момент под секцией товара.
 */
struct Availability {
    std::string productId;
    int64_t quantity = 0;
    int64_t reserved = 0;
    int64_t available = 0;
};

} // namespace inventory::domain
