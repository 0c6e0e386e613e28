#pragma once

#include "ports/output/IStockLedger.hpp"
#include <cstddef>
#include <string>

namespace inventory::adapters::secondary {

/**
 * @brief Загрузка начальных остатков в складской журнал
 *
 * Формат файла:
 * ```json
 * {
 *   "products": [
 *     {"product_id": "GGOEAFKA087499", "quantity": 100},
 *     {"product_id": "GGOEAFKA087500", "quantity": 50}
 *   ]
 * }
 * ```
 *
 * Вызывается один раз при старте, до начала обработки запросов.
 */
class CatalogLoader {
public:
    /**
     * @brief Загрузить каталог из файла
     * @return Количество загруженных товаров
     * @throws std::runtime_error если файл не открывается или формат неверный
     */
    static size_t loadFromFile(const std::string& path, ports::output::IStockLedger& ledger);

    /**
     * @brief Загрузить каталог из JSON строки
     * @throws std::runtime_error при неверном формате
     * @throws std::invalid_argument при отрицательном остатке
     */
    static size_t loadFromString(const std::string& json, ports::output::IStockLedger& ledger);

    /**
     * @brief Встроенный демо-каталог (5 товаров)
     */
    static size_t loadDefaults(ports::output::IStockLedger& ledger);
};

} // namespace inventory::adapters::secondary
