#include "adapters/secondary/catalog/CatalogLoader.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace inventory::adapters::secondary {

namespace {

size_t loadProducts(const nlohmann::json& root, ports::output::IStockLedger& ledger)
{
    if (!root.is_object() || !root.contains("products") || !root["products"].is_array()) {
        throw std::runtime_error("Catalog must be an object with a \"products\" array");
    }

    size_t loaded = 0;
    for (const auto& item : root["products"]) {
        if (!item.is_object()) {
            throw std::runtime_error("Catalog entry must be an object");
        }
        if (!item.contains("product_id") || !item["product_id"].is_string()) {
            throw std::runtime_error("Catalog entry requires string \"product_id\"");
        }
        if (!item.contains("quantity") || !item["quantity"].is_number_integer()) {
            throw std::runtime_error("Catalog entry requires integer \"quantity\"");
        }

        auto productId = item["product_id"].get<std::string>();
        if (ledger.contains(productId)) {
            throw std::runtime_error("Duplicate catalog product_id: " + productId);
        }

        ledger.addProduct(productId, item["quantity"].get<int64_t>());
        ++loaded;
    }
    return loaded;
}

} // namespace

size_t CatalogLoader::loadFromFile(const std::string& path, ports::output::IStockLedger& ledger)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open catalog file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    size_t loaded = loadFromString(buffer.str(), ledger);
    std::cout << "[CatalogLoader] Loaded " << loaded << " products from " << path << std::endl;
    return loaded;
}

size_t CatalogLoader::loadFromString(const std::string& json, ports::output::IStockLedger& ledger)
{
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("Invalid catalog JSON: ") + e.what());
    }
    return loadProducts(root, ledger);
}

size_t CatalogLoader::loadDefaults(ports::output::IStockLedger& ledger)
{
    ledger.addProduct("GGOEAFKA087499", 100);
    ledger.addProduct("GGOEAFKA087500", 50);
    ledger.addProduct("GGOEAFKA087501", 75);
    ledger.addProduct("GGOEAFKA087502", 200);
    ledger.addProduct("GGOEAFKA087503", 30);

    std::cout << "[CatalogLoader] Loaded demo catalog (5 products)" << std::endl;
    return 5;
}

} // namespace inventory::adapters::secondary
