/*
 * File: include/common/product.hpp
 * Project: Product Catalog API
 * Purpose: Product record, JSON mapping and the seeded read-only catalog
 * Notes:
 *  - Seed set is built once and never mutated
 *  - Lookups are a linear scan; three entries do not warrant an index
 * Last updated: 2026-10-19
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>


struct Product {
int id{0};
std::string name;
};


// Field names are part of the public contract: exactly "id" and "name".
inline nlohmann::json product_to_json(const Product& product){
return nlohmann::json{
{"id", product.id},
{"name", product.name}
};
}


class ProductCatalog {
std::vector<Product> products_;
public:
ProductCatalog()
    : products_{{121, "Laptop"}, {122, "Phone"}, {123, "Headphones"}} {}

const std::vector<Product>& all() const { return products_; }

std::optional<Product> find_by_id(int id) const {
    for (const auto& p : products_)
        if (p.id == id) return p;
    return std::nullopt;
}
};
