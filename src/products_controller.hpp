/*
 * File: src/products_controller.hpp
 * Project: Product Catalog API
 * Purpose: Endpoint handlers: products lookup, /error, /health
 * Notes:
 *  - Controllers only read shared state; no locking needed
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "catalog_pipeline.hpp"
#include "common/product.hpp"

// Whole-string base-10 int; anything else (including overflow) is rejected.
inline std::optional<int> parse_product_id(const std::string &raw)
{
    try
    {
        std::size_t used = 0;
        int id = std::stoi(raw, &used, 10);
        if (used != raw.size())
            return std::nullopt;
        return id;
    }
    catch (const std::invalid_argument &)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

class ProductsController
{
    const ProductCatalog &catalog_;

public:
    explicit ProductsController(const ProductCatalog &catalog) : catalog_(catalog) {}

    // GET /api/products/{id}
    void get_by_id(HttpContext &ctx) const
    {
        using nlohmann::json;

        auto it = ctx.route_values.find("id");
        if (it == ctx.route_values.end())
            throw std::runtime_error("route value 'id' missing for " + ctx.path);

        auto id = parse_product_id(it->second);
        if (!id)
            return write_json(ctx, http::status::bad_request,
                              json{{"message", "The value '" + it->second + "' is not valid for id."}});

        auto product = catalog_.find_by_id(*id);
        if (!product)
            return write_json(ctx, http::status::not_found, json{{"message", "Product not found."}});

        write_json(ctx, http::status::ok, product_to_json(*product));
    }
};

class ErrorController
{
public:
    void handle(HttpContext &ctx) const
    {
        write_json(ctx, http::status::internal_server_error,
                   nlohmann::json{{"title", "An error occurred while processing your request."}, {"status", 500}});
    }
};

class HealthController
{
    std::chrono::steady_clock::time_point start_;

public:
    explicit HealthController(std::chrono::steady_clock::time_point start) : start_(start) {}

    void handle(HttpContext &ctx) const
    {
        auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
        write_json(ctx, http::status::ok, nlohmann::json{{"status", "ok"}, {"uptime_s", up}});
    }
};
