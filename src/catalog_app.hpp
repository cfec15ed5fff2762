/*
 * File: src/catalog_app.hpp
 * Project: Product Catalog API
 * Purpose: Wires routes, controllers and the request stages together
 * Last updated: 2026-10-19
 */

#pragma once
#include "catalog_pipeline.hpp"
#include "catalog_state.hpp"
#include "products_controller.hpp"

// Route handlers capture `this`: not copyable, not movable.
class CatalogApp
{
    const CatalogState &state_;
    RouteTable routes_;
    ProductsController products_;
    ErrorController errors_;
    HealthController health_;
    Next handler_;

public:
    explicit CatalogApp(const CatalogState &state)
        : state_(state), products_(state.catalog), health_(state.start)
    {
        routes_.map(http::verb::get, "/api/products/{id}", [this](HttpContext &ctx)
                    { products_.get_by_id(ctx); });
        routes_.map_any("/error", [this](HttpContext &ctx)
                        { errors_.handle(ctx); });
        routes_.map(http::verb::get, "/health", [this](HttpContext &ctx)
                    { health_.handle(ctx); });

        RequestPipeline pipeline;
        pipeline.use(exception_handler_middleware("/error"))
            .use(https_redirection_middleware(state_.config.https_port))
            .use(routing_middleware(routes_))
            .use(endpoint_middleware());
        handler_ = pipeline.build(not_found_handler);
    }

    CatalogApp(const CatalogApp &) = delete;
    CatalogApp &operator=(const CatalogApp &) = delete;

    void handle(HttpContext &ctx) const { handler_(ctx); }
};
