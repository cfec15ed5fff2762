/*
 * File: src/catalog_state.hpp
 * Project: Product Catalog API
 * Purpose: Process-wide configuration and read-only state
 * Notes:
 *  - Flags: --http host:port, --https-port N, --threads N
 *  - Everything here is set up before the io_context runs and only read afterwards
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "common/product.hpp"


struct CatalogConfig {
std::string http_host{"0.0.0.0"};
unsigned short http_port{8080};
std::optional<unsigned short> https_port; // unset: redirection stage passes through
int threads{1};
};


struct CatalogState {
CatalogConfig config;
ProductCatalog catalog;
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};


inline unsigned short parse_port(const std::string& s){
int v = 0;
try {
    std::size_t used = 0;
    v = std::stoi(s, &used);
    if (used != s.size()) throw std::invalid_argument(s);
} catch (const std::logic_error&) {
    throw std::invalid_argument("invalid port: '" + s + "'");
}
if (v < 0 || v > 65535) throw std::invalid_argument("port out of range: " + s);
return static_cast<unsigned short>(v);
}


// Throws std::invalid_argument on unknown flags or bad values.
inline CatalogConfig parse_catalog_args(const std::vector<std::string>& args){
CatalogConfig cfg;
for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];
    if (a != "--http" && a != "--https-port" && a != "--threads")
        throw std::invalid_argument("unknown option " + a);
    if (i + 1 >= args.size())
        throw std::invalid_argument("missing value for " + a);
    const std::string& v = args[++i];
    if (a == "--http") {
        auto p = v.rfind(':');
        if (p == std::string::npos || p == 0)
            throw std::invalid_argument("--http expects host:port, got '" + v + "'");
        cfg.http_host = v.substr(0, p);
        cfg.http_port = parse_port(v.substr(p + 1));
    } else if (a == "--https-port") {
        cfg.https_port = parse_port(v);
    } else {
        try {
            std::size_t used = 0;
            cfg.threads = std::stoi(v, &used);
            if (used != v.size()) throw std::invalid_argument(v);
        } catch (const std::logic_error&) {
            throw std::invalid_argument("invalid thread count: '" + v + "'");
        }
        if (cfg.threads < 1) throw std::invalid_argument("--threads must be at least 1");
    }
}
return cfg;
}
