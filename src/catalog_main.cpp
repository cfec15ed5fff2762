/*
 * File: src/catalog_main.cpp
 * Project: Product Catalog API
 * Purpose: Server binary: GET /api/products/{id}, /health, /error
 * Notes:
 *  - SIGINT/SIGTERM stop the io_context; worker threads are joined before exit
 * Last updated: 2026-10-19
 */

#include <csignal>
#include <iostream>
#include <string>
#include <vector>
#include <boost/asio.hpp>
#include "catalog_app.hpp"
#include "catalog_http.hpp"
#include "catalog_state.hpp"

static const char *kUsage =
    "usage: catalog [--http host:port] [--https-port N] [--threads N]\n";

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    for (const auto &a : args)
    {
        if (a == "--help" || a == "-h")
        {
            std::cout << kUsage;
            return 0;
        }
    }

    CatalogState state;
    try
    {
        state.config = parse_catalog_args(args);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n"
                  << kUsage;
        return 2;
    }
    const CatalogConfig &cfg = state.config;

    try
    {
        boost::asio::io_context ioc{cfg.threads};
        CatalogApp app{state};

        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(cfg.http_host), cfg.http_port};
        HttpServer server{ioc, http_ep, app};

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&ioc](const boost::system::error_code &ec, int sig)
                           {
            if (ec)
                return;
            std::cout << "catalog stopping on signal " << sig << "\n";
            ioc.stop(); });

        std::cout << "catalog listening http=" << cfg.http_host << ":" << server.port()
                  << " https_port=" << (cfg.https_port ? std::to_string(*cfg.https_port) : std::string("none"))
                  << " threads=" << cfg.threads << "\n";

        run_on_threads(ioc, cfg.threads);
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
