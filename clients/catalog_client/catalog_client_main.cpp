/*
 * File: clients/catalog_client/catalog_client_main.cpp
 * Project: Product Catalog API
 * Purpose: Example HTTP consumer client
 * Notes:
 *  - GET /api/products/{id} for each --id (default 121, 122, 123)
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace http = boost::beast::http;
using json = nlohmann::json;

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:8080";
    std::vector<std::string> ids;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--id" && i + 1 < argc)
            ids.emplace_back(argv[++i]);
        else if (a == "--pretty")
            pretty = true;
        else
        {
            std::cerr << "usage: catalog_client [--http http://host:port] [--id N]... [--pretty]\n";
            return 2;
        }
    }
    if (ids.empty())
        ids = {"121", "122", "123"};

    try
    {
        auto pos = base.find("//");
        auto hp = (pos == std::string::npos) ? base : base.substr(pos + 2);
        auto colon = hp.find(':');
        auto host = hp.substr(0, colon);
        auto port = (colon == std::string::npos) ? std::string("80") : hp.substr(colon + 1);

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto results = res.resolve(host, port);

        for (const auto &id : ids)
        {
            boost::asio::ip::tcp::socket sock{ioc};
            boost::asio::connect(sock, results.begin(), results.end());
            http::request<http::empty_body> req{http::verb::get, "/api/products/" + id, 11};
            req.set(http::field::host, host);
            req.set(http::field::accept, "application/json");
            http::write(sock, req);
            boost::beast::flat_buffer buf;
            http::response<http::string_body> resp;
            http::read(sock, buf, resp);

            try
            {
                auto j = json::parse(resp.body());
                std::cout << "[catalog_client] status=" << resp.result_int() << " body:\n";
                std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;
            }
            catch (const json::parse_error &e)
            {
                std::cout << "[catalog_client] status=" << resp.result_int()
                          << " raw body=" << resp.body()
                          << " (failed to parse JSON: " << e.what() << ")" << std::endl;
            }

            boost::system::error_code ignored;
            sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "[catalog_client] error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
