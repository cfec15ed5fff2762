/*
 * File: tests/test_http_endpoints.cpp
 * Project: Product Catalog API
 * Purpose: End-to-end requests against a listener on an ephemeral loopback port
 * Last updated: 2026-10-19
 */

#include <catch2/catch_all.hpp>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "catalog_app.hpp"
#include "catalog_http.hpp"
#include "catalog_state.hpp"

using boost::asio::ip::tcp;

namespace
{
struct RunningServer
{
    boost::asio::io_context ioc;
    CatalogState state;
    std::unique_ptr<CatalogApp> app;
    std::unique_ptr<HttpServer> server;
    unsigned short port{0};
    std::vector<std::thread> runners;

    explicit RunningServer(int threads = 1) : ioc{threads}
    {
        app = std::make_unique<CatalogApp>(state);
        server = std::make_unique<HttpServer>(ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}, *app);
        port = server->port();
        for (int i = 0; i < threads; ++i)
            runners.emplace_back([this]
                                 { ioc.run(); });
    }

    ~RunningServer()
    {
        ioc.stop();
        for (auto &t : runners)
            t.join();
    }

    http::response<http::string_body> get(const std::string &target) const
    {
        boost::asio::io_context client_ioc;
        tcp::socket sock{client_ioc};
        sock.connect(tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), port});
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, "127.0.0.1");
        http::write(sock, req);
        boost::beast::flat_buffer buf;
        http::response<http::string_body> res;
        http::read(sock, buf, res);
        boost::system::error_code ignored;
        sock.shutdown(tcp::socket::shutdown_both, ignored);
        return res;
    }
};

// Redirects std::cout for the lifetime of the guard.
struct CoutCapture
{
    std::ostringstream out;
    std::streambuf *old;
    CoutCapture() : old(std::cout.rdbuf(out.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old); }
};
} // namespace


TEST_CASE("GET /api/products/{id} over the wire"){
RunningServer s;

auto ok = s.get("/api/products/122");
REQUIRE(ok.result() == http::status::ok);
REQUIRE(ok[http::field::server] == "catalog-beast");
REQUIRE(ok[http::field::content_type] == "application/json; charset=utf-8");
auto j = nlohmann::json::parse(ok.body());
REQUIRE(j.at("id").get<int>() == 122);
REQUIRE(j.at("name").get<std::string>() == "Phone");

auto missing = s.get("/api/products/7");
REQUIRE(missing.result() == http::status::not_found);
REQUIRE(missing.body() == R"({"message":"Product not found."})");
}

TEST_CASE("server keeps accepting after each response"){
RunningServer s;
for (int id : {121, 122, 123, 121})
    REQUIRE(s.get("/api/products/" + std::to_string(id)).result() == http::status::ok);
REQUIRE(s.get("/health").result() == http::status::ok);
}

TEST_CASE("binding an occupied port fails loudly"){
RunningServer s;
CatalogState state;
CatalogApp app{state};
boost::asio::io_context ioc;
// reuse_address does not allow two listeners on the same port
REQUIRE_THROWS_AS(HttpServer(ioc, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), s.port}, app),
                  std::runtime_error);
}

TEST_CASE("concurrent requests on a multi-threaded context"){
RunningServer s{4};
const std::vector<int> ids{121, 122, 123, 999, 121, 122, 123, 999};
std::vector<http::response<http::string_body>> responses(ids.size());
std::vector<std::string> errors(ids.size());
std::vector<std::thread> clients;
for (std::size_t i = 0; i < ids.size(); ++i)
    clients.emplace_back([&, i]{
        try { responses[i] = s.get("/api/products/" + std::to_string(ids[i])); }
        catch (const std::exception& e) { errors[i] = e.what(); }
    });
for (auto& t : clients) t.join();

for (std::size_t i = 0; i < ids.size(); ++i) {
    INFO("id " << ids[i]);
    REQUIRE(errors[i].empty());
    if (ids[i] == 999) {
        REQUIRE(responses[i].result() == http::status::not_found);
        REQUIRE(responses[i].body() == R"({"message":"Product not found."})");
    } else {
        REQUIRE(responses[i].result() == http::status::ok);
        REQUIRE(nlohmann::json::parse(responses[i].body()).at("id").get<int>() == ids[i]);
    }
}
}

TEST_CASE("each request writes one access log line"){
CoutCapture capture;
{
    RunningServer s;
    REQUIRE(s.get("/api/products/123?x=1").result() == http::status::ok);
    REQUIRE(s.get("/api/products/5").result() == http::status::not_found);
}
const std::string log = capture.out.str();
REQUIRE(log.find("[catalog] GET /api/products/123?x=1 -> 200\n") != std::string::npos);
REQUIRE(log.find("[catalog] GET /api/products/5 -> 404\n") != std::string::npos);
}

TEST_CASE("access log line format"){
http::request<http::string_body> req{http::verb::post, "/api/products/121", 11};
HttpContext ctx{std::move(req)};
ctx.response.result(http::status::method_not_allowed);
REQUIRE(access_log_line(ctx) == "[catalog] POST /api/products/121 -> 405\n");
}

TEST_CASE("a throwing handler stops every thread and is rethrown"){
boost::asio::io_context ioc{3};
auto guard = boost::asio::make_work_guard(ioc);
boost::asio::post(ioc, []{ throw std::runtime_error("handler failed"); });
REQUIRE_THROWS_WITH(run_on_threads(ioc, 3), "handler failed");
REQUIRE(ioc.stopped());
}

TEST_CASE("run_on_threads returns once the context runs out of work"){
boost::asio::io_context ioc{2};
int ran = 0;
boost::asio::post(ioc, [&ran]{ ++ran; });
run_on_threads(ioc, 2);
REQUIRE(ran == 1);
}
