/*
 * File: src/catalog_http.hpp
 * Project: Product Catalog API
 * Purpose: HTTP listener and per-connection session
 * Notes:
 *  - One request per connection; send side is shut down after the response
 *  - Each accepted socket runs on its own strand
 *  - Request handling is delegated to CatalogApp
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "catalog_app.hpp"
#include "catalog_pipeline.hpp"

namespace http = boost::beast::http;

// "[catalog] GET /api/products/121 -> 200"
inline std::string access_log_line(const HttpContext &ctx)
{
    std::ostringstream line;
    line << "[catalog] " << ctx.request.method_string() << ' ' << ctx.request.target()
         << " -> " << ctx.response.result_int() << '\n';
    return line.str();
}

// Runs `ioc` on `threads` threads, the caller's included. The first handler exception
// stops the context and is rethrown once every thread has been joined.
inline void run_on_threads(boost::asio::io_context &ioc, int threads)
{
    std::mutex m;
    std::exception_ptr failure;
    auto worker = [&]
    {
        try
        {
            ioc.run();
        }
        catch (const std::exception &)
        {
            {
                std::scoped_lock lk(m);
                if (!failure)
                    failure = std::current_exception();
            }
            ioc.stop();
        }
    };

    std::vector<std::thread> workers;
    auto join_all = [&]
    {
        for (auto &t : workers)
            t.join();
    };
    try
    {
        for (int i = 1; i < threads; ++i)
            workers.emplace_back(worker);
    }
    catch (const std::system_error &)
    {
        ioc.stop();
        join_all();
        throw;
    }
    worker();
    join_all();
    if (failure)
        std::rethrow_exception(failure);
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    const CatalogApp &app_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, const CatalogApp &app)
        : ioc_(ioc), acceptor_(ioc), app_(app)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (ec)
            throw std::runtime_error("acceptor open failed: " + ec.message());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec)
            throw std::runtime_error("set reuse_address failed: " + ec.message());
        acceptor_.bind(ep, ec);
        if (ec)
            throw std::runtime_error("bind " + ep.address().to_string() + ":" + std::to_string(ep.port()) +
                                     " failed: " + ec.message());
        acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("listen failed: " + ec.message());
        do_accept();
    }

    // Bound port; differs from the requested one when binding to port 0.
    unsigned short port() const { return acceptor_.local_endpoint().port(); }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_),
                               [this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (ec)
                std::cerr << "WARN: accept failed: " << ec.message() << "\n";
            else
                std::make_shared<Session>(std::move(socket), app_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        const CatalogApp &app;

        Session(boost::asio::ip::tcp::socket &&s, const CatalogApp &a)
            : socket(std::move(s)), app(a) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec)
                    return self->handle();
                if (ec != http::error::end_of_stream)
                    std::cerr << "WARN: read failed: " << ec.message() << "\n";
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored); });
        }

        // keep response alive through async_write
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            sp->set(http::field::server, "catalog-beast");
            sp->keep_alive(false);

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code ec, std::size_t)
                              {
                if (ec)
                    std::cerr << "WARN: write failed: " << ec.message() << "\n";
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void handle()
        {
            HttpContext ctx{std::move(req)};
            try
            {
                app.handle(ctx);
            }
            catch (const std::exception &e)
            {
                std::cerr << "ERROR: request failed: " << e.what() << "\n";
                reset_response(ctx);
                write_json(ctx, http::status::internal_server_error, nlohmann::json{{"error", "internal server error"}});
            }

            std::cout << access_log_line(ctx);

            respond(std::move(ctx.response));
        }
    };
};
