/*
 * File: src/catalog_pipeline.hpp
 * Project: Product Catalog API
 * Purpose: Per-request context, route table and the ordered request stages
 * Notes:
 *  - Stages run in registration order: exception handler, https redirection,
 *    routing, endpoint dispatch
 *  - Route table is filled during wiring only; endpoints are referenced by pointer afterwards
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/http.hpp>
#include <boost/algorithm/string/predicate.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace http = boost::beast::http;

struct Endpoint;

// -------- request context --------

struct HttpContext
{
    http::request<http::string_body> request;
    std::string path;  // may be rewritten (exception handler re-execution)
    std::string query; // without the leading '?'
    http::response<http::string_body> response;

    const Endpoint *endpoint = nullptr;
    std::map<std::string, std::string> route_values;
    std::vector<http::verb> allowed_methods; // path matched, method did not
    bool is_https = false;

    explicit HttpContext(http::request<http::string_body> req)
        : request(std::move(req)), response{http::status::ok, request.version()}
    {
        const std::string target(request.target());
        auto qpos = target.find('?');
        path = target.substr(0, qpos);
        if (qpos != std::string::npos)
            query = target.substr(qpos + 1);
    }
};

inline void reset_response(HttpContext &ctx)
{
    ctx.response = http::response<http::string_body>{http::status::ok, ctx.request.version()};
}

inline void write_json(HttpContext &ctx, http::status status, const nlohmann::json &body)
{
    ctx.response.result(status);
    ctx.response.set(http::field::content_type, "application/json; charset=utf-8");
    ctx.response.body() = body.dump();
    ctx.response.prepare_payload();
}

// -------- routes --------

using RequestHandler = std::function<void(HttpContext &)>;

struct Endpoint
{
    std::optional<http::verb> method; // nullopt: any method
    std::string pattern;
    std::vector<std::string> segments;
    RequestHandler handler;
};

struct RouteMatch
{
    const Endpoint *endpoint = nullptr;
    std::map<std::string, std::string> values;
    std::vector<http::verb> allowed;
    bool malformed = false; // bad percent-escape in the path
};

// "/a/b/" -> {"a", "b"}; one trailing slash is dropped, inner empty segments are kept
inline std::vector<std::string> split_path(const std::string &path)
{
    std::vector<std::string> out;
    std::string p = path;
    if (!p.empty() && p.front() == '/')
        p.erase(0, 1);
    if (!p.empty() && p.back() == '/')
        p.pop_back();
    if (p.empty())
        return out;
    std::string::size_type start = 0;
    for (;;)
    {
        auto slash = p.find('/', start);
        out.push_back(p.substr(start, slash - start));
        if (slash == std::string::npos)
            break;
        start = slash + 1;
    }
    return out;
}

// Decodes %XX escapes in one path segment; nullopt on a truncated or non-hex escape.
inline std::optional<std::string> percent_decode(const std::string &segment)
{
    auto hex = [](char c) -> int
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(segment.size());
    for (std::size_t i = 0; i < segment.size(); ++i)
    {
        if (segment[i] != '%')
        {
            out.push_back(segment[i]);
            continue;
        }
        if (i + 2 >= segment.size())
            return std::nullopt;
        int hi = hex(segment[i + 1]);
        int lo = hex(segment[i + 2]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
    }
    return out;
}

class RouteTable
{
    std::vector<Endpoint> endpoints_;

    static bool is_parameter(const std::string &segment)
    {
        return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
    }

    static bool match_segments(const Endpoint &ep, const std::vector<std::string> &parts,
                               std::map<std::string, std::string> &values)
    {
        if (ep.segments.size() != parts.size())
            return false;
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            const auto &tpl = ep.segments[i];
            if (is_parameter(tpl))
            {
                if (parts[i].empty())
                    return false;
                values[tpl.substr(1, tpl.size() - 2)] = parts[i];
            }
            else if (!boost::algorithm::iequals(tpl, parts[i]))
            {
                return false;
            }
        }
        return true;
    }

public:
    void map(http::verb method, std::string pattern, RequestHandler handler)
    {
        auto segments = split_path(pattern);
        endpoints_.push_back(Endpoint{method, std::move(pattern), std::move(segments), std::move(handler)});
    }

    void map_any(std::string pattern, RequestHandler handler)
    {
        auto segments = split_path(pattern);
        endpoints_.push_back(Endpoint{std::nullopt, std::move(pattern), std::move(segments), std::move(handler)});
    }

    RouteMatch match(http::verb method, const std::string &path) const
    {
        RouteMatch result;
        // split first so an encoded '/' stays inside its segment
        std::vector<std::string> parts;
        for (const auto &raw : split_path(path))
        {
            auto decoded = percent_decode(raw);
            if (!decoded)
            {
                result.malformed = true;
                return result;
            }
            parts.push_back(std::move(*decoded));
        }
        for (const auto &ep : endpoints_)
        {
            std::map<std::string, std::string> values;
            if (!match_segments(ep, parts, values))
                continue;
            if (!ep.method || *ep.method == method)
            {
                result.endpoint = &ep;
                result.values = std::move(values);
                result.allowed.clear();
                return result;
            }
            result.allowed.push_back(*ep.method);
        }
        return result;
    }
};

// -------- pipeline --------

using Next = std::function<void(HttpContext &)>;
using Middleware = std::function<void(HttpContext &, const Next &)>;

class RequestPipeline
{
    std::vector<Middleware> stages_;

public:
    RequestPipeline &use(Middleware stage)
    {
        stages_.push_back(std::move(stage));
        return *this;
    }

    // First registered stage runs first; `terminal` runs when every stage called next.
    Next build(Next terminal) const
    {
        Next next = std::move(terminal);
        for (auto it = stages_.rbegin(); it != stages_.rend(); ++it)
        {
            next = [stage = *it, rest = std::move(next)](HttpContext &ctx)
            { stage(ctx, rest); };
        }
        return next;
    }
};

// -------- stages --------

// Catches exceptions from the rest of the pipeline and re-executes it at `error_path`.
// If the re-execution throws or finds no endpoint, the original exception propagates.
inline Middleware exception_handler_middleware(std::string error_path)
{
    return [error_path](HttpContext &ctx, const Next &next)
    {
        try
        {
            next(ctx);
        }
        catch (const std::exception &e)
        {
            std::cerr << "ERROR: unhandled exception on " << ctx.request.method_string() << ' '
                      << ctx.path << ": " << e.what() << "\n";
            auto original = std::current_exception();
            const std::string original_path = ctx.path;
            const std::string original_query = ctx.query;

            ctx.path = error_path;
            ctx.query.clear();
            ctx.endpoint = nullptr;
            ctx.route_values.clear();
            ctx.allowed_methods.clear();
            reset_response(ctx);
            ctx.response.result(http::status::internal_server_error);

            bool handled = false;
            try
            {
                next(ctx);
                handled = ctx.endpoint != nullptr;
            }
            catch (const std::exception &inner)
            {
                std::cerr << "ERROR: error handler at " << error_path << " threw: " << inner.what() << "\n";
            }

            ctx.path = original_path;
            ctx.query = original_query;
            if (!handled)
                std::rethrow_exception(original);
        }
    };
}

inline Middleware https_redirection_middleware(std::optional<unsigned short> https_port)
{
    auto warned = std::make_shared<std::atomic<bool>>(false);
    return [https_port, warned](HttpContext &ctx, const Next &next)
    {
        if (ctx.is_https)
            return next(ctx);
        if (!https_port)
        {
            if (!warned->exchange(true))
                std::cerr << "WARN: failed to determine the https port for redirect\n";
            return next(ctx);
        }

        std::string host(ctx.request[http::field::host]);
        if (!host.empty() && host.front() == '[')
        {
            auto close = host.find(']');
            if (close != std::string::npos)
                host.erase(close + 1);
        }
        else
        {
            auto colon = host.find(':');
            if (colon != std::string::npos)
                host.erase(colon);
        }
        if (host.empty())
            host = "localhost";

        std::string location = "https://" + host;
        if (*https_port != 443)
            location += ":" + std::to_string(*https_port);
        location += ctx.path;
        if (!ctx.query.empty())
            location += "?" + ctx.query;

        ctx.response.result(http::status::temporary_redirect);
        ctx.response.set(http::field::location, location);
        ctx.response.body().clear();
        ctx.response.prepare_payload();
    };
}

inline Middleware routing_middleware(const RouteTable &routes)
{
    return [&routes](HttpContext &ctx, const Next &next)
    {
        auto m = routes.match(ctx.request.method(), ctx.path);
        if (m.malformed)
            return write_json(ctx, http::status::bad_request, nlohmann::json{{"error", "malformed path"}});
        ctx.endpoint = m.endpoint;
        ctx.route_values = std::move(m.values);
        ctx.allowed_methods = std::move(m.allowed);
        next(ctx);
    };
}

inline Middleware endpoint_middleware()
{
    return [](HttpContext &ctx, const Next &next)
    {
        if (ctx.endpoint)
            return ctx.endpoint->handler(ctx);
        next(ctx);
    };
}

// Terminal: nothing matched (404) or only the method was wrong (405).
inline void not_found_handler(HttpContext &ctx)
{
    using nlohmann::json;
    if (!ctx.allowed_methods.empty())
    {
        std::string allow;
        for (auto verb : ctx.allowed_methods)
        {
            if (!allow.empty())
                allow += ", ";
            allow += std::string(http::to_string(verb));
        }
        ctx.response.set(http::field::allow, allow);
        return write_json(ctx, http::status::method_not_allowed, json{{"error", "method not allowed"}});
    }
    write_json(ctx, http::status::not_found, json{{"error", "not found"}});
}
