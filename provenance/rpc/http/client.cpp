// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/system/system_error.hpp>
#include <openssl/ssl.h>

#include <provenance/infra/common/log.hpp>
#include <provenance/infra/concurrency/task.hpp>
#include <provenance/rpc/common/rpc_error.hpp>

namespace provenance::rpc::http {

namespace beast = boost::beast;
namespace ssl = boost::asio::ssl;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

template <typename Stream>
static Task<Response> exchange(Stream& stream, const Endpoint& endpoint, const std::string& body,
                               const ClientSettings& settings) {
    beast::http::request<beast::http::string_body> request{beast::http::verb::post, endpoint.target, 11};
    request.set(beast::http::field::host, endpoint.host);
    request.set(beast::http::field::user_agent, settings.user_agent);
    request.set(beast::http::field::content_type, "application/json");
    request.set(beast::http::field::accept, "application/json");
    request.body() = body;
    request.prepare_payload();

    beast::get_lowest_layer(stream).expires_after(settings.request_timeout);
    co_await beast::http::async_write(stream, request, use_awaitable);

    beast::flat_buffer buffer;
    beast::http::response_parser<beast::http::string_body> parser;
    parser.body_limit(boost::none);
    beast::get_lowest_layer(stream).expires_after(settings.request_timeout);
    co_await beast::http::async_read(stream, buffer, parser, use_awaitable);

    auto response{parser.release()};
    co_return Response{response.result_int(), std::move(response.body())};
}

static Task<tcp::resolver::results_type> resolve(const Endpoint& endpoint) {
    auto executor = co_await boost::asio::this_coro::executor;
    tcp::resolver resolver{executor};
    co_return co_await resolver.async_resolve(endpoint.host, endpoint.port, use_awaitable);
}

static Task<Response> post_plain(Endpoint endpoint, std::string body, ClientSettings settings) {
    const auto results = co_await resolve(endpoint);

    beast::tcp_stream stream{co_await boost::asio::this_coro::executor};
    stream.expires_after(settings.request_timeout);
    co_await stream.async_connect(results, use_awaitable);

    auto response = co_await exchange(stream, endpoint, body, settings);
    stream.close();
    co_return response;
}

static Task<Response> post_tls(Endpoint endpoint, std::string body, ClientSettings settings, ssl::context& ssl_ctx) {
    const auto results = co_await resolve(endpoint);

    beast::ssl_stream<beast::tcp_stream> stream{co_await boost::asio::this_coro::executor, ssl_ctx};
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
        throw RpcError{RpcErrorKind::kTransport, "cannot set TLS server name for " + endpoint.host};
    }
    if (settings.verify_tls) {
        stream.set_verify_callback(ssl::host_name_verification{endpoint.host});
    }

    beast::get_lowest_layer(stream).expires_after(settings.request_timeout);
    co_await beast::get_lowest_layer(stream).async_connect(results, use_awaitable);
    co_await stream.async_handshake(ssl::stream_base::client, use_awaitable);

    auto response = co_await exchange(stream, endpoint, body, settings);
    // One-shot request: no TLS shutdown
    beast::get_lowest_layer(stream).close();
    co_return response;
}

Response Client::post(const Endpoint& endpoint, const std::string& body) {
    PROV_DEBUG_M("HTTP POST", {"endpoint", to_string(endpoint), "bytes", std::to_string(body.size())});

    boost::asio::io_context ioc;
    ssl::context ssl_ctx{ssl::context::tls_client};
    if (endpoint.secure) {
        ssl_ctx.set_default_verify_paths();
        ssl_ctx.set_verify_mode(settings_.verify_tls ? ssl::verify_peer : ssl::verify_none);
    }

    auto result = endpoint.secure
                      ? boost::asio::co_spawn(ioc, post_tls(endpoint, body, settings_, ssl_ctx), boost::asio::use_future)
                      : boost::asio::co_spawn(ioc, post_plain(endpoint, body, settings_), boost::asio::use_future);
    ioc.run();

    try {
        auto response = result.get();
        PROV_DEBUG_M("HTTP reply", {"status", std::to_string(response.status), "bytes", std::to_string(response.body.size())});
        return response;
    } catch (const boost::system::system_error& se) {
        if (se.code() == beast::error::timeout) {
            throw RpcError{RpcErrorKind::kTransport, "request to " + to_string(endpoint) + " timed out after " +
                                                         std::to_string(settings_.request_timeout.count()) + "ms"};
        }
        throw RpcError{RpcErrorKind::kTransport, "request to " + to_string(endpoint) + " failed: " + se.code().message()};
    }
}

}  // namespace provenance::rpc::http
