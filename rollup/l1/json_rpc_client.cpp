// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc_client.hpp"

#include <regex>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/system/system_error.hpp>

#include <rollup/infra/common/log.hpp>

namespace rollup::l1 {

namespace http = boost::beast::http;
using boost::asio::ip::tcp;

HttpEndpoint parse_http_url(std::string_view url) {
    static const std::regex kHttpUrlPattern{R"(^http://([^:/\s]+)(?::([0-9]{1,5}))?(/\S*)?$)", std::regex::icase};
    const std::string url_str{url};
    std::smatch match;
    if (!std::regex_match(url_str, match, kHttpUrlPattern)) {
        throw std::invalid_argument{"invalid HTTP URL: " + url_str};
    }
    return HttpEndpoint{
        .host = match[1].str(),
        .port = match[2].matched ? match[2].str() : "80",
        .target = match[3].matched ? match[3].str() : "/",
    };
}

nlohmann::json decode_json_rpc_response(std::string_view body) {
    const auto response = nlohmann::json::parse(body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (response.is_discarded() || !response.is_object()) {
        throw JsonRpcError{"invalid JSON-RPC response: " + std::string{body.substr(0, 256)}};
    }
    if (response.contains("error") && !response.at("error").is_null()) {
        const auto& error = response.at("error");
        std::string message{error.dump()};
        if (error.is_object() && error.contains("message")) {
            message = error.at("message").is_string() ? error.at("message").get<std::string>() : error.at("message").dump();
            if (error.contains("code")) {
                message += " (code " + error.at("code").dump() + ")";
            }
        }
        throw JsonRpcError{"JSON-RPC error: " + message};
    }
    if (!response.contains("result")) {
        throw JsonRpcError{"JSON-RPC response without result"};
    }
    return response.at("result");
}

JsonRpcClient::JsonRpcClient(std::string_view url, std::chrono::milliseconds timeout)
    : endpoint_{parse_http_url(url)}, timeout_{timeout} {}

nlohmann::json JsonRpcClient::call(const std::string& method, nlohmann::json params) {
    const nlohmann::json request{
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", std::move(params)},
        {"id", next_id_++},
    };

    std::string body;
    try {
        std::scoped_lock lock{call_mutex_};
        ioc_.restart();
        auto response = boost::asio::co_spawn(ioc_, post(request.dump()), boost::asio::use_future);
        ioc_.run();
        body = response.get();
    } catch (const boost::system::system_error& se) {
        throw JsonRpcError{method + " to " + endpoint_.host + ":" + endpoint_.port + " failed: " + se.code().message()};
    }
    ROLLUP_TRACE << "JsonRpcClient::call method=" << method << " response size=" << body.size();
    return decode_json_rpc_response(body);
}

boost::asio::awaitable<std::string> JsonRpcClient::post(std::string body) {
    auto executor = co_await boost::asio::this_coro::executor;
    tcp::resolver resolver{executor};
    boost::beast::tcp_stream stream{executor};

    const auto endpoints = co_await resolver.async_resolve(endpoint_.host, endpoint_.port, boost::asio::use_awaitable);
    stream.expires_after(timeout_);
    co_await stream.async_connect(endpoints, boost::asio::use_awaitable);

    http::request<http::string_body> request{http::verb::post, endpoint_.target, 11};
    request.set(http::field::host, endpoint_.host);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(http::field::content_type, "application/json");
    request.body() = std::move(body);
    request.prepare_payload();

    stream.expires_after(timeout_);
    co_await http::async_write(stream, request, boost::asio::use_awaitable);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> response;
    co_await http::async_read(stream, buffer, response, boost::asio::use_awaitable);

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::beast::errc::not_connected) {
        ROLLUP_TRACE << "JsonRpcClient::post shutdown error: " << ec.message();
    }

    if (response.result() != http::status::ok) {
        throw JsonRpcError{"HTTP status " + std::to_string(response.result_int()) + " from " + endpoint_.host};
    }
    co_return response.body();
}

}  // namespace rollup::l1
