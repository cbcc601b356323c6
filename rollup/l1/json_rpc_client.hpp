// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <nlohmann/json.hpp>

namespace rollup::l1 {

class JsonRpcError : public std::runtime_error {
  public:
    explicit JsonRpcError(const std::string& message) : std::runtime_error{message} {}
};

struct HttpEndpoint {
    std::string host;
    std::string port;
    std::string target;

    friend bool operator==(const HttpEndpoint&, const HttpEndpoint&) = default;
};

//! \brief Splits an http://host[:port][/target] URL, port defaults to 80 and target to /
//! \throws std::invalid_argument if the URL is not a plain HTTP URL
HttpEndpoint parse_http_url(std::string_view url);

//! \brief Extracts the result member from a JSON-RPC 2.0 response body
//! \throws JsonRpcError if the body is not valid JSON, carries an error member or misses the result
nlohmann::json decode_json_rpc_response(std::string_view body);

//! \brief Blocking JSON-RPC 2.0 client over HTTP/1.1, one connection per call
//! \details Calls are serialized, each bounded by the configured timeout
class JsonRpcClient {
  public:
    JsonRpcClient(std::string_view url, std::chrono::milliseconds timeout);

    JsonRpcClient(const JsonRpcClient&) = delete;
    JsonRpcClient& operator=(const JsonRpcClient&) = delete;

    //! \return the result member of the response
    //! \throws JsonRpcError on transport, HTTP or JSON-RPC failure
    nlohmann::json call(const std::string& method, nlohmann::json params);

    const HttpEndpoint& endpoint() const { return endpoint_; }

  private:
    boost::asio::awaitable<std::string> post(std::string body);

    HttpEndpoint endpoint_;
    std::chrono::milliseconds timeout_;
    boost::asio::io_context ioc_;
    std::mutex call_mutex_;
    std::atomic_uint64_t next_id_{1};
};

}  // namespace rollup::l1
