// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc_client.hpp"

#include <thread>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <catch2/catch_test_macros.hpp>

#include <rollup/l1/clients.hpp>
#include <rollup/test_util/sample_data.hpp>

namespace rollup::l1 {

using namespace std::chrono_literals;
namespace http = boost::beast::http;
using boost::asio::ip::tcp;

//! Serves a single HTTP request on the loopback interface with a canned response
class SingleRequestServer {
  public:
    SingleRequestServer(http::status status, std::string response_body)
        : acceptor_{ioc_, tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}} {
        thread_ = std::thread{[this, status, body = std::move(response_body)]() {
            tcp::socket socket{ioc_};
            acceptor_.accept(socket);
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> request;
            http::read(socket, buffer, request);
            request_body_ = request.body();
            target_ = std::string{request.target()};

            http::response<http::string_body> response{status, request.version()};
            response.set(http::field::content_type, "application/json");
            response.body() = body;
            response.prepare_payload();
            http::write(socket, response);
            boost::system::error_code ec;
            socket.shutdown(tcp::socket::shutdown_both, ec);
        }};
    }
    ~SingleRequestServer() {
        if (thread_.joinable()) thread_.join();
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/rpc"; }

    //! Waits for the request to be served and returns its body
    nlohmann::json request() {
        thread_.join();
        return nlohmann::json::parse(request_body_);
    }
    const std::string& target() const { return target_; }

  private:
    boost::asio::io_context ioc_;
    tcp::acceptor acceptor_;
    std::thread thread_;
    std::string request_body_;
    std::string target_;
};

TEST_CASE("parse_http_url", "[rollup][l1][json_rpc]") {
    CHECK(parse_http_url("http://localhost:7545") == HttpEndpoint{"localhost", "7545", "/"});
    CHECK(parse_http_url("http://10.0.0.1") == HttpEndpoint{"10.0.0.1", "80", "/"});
    CHECK(parse_http_url("http://node.example:8545/rpc/v1") == HttpEndpoint{"node.example", "8545", "/rpc/v1"});
    CHECK_THROWS_AS(parse_http_url("https://localhost:8545"), std::invalid_argument);
    CHECK_THROWS_AS(parse_http_url("localhost:8545"), std::invalid_argument);
    CHECK_THROWS_AS(parse_http_url("http://"), std::invalid_argument);
}

TEST_CASE("decode_json_rpc_response", "[rollup][l1][json_rpc]") {
    CHECK(decode_json_rpc_response(R"({"jsonrpc":"2.0","id":1,"result":"0x1"})") == "0x1");
    CHECK(decode_json_rpc_response(R"({"jsonrpc":"2.0","id":1,"result":null})").is_null());
    CHECK(decode_json_rpc_response(R"({"jsonrpc":"2.0","id":1,"result":[],"error":null})").empty());
    CHECK_THROWS_AS(decode_json_rpc_response("not json"), JsonRpcError);
    CHECK_THROWS_AS(decode_json_rpc_response("[1,2]"), JsonRpcError);
    CHECK_THROWS_AS(decode_json_rpc_response(R"({"jsonrpc":"2.0","id":1})"), JsonRpcError);
    CHECK_THROWS_AS(
        decode_json_rpc_response(R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"header not found"}})"),
        JsonRpcError);
}

TEST_CASE("JsonRpcClient call", "[rollup][l1][json_rpc]") {
    SECTION("result") {
        SingleRequestServer server{http::status::ok, R"({"jsonrpc":"2.0","id":1,"result":"0x2a"})"};
        JsonRpcClient client{server.url(), 2s};
        CHECK(client.call("eth_blockNumber", nlohmann::json::array()) == "0x2a");
        const auto request{server.request()};
        CHECK(request["method"] == "eth_blockNumber");
        CHECK(request["jsonrpc"] == "2.0");
        CHECK(server.target() == "/rpc");
    }

    SECTION("HTTP error") {
        SingleRequestServer server{http::status::internal_server_error, "{}"};
        JsonRpcClient client{server.url(), 2s};
        CHECK_THROWS_AS(client.call("eth_blockNumber", nlohmann::json::array()), JsonRpcError);
    }

    SECTION("connection refused") {
        JsonRpcClient client{"http://127.0.0.1:1", 500ms};
        CHECK_THROWS_AS(client.call("eth_blockNumber", nlohmann::json::array()), JsonRpcError);
    }
}

TEST_CASE("OpNodeClient sync_status", "[rollup][l1][clients]") {
    SECTION("decoded status") {
        SingleRequestServer server{http::status::ok, R"({"jsonrpc":"2.0","id":1,"result":{
            "current_l1": {"number": 10, "timestamp": 1700000000},
            "head_l1": {"number": 13, "timestamp": 1700000036},
            "unsafe_l2": {"number": 30, "l1origin": {"number": 10}},
            "engine_sync_target": {"number": 30}}})"};
        OpNodeClient client{server.url(), 2s};
        const auto status{client.sync_status()};
        CHECK(status.current_l1.number == 10);
        CHECK(status.head_l1.number == 13);
        CHECK(status.unsafe_l2.l1_origin.number == 10);
        CHECK(server.request()["method"] == "optimism_syncStatus");
    }

    SECTION("malformed status") {
        SingleRequestServer server{http::status::ok, R"({"jsonrpc":"2.0","id":1,"result":{"current_l1": {}}})"};
        OpNodeClient client{server.url(), 2s};
        CHECK_THROWS_AS(client.sync_status(), JsonRpcError);
    }
}

TEST_CASE("L1LogClient filter_logs", "[rollup][l1][clients]") {
    SingleRequestServer server{http::status::ok, R"({"jsonrpc":"2.0","id":1,"result":[{
        "address": "0xa513e6e4b8f2a923d98304ec87f64353c4d5c853",
        "topics": [],
        "data": "0x",
        "blockNumber": "0xb",
        "logIndex": "0x0"}]})"};
    L1LogClient client{server.url(), 2s};
    const auto logs{client.filter_logs(LogFilter{.from_block = 11, .to_block = 12})};
    REQUIRE(logs.size() == 1);
    CHECK(logs[0].block_num == 11);

    const auto request{server.request()};
    CHECK(request["method"] == "eth_getLogs");
    CHECK(request["params"][0]["fromBlock"] == "0xb");
    CHECK(request["params"][0]["toBlock"] == "0xc");
}

}  // namespace rollup::l1
