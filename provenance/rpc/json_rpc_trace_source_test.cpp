// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "json_rpc_trace_source.hpp"

#include <memory>

#include <catch2/catch.hpp>
#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include <provenance/infra/test_util/log.hpp>
#include <provenance/rpc/common/rpc_error.hpp>
#include <provenance/rpc/test_util/mock_transport.hpp>

namespace provenance::rpc {

using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;
using testing::_;
using testing::Return;
using testing::Throw;

static constexpr auto kTxHash{0xdf3d25ab26b2bbdc4cc6b5e1b0ca49eb2f0bf0d76c7c62ee92bb63cbe0d5b9a2_bytes32};

struct JsonRpcTraceSourceTest {
    JsonRpcTraceSourceTest() {
        auto mock = std::make_unique<testing::StrictMock<test_util::MockTransport>>();
        transport = mock.get();
        source = std::make_unique<JsonRpcTraceSource>(*parse_endpoint("http://localhost:8545"), std::move(mock));
    }

    test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    testing::StrictMock<test_util::MockTransport>* transport{nullptr};
    std::unique_ptr<JsonRpcTraceSource> source;
};

static RpcErrorKind error_kind_of(JsonRpcTraceSource& source) {
    try {
        source.fetch_trace(kTxHash);
    } catch (const RpcError& e) {
        return e.kind();
    }
    FAIL("RpcError expected");
    return RpcErrorKind::kTransport;
}

TEST_CASE_METHOD(JsonRpcTraceSourceTest, "JsonRpcTraceSource::fetch_trace request", "[rpc][trace_source]") {
    std::string sent_body;
    EXPECT_CALL(*transport, post(_, _)).WillOnce([&](const Endpoint& endpoint, const std::string& body) {
        CHECK(endpoint.port == "8545");
        sent_body = body;
        return http::Response{200, R"({"jsonrpc":"2.0","id":1,"result":[]})"};
    });
    CHECK(source->fetch_trace(kTxHash).empty());

    const auto request{nlohmann::json::parse(sent_body)};
    CHECK(request["jsonrpc"] == "2.0");
    CHECK(request["method"] == "trace_transaction");
    CHECK(request["params"] == nlohmann::json::array({"0xdf3d25ab26b2bbdc4cc6b5e1b0ca49eb2f0bf0d76c7c62ee92bb63cbe0d5b9a2"}));
    CHECK(request["id"] == 1);
}

TEST_CASE_METHOD(JsonRpcTraceSourceTest, "JsonRpcTraceSource::fetch_trace decodes entries in order", "[rpc][trace_source]") {
    EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{200, R"({"jsonrpc":"2.0","id":1,"result":[
        {"action":{"callType":"call","from":"0xf39fd6e51aad88f6f4ce6ab8827279cfffb92266","to":"0xe7f1725e7734ce288f8367e1bb143e90bb3f0512","gas":"0x0","input":"0x","value":"0x0"},
         "result":{"gasUsed":"0x0","output":"0x"},"subtraces":1,"traceAddress":[],"type":"call"},
        {"action":{"from":"0xe7f1725e7734ce288f8367e1bb143e90bb3f0512","gas":"0x0","init":"0x6080","value":"0x0"},
         "result":{"address":"0x5fbdb2315678afecb367f032d93f642f64180aa3","code":"0x","gasUsed":"0x0"},"subtraces":0,"traceAddress":[0],"type":"create"}
    ]})"}));

    const auto entries{source->fetch_trace(kTxHash)};
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].action_type == ActionType::kCall);
    CHECK(entries[1].created_address() == 0x5fbdb2315678afecb367f032d93f642f64180aa3_address);
    CHECK(entries[1].trace_address == std::vector<int32_t>{0});
}

TEST_CASE_METHOD(JsonRpcTraceSourceTest, "JsonRpcTraceSource::fetch_trace null result", "[rpc][trace_source]") {
    EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{200, R"({"jsonrpc":"2.0","id":1,"result":null})"}));
    CHECK(source->fetch_trace(kTxHash).empty());
}

TEST_CASE_METHOD(JsonRpcTraceSourceTest, "JsonRpcTraceSource::fetch_trace failures", "[rpc][trace_source]") {
    SECTION("transport failure is propagated") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Throw(RpcError{RpcErrorKind::kTransport, "connection refused"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kTransport);
    }
    SECTION("method not found") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{
            200, R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"the method trace_transaction does not exist/is not available"}})"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kMethodUnsupported);
    }
    SECTION("generic JSON-RPC error keeps code and message") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{
            200, R"({"jsonrpc":"2.0","id":1,"error":{"code":-32000,"message":"execution timeout"}})"}));
        try {
            source->fetch_trace(kTxHash);
            FAIL("RpcError expected");
        } catch (const RpcError& e) {
            CHECK(e.kind() == RpcErrorKind::kJsonRpc);
            REQUIRE(e.json_rpc_error());
            CHECK(e.json_rpc_error()->code == -32000);
            CHECK(e.json_rpc_error()->message == "execution timeout");
            CHECK(std::string{e.what()} == "JSON-RPC error -32000: execution timeout");
        }
    }
    SECTION("HTTP status without JSON body") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{503, "Service Unavailable"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kHttpStatus);
    }
    SECTION("HTTP status with JSON body but no error object") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{401, R"({"message":"unauthorized"})"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kHttpStatus);
    }
    SECTION("body is not JSON") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{200, "<html></html>"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kMalformedResponse);
    }
    SECTION("result is not an array") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{200, R"({"jsonrpc":"2.0","id":1,"result":{}})"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kMalformedResponse);
    }
    SECTION("reply without result nor error") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{200, R"({"jsonrpc":"2.0","id":1})"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kMalformedResponse);
    }
    SECTION("mismatching reply id") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{200, R"({"jsonrpc":"2.0","id":7,"result":[]})"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kMalformedResponse);
    }
    SECTION("unknown trace type") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(http::Response{
            200, R"({"jsonrpc":"2.0","id":1,"result":[{"action":{},"type":"staticcall"}]})"}));
        CHECK(error_kind_of(*source) == RpcErrorKind::kMalformedResponse);
    }
}

}  // namespace provenance::rpc
