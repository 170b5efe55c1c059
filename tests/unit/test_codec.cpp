#include <gtest/gtest.h>
#include "lspc/codec.hpp"
#include "lspc/error.hpp"

using namespace lspc;

// ---- Parse tests ----

TEST(CodecParse, ValidRequest) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":1,"method":"textDocument/hover","params":{}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    auto& req = std::get<JsonRpcRequest>(msg);
    EXPECT_EQ(std::get<int64_t>(req.id), 1);
    EXPECT_EQ(req.method, "textDocument/hover");
}

TEST(CodecParse, ValidRequestStringId) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":"abc-123","method":"workspace/configuration"})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcRequest>(msg));
    EXPECT_EQ(std::get<std::string>(std::get<JsonRpcRequest>(msg).id), "abc-123");
}

TEST(CodecParse, ValidResponse) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":42,"result":{"capabilities":{}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    EXPECT_EQ(std::get<int64_t>(resp.id), 42);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("capabilities"));
}

TEST(CodecParse, NullResultIsAResult) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","id":3,"result":null})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->is_null());
    EXPECT_FALSE(resp.error.has_value());
}

TEST(CodecParse, ValidErrorResponse) {
    auto msg = Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found","data":{"m":"x"}}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    auto& resp = std::get<JsonRpcResponse>(msg);
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, -32601);
    EXPECT_EQ(resp.error->message, "Method not found");
    ASSERT_TRUE(resp.error->data.has_value());
    EXPECT_EQ((*resp.error->data)["m"], "x");
}

TEST(CodecParse, ValidNotification) {
    auto msg = Codec::parse(R"({"jsonrpc":"2.0","method":"textDocument/publishDiagnostics","params":{"uri":"file:///a.sql","diagnostics":[]}})");
    ASSERT_TRUE(std::holds_alternative<JsonRpcNotification>(msg));
    EXPECT_EQ(std::get<JsonRpcNotification>(msg).method, "textDocument/publishDiagnostics");
}

TEST(CodecParse, InvalidJson) {
    EXPECT_THROW(Codec::parse("{invalid json"), FramingError);
}

TEST(CodecParse, MissingJsonrpc) {
    EXPECT_THROW(Codec::parse(R"({"id":1,"method":"initialize"})"), FramingError);
}

TEST(CodecParse, WrongJsonrpcVersion) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"1.0","id":1,"method":"initialize"})"), FramingError);
}

TEST(CodecParse, NullId) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"method":"initialize"})"), FramingError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":null,"result":{}})"), FramingError);
}

TEST(CodecParse, FractionalIdRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1.5,"result":{}})"), FramingError);
}

TEST(CodecParse, ResponseNeedsExactlyOneOfResultOrError) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","id":1})"), FramingError);
    EXPECT_THROW(Codec::parse(
        R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})"), FramingError);
}

TEST(CodecParse, NeitherIdNorMethod) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","result":{}})"), FramingError);
}

TEST(CodecParse, EmptyInput) {
    EXPECT_THROW(Codec::parse(""), FramingError);
}

TEST(CodecParse, NotAnObject) {
    EXPECT_THROW(Codec::parse("[1,2,3]"), FramingError);
}

TEST(CodecParse, TrailingContentRejected) {
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","method":"x"}}})"), FramingError);
    EXPECT_THROW(Codec::parse(R"({"jsonrpc":"2.0","method":"x"} {"jsonrpc":"2.0","method":"y"})"), FramingError);
    // Whitespace after the object is fine.
    EXPECT_NO_THROW((void)Codec::parse("{\"jsonrpc\":\"2.0\",\"method\":\"x\"}\r\n"));
}

// ---- Serialize tests ----

TEST(CodecSerialize, NotificationWithEmptyParams) {
    JsonRpcNotification notif;
    notif.method = "initialized";
    notif.params = nlohmann::json::object();
    auto j = nlohmann::json::parse(Codec::serialize(notif));
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "initialized");
    EXPECT_TRUE(j["params"].is_object());
    EXPECT_TRUE(j["params"].empty());
    EXPECT_FALSE(j.contains("id"));
}

TEST(CodecSerialize, RoundTrip) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{7}};
    req.method = "textDocument/completion";
    req.params = nlohmann::json{{"textDocument", {{"uri", "file:///q.sql"}}},
                                {"position", {{"line", 0}, {"character", 3}}}};

    JsonRpcResponse ok;
    ok.id = RequestId{int64_t{7}};
    ok.result = nlohmann::json{{"isIncomplete", false}, {"items", nlohmann::json::array()}};

    JsonRpcResponse failed;
    failed.id = RequestId{std::string{"x"}};
    failed.error = JsonRpcError{error::InvalidParams, "bad position", nlohmann::json{{"line", -1}}};

    JsonRpcNotification notif;
    notif.method = "textDocument/didOpen";
    notif.params = nlohmann::json{{"textDocument", {{"uri", "file:///q.sql"}}}};

    for (const JsonRpcMessage& msg : std::vector<JsonRpcMessage>{req, ok, failed, notif}) {
        EXPECT_EQ(Codec::parse(Codec::serialize(msg)), msg);
    }
}

// ---- Frame encoding ----

TEST(CodecFrame, ContentLengthCountsBytes) {
    JsonRpcNotification notif;
    notif.method = "textDocument/didChange";
    // Multi-byte UTF-8: byte count differs from character count.
    notif.params = nlohmann::json{{"text", "SELECT 'héllo ✓' FROM t"}};

    std::string body = Codec::serialize(notif);
    std::string frame = Codec::encode_frame(notif);

    std::string expected_header = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    ASSERT_EQ(frame.substr(0, expected_header.size()), expected_header);
    EXPECT_EQ(frame.substr(expected_header.size()), body);
    EXPECT_EQ(frame.size(), expected_header.size() + body.size());
}

TEST(CodecFrame, DecodeOfEncodeIsIdentity) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "initialize";
    req.params = nlohmann::json{{"processId", nullptr}, {"rootUri", "file:///tmp"},
                                {"capabilities", nlohmann::json::object()}};

    FrameDecoder decoder;
    decoder.feed(Codec::encode_frame(req));
    auto body = decoder.next();
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(Codec::parse(*body), JsonRpcMessage{req});
    EXPECT_EQ(decoder.buffered(), 0u);
}

// ---- Large message test ----

TEST(CodecParse, LargeCompletionList) {
    nlohmann::json items = nlohmann::json::array();
    for (int i = 0; i < 500; ++i) {
        items.push_back({
            {"label", "column_" + std::to_string(i)},
            {"kind", 5},
            {"detail", "Column of table_" + std::to_string(i % 7)}
        });
    }
    nlohmann::json response = {
        {"jsonrpc", "2.0"},
        {"id", 9},
        {"result", {{"isIncomplete", false}, {"items", items}}}
    };
    auto msg = Codec::parse(response.dump());
    ASSERT_TRUE(std::holds_alternative<JsonRpcResponse>(msg));
    EXPECT_EQ(std::get<JsonRpcResponse>(msg).result->at("items").size(), 500u);
}
