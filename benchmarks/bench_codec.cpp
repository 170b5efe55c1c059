#include <benchmark/benchmark.h>
#include "lspc/codec.hpp"
#include "lspc/error.hpp"
#include "lspc/json_rpc.hpp"
#include <string>
#include <vector>

using namespace lspc;

static const std::string kHoverRequest =
    R"({"jsonrpc":"2.0","id":7,"method":"textDocument/hover","params":{"textDocument":{"uri":"file:///tmp/q.sql"},"position":{"line":0,"character":14}}})";

static const std::string kDiagnostics =
    R"({"jsonrpc":"2.0","method":"textDocument/publishDiagnostics","params":{"uri":"file:///tmp/q.sql","diagnostics":[{"range":{"start":{"line":0,"character":0},"end":{"line":0,"character":6}},"severity":1,"message":"syntax error at or near SELEC"}]}})";

// A completion response with N items, the typical large message from sqls.
static std::string make_completion_response(int n) {
    nlohmann::json items = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        items.push_back({
            {"label", "column_" + std::to_string(i)},
            {"kind", 5},
            {"detail", "users.column_" + std::to_string(i) + " varchar(255)"},
            {"documentation", {{"kind", "markdown"}, {"value", "Column **" + std::to_string(i) + "** of `users`"}}}
        });
    }
    nlohmann::json resp = {
        {"jsonrpc", "2.0"},
        {"id", 3},
        {"result", {{"isIncomplete", false}, {"items", items}}}
    };
    return resp.dump();
}

static const std::string kCompletionResponse = make_completion_response(500);

// ---- Parse ----

static void BM_ParseHoverRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kHoverRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kHoverRequest.size());
}
BENCHMARK(BM_ParseHoverRequest)->MinTime(1.0);

static void BM_ParseDiagnostics(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kDiagnostics);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kDiagnostics.size());
}
BENCHMARK(BM_ParseDiagnostics)->MinTime(1.0);

static void BM_ParseCompletionResponse(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kCompletionResponse);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kCompletionResponse.size());
}
BENCHMARK(BM_ParseCompletionResponse)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{\"jsonrpc\":\"2.0\",\"id\":";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const FramingError& e) {
            benchmark::DoNotOptimize(e.what());
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize ----

static void BM_EncodeHoverFrame(benchmark::State& state) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{7}};
    req.method = "textDocument/hover";
    req.params = nlohmann::json{
        {"textDocument", {{"uri", "file:///tmp/q.sql"}}},
        {"position", {{"line", 0}, {"character", 14}}}
    };

    for (auto _ : state) {
        auto s = Codec::encode_frame(req);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeHoverFrame)->MinTime(1.0);

static void BM_SerializeCompletionResponse(benchmark::State& state) {
    auto msg = Codec::parse(kCompletionResponse);

    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kCompletionResponse.size());
}
BENCHMARK(BM_SerializeCompletionResponse)->MinTime(1.0);

// ---- Framing ----

// Decode a stream of frames delivered in chunks of state.range(0) bytes.
static void BM_FrameDecoderChunked(benchmark::State& state) {
    const size_t chunk = static_cast<size_t>(state.range(0));
    std::string stream;
    for (int i = 0; i < 100; ++i) {
        stream += Codec::encode_frame(kDiagnostics);
    }

    for (auto _ : state) {
        FrameDecoder decoder;
        size_t frames = 0;
        for (size_t off = 0; off < stream.size(); off += chunk) {
            decoder.feed(std::string_view(stream).substr(off, chunk));
            while (auto body = decoder.next()) {
                benchmark::DoNotOptimize(body);
                ++frames;
            }
        }
        if (frames != 100) state.SkipWithError("lost frames");
    }
    state.SetBytesProcessed(state.iterations() * stream.size());
}
BENCHMARK(BM_FrameDecoderChunked)->Arg(1)->Arg(64)->Arg(4096)->MinTime(1.0);

static void BM_DecodeAndParse1K(benchmark::State& state) {
    std::string stream;
    for (int i = 0; i < 1000; ++i) {
        stream += Codec::encode_frame(kHoverRequest);
    }

    for (auto _ : state) {
        FrameDecoder decoder;
        decoder.feed(stream);
        while (auto body = decoder.next()) {
            auto msg = Codec::parse(*body);
            benchmark::DoNotOptimize(msg);
        }
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_DecodeAndParse1K)->MinTime(1.0);
