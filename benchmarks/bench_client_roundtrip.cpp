#include <benchmark/benchmark.h>
#include "lspc/client.hpp"
#include "support/scripted_server.hpp"
#include <thread>
#include <vector>

using namespace lspc;
using lspc::test::ScriptedServer;

static std::string answer_hover(const JsonRpcMessage& msg) {
    auto* req = std::get_if<JsonRpcRequest>(&msg);
    if (!req) return {};
    return ScriptedServer::respond(req->id, {
        {"contents", {{"kind", "markdown"}, {"value", "`users.id` integer"}}}
    });
}

// One caller, request and response over pipes.
static void BM_HoverRoundTrip(benchmark::State& state) {
    ScriptedServer server{answer_hover};
    LspClient client{LspClient::Options{}};
    client.connect(server.client_transport());

    for (auto _ : state) {
        auto result = client.hover("file:///tmp/q.sql", 0, 14);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_HoverRoundTrip)->MinTime(1.0);

// state.range(0) callers sharing one client.
static void BM_ConcurrentHover(benchmark::State& state) {
    const int callers = static_cast<int>(state.range(0));
    constexpr int kPerCaller = 100;
    ScriptedServer server{answer_hover};
    LspClient client{LspClient::Options{}};
    client.connect(server.client_transport());

    for (auto _ : state) {
        std::vector<std::thread> threads;
        for (int t = 0; t < callers; ++t) {
            threads.emplace_back([&client] {
                for (int i = 0; i < kPerCaller; ++i) {
                    auto result = client.hover("file:///tmp/q.sql", 0, i);
                    benchmark::DoNotOptimize(result);
                }
            });
        }
        for (auto& t : threads) t.join();
    }
    state.SetItemsProcessed(state.iterations() * callers * kPerCaller);
}
BENCHMARK(BM_ConcurrentHover)->Arg(1)->Arg(4)->Arg(16)->UseRealTime()->MinTime(1.0);
