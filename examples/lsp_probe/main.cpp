/// Open a file in a language server and print completion and hover results at
/// one position, followed by anything the server sent on its own.
/// Usage: ./lsp_probe [-v] <file> <line> <character> [-- <server_command> [args...]]
/// Example: ./lsp_probe -v query.sql 0 14 -- sqls -config ~/.config/sqls/config.yml
///
/// Without a server command the sqls preset is used with ./config.yml.

#include <lspc/lspc.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace {

int usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [-v] <file> <line> <character> [-- <server_command> [args...]]\n";
    return 1;
}

std::string absolute_path(const std::string& path) {
    if (!path.empty() && path[0] == '/') return path;
    char buf[4096];
    if (!::getcwd(buf, sizeof(buf))) return path;
    return std::string(buf) + "/" + path;
}

std::string language_of(const std::string& path) {
    auto dot = path.rfind('.');
    if (dot == std::string::npos) return "plaintext";
    std::string ext = path.substr(dot + 1);
    if (ext == "sql") return "sql";
    if (ext == "cpp" || ext == "hpp" || ext == "cc" || ext == "h") return "cpp";
    if (ext == "go") return "go";
    return ext;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    int i = 1;
    bool verbose = false;
    if (i < argc && std::string(argv[i]) == "-v") {
        verbose = true;
        ++i;
    }
    if (argc - i < 3) return usage(argv[0]);

    std::string path = absolute_path(argv[i]);
    int line = std::atoi(argv[i + 1]);
    int character = std::atoi(argv[i + 2]);
    i += 3;

    lspc::LspClient::Options opts = lspc::LspClient::Options::sqls("config.yml");
    if (i < argc) {
        if (std::string(argv[i]) != "--" || i + 1 >= argc) return usage(argv[0]);
        opts.command = argv[i + 1];
        opts.args.assign(argv + i + 2, argv + argc);
    }

    if (verbose) {
        auto log = spdlog::stderr_color_mt("lsp_probe");
        log->set_level(spdlog::level::debug);
        opts.logger = log;
    }

    std::ifstream in(path);
    if (!in) {
        std::cerr << "Cannot read " << path << "\n";
        return 1;
    }
    std::stringstream text;
    text << in.rdbuf();

    std::string root_uri = "file://" + path.substr(0, path.rfind('/'));
    std::string uri = "file://" + path;

    lspc::LspClient client{std::move(opts)};
    try {
        client.start();
        auto init = client.initialize(root_uri);
        std::cout << "--- capabilities ---\n" << init["capabilities"].dump(2) << "\n";
        client.initialized();
        client.did_open(uri, language_of(path), text.str());

        std::cout << "\n--- completion " << line << ":" << character << " ---\n";
        std::cout << client.completion(uri, line, character).dump(2) << "\n";

        std::cout << "\n--- hover " << line << ":" << character << " ---\n";
        std::cout << client.hover(uri, line, character).dump(2) << "\n";

        std::cout << "\n--- server messages ---\n";
        while (auto msg = client.notifications().pop_for(std::chrono::milliseconds(200))) {
            std::cout << lspc::Codec::serialize(*msg) << "\n";
        }
        if (client.notifications().dropped() > 0) {
            std::cout << "(" << client.notifications().dropped() << " dropped)\n";
        }

        (void)client.call("shutdown", nullptr);
        client.notify("exit", nullptr);
    } catch (const lspc::ProtocolError& e) {
        std::cerr << "Server error " << e.code << ": " << e.what() << "\n";
        client.stop();
        return 1;
    } catch (const lspc::LspcError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        client.stop();
        return 1;
    }

    client.stop();
    return 0;
}
