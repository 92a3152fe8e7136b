#include "upsync/server/ingest_service.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <string>

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -p, --port <port>        listen port (default 8000)\n"
              << "  -a, --address <addr>     bind address (default 127.0.0.1)\n"
              << "  -t, --token <token>      required upload token (default: none)\n"
              << "      --path <path>        upload path (default /api/sync/upload)\n"
              << "      --fail <status>      answer the next upload with this status\n"
              << "  -h, --help               show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    uint16_t port = 8000;
    std::string address = "127.0.0.1";
    upsync::server::IngestOptions options;
    int fail_status = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (i + 1 >= argc) {
            spdlog::error("Missing value for {}", arg);
            print_usage(argv[0]);
            return 1;
        }
        try {
            if (arg == "-p" || arg == "--port") {
                port = static_cast<uint16_t>(std::stoi(argv[++i]));
            } else if (arg == "-a" || arg == "--address") {
                address = argv[++i];
            } else if (arg == "-t" || arg == "--token") {
                options.token = argv[++i];
            } else if (arg == "--path") {
                options.upload_path = argv[++i];
            } else if (arg == "--fail") {
                fail_status = std::stoi(argv[++i]);
            } else {
                spdlog::error("Unknown option: {}", arg);
                print_usage(argv[0]);
                return 1;
            }
        } catch (const std::exception& e) {
            spdlog::error("Invalid value for {}: {}", arg, e.what());
            return 1;
        }
    }

    upsync::server::IngestService service(options);
    if (fail_status != 0) {
        service.fail_next(fail_status, "Injected failure");
    }

    try {
        upsync::server::IngestServer server(service, address, port);

        boost::asio::io_context signals_context;
        boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int signal) {
            spdlog::info("Signal {} received, shutting down", signal);
            server.stop();
        });

        server.start();
        spdlog::info("Ingest stub listening on {}{}", server.url(), options.upload_path);
        if (options.token.empty()) {
            spdlog::warn("No token configured; every upload is accepted");
        }

        signals_context.run();
        spdlog::info("Received {} batches, {} articles, {} creators",
                     service.received_batch_ids().size(),
                     service.article_count(),
                     service.creator_count());
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }
    return 0;
}
