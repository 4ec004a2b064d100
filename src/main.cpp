#include "multi_upstream.hpp"
#include "upstream_connector.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace upstream_mux;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " -d|--config-dir DIR [-c|--client ADDR] [-t|--tunnel] [-o|--open] TARGET...\n"
              << "  TARGET is host[:port]; the port defaults to 443 with --tunnel, 80 otherwise.\n";
}

bool parse_target(const std::string& text, bool tunnel, FlowView& flow) {
    std::string host;
    uint16_t port = 0;
    if (!parse_host_port(text, tunnel ? 443 : 80, host, port)) return false;
    flow.target_host = host;
    flow.target_port = port;
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_dir;
        std::string client = "127.0.0.1";
        bool tunnel = false;
        bool open_connections = false;
        std::vector<std::string> targets;
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-d" || arg == "--config-dir") && i + 1 < argc) {
                config_dir = argv[++i];
            } else if ((arg == "-c" || arg == "--client") && i + 1 < argc) {
                client = argv[++i];
            } else if (arg == "-t" || arg == "--tunnel") {
                tunnel = true;
            } else if (arg == "-o" || arg == "--open") {
                open_connections = true;
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else {
                targets.push_back(arg);
            }
        }
        if (config_dir.empty() || targets.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        MultiUpstream router(std::cerr);
        if (router.configure(config_dir) != LoadStatus::Loaded) {
            std::cerr << "[fatal] no usable configuration in " << config_dir << "\n";
            return 1;
        }

        boost::asio::io_context io;
        int failures = 0;
        for (const auto& target : targets) {
            FlowView flow;
            flow.client_address = client;
            if (!parse_target(target, tunnel, flow)) {
                std::cerr << "[fatal] invalid target '" << target << "'\n";
                return 1;
            }

            auto decision = tunnel ? router.tunnel_connect(flow) : router.request(flow);
            if (!decision) {
                std::cout << *flow.target_host << ":" << *flow.target_port << " -> direct\n";
                continue;
            }
            std::cout << *flow.target_host << ":" << *flow.target_port << " -> " << decision->proxy->name
                      << " " << decision->via.scheme << "://" << decision->via.host << ":" << decision->via.port;
            if (decision->proxy_authorization) std::cout << " [proxy-authorization]";
            if (decision->tunnel_credentials) std::cout << " [socks5 user/pass]";
            std::cout << "\n";

            if (open_connections) {
                auto connector = std::make_shared<UpstreamConnector>(
                    io.get_executor(), *decision, *flow.target_host, *flow.target_port);
                connector->start([&failures](ConnectResult result) {
                    if (!result.ok) ++failures;
                });
            }
        }

        io.run();
        return failures == 0 ? 0 : 2;
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] " << ex.what() << "\n";
        return 1;
    }
}
