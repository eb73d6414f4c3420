#include "AuctionServer.h"

#include <iostream>
#include <string>

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --port P [--rto-ms MS] [--retries K] [--max-buyers N]"
              << " [--loss RATE] [--seed S] [--trace]\n";
}

static bool parse_args(int argc, char** argv, gavel::ServerArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        try {
            if (s == "--port" && need(1)) a.port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--rto-ms" && need(1)) a.rto_ms = std::stoi(argv[++i]);
            else if (s == "--retries" && need(1)) a.retries = std::stoi(argv[++i]);
            else if (s == "--max-buyers" && need(1)) a.max_buyers = (size_t)std::stoul(argv[++i]);
            else if (s == "--loss" && need(1)) a.loss = std::stod(argv[++i]);
            else if (s == "--seed" && need(1)) a.seed = (uint32_t)std::stoul(argv[++i]);
            else if (s == "--trace") a.trace = true;
            else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
            else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
        } catch (const std::exception&) {
            std::cerr << "Bad value for " << s << "\n";
            return false;
        }
    }

    if (a.rto_ms <= 0) { std::cerr << "--rto-ms must be >= 1\n"; return false; }
    if (a.retries < 0) { std::cerr << "--retries must be >= 0\n"; return false; }
    if (a.loss < 0.0 || a.loss >= 1.0) { std::cerr << "--loss must be in [0, 1)\n"; return false; }
    return true;
}

int main(int argc, char** argv) {
    gavel::ServerArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    gavel::AuctionServer server(args);
    if (!server.init()) return 2;
    if (!server.run()) return 3;
    return 0;
}
