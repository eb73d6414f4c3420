#include "AuctionClient.h"

#include <iostream>
#include <sstream>
#include <string>

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " --server A.B.C.D --port P"
              << " [--item NAME --reserve PRICE --type first|second --duration-ms MS"
              << " [--close-after-ms MS] [--file path]]"
              << " [--bids N,N,...] [--out file]"
              << " [--rto-ms MS] [--retries K] [--loss RATE] [--seed S] [--trace]\n"
              << "Seller options apply when this client is the first to connect.\n"
              << "Without --item the seller is prompted for: <1|2> <reserve> <duration_ms> <name>\n"
              << "Without --bids a buyer reads one bid per line from stdin.\n";
}

static bool parse_bids(const std::string& list, std::vector<uint32_t>& out) {
    std::stringstream ss(list);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        unsigned long v = std::stoul(tok);
        if (v == 0 || v > UINT32_MAX) return false;
        out.push_back((uint32_t)v);
    }
    return !out.empty();
}

static bool parse_args(int argc, char** argv, gavel::ClientArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        try {
            if (s == "--server" && need(1)) a.server = argv[++i];
            else if (s == "--port" && need(1)) a.port = (uint16_t)std::stoi(argv[++i]);
            else if (s == "--item" && need(1)) a.item = argv[++i];
            else if (s == "--reserve" && need(1)) a.reserve = (uint32_t)std::stoul(argv[++i]);
            else if (s == "--type" && need(1)) {
                std::string t = argv[++i];
                if (t == "first" || t == "1") a.type = gavel::AuctionType::FirstPrice;
                else if (t == "second" || t == "2") a.type = gavel::AuctionType::SecondPrice;
                else { std::cerr << "--type must be first or second\n"; return false; }
            }
            else if (s == "--duration-ms" && need(1)) a.duration_ms = std::stoi(argv[++i]);
            else if (s == "--close-after-ms" && need(1)) a.close_after_ms = std::stoi(argv[++i]);
            else if (s == "--file" && need(1)) a.file = argv[++i];
            else if (s == "--bids" && need(1)) {
                if (!parse_bids(argv[++i], a.bids)) { std::cerr << "--bids must be positive integers\n"; return false; }
            }
            else if (s == "--out" && need(1)) a.out = argv[++i];
            else if (s == "--rto-ms" && need(1)) a.rto_ms = std::stoi(argv[++i]);
            else if (s == "--retries" && need(1)) a.retries = std::stoi(argv[++i]);
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

    if (a.duration_ms <= 0) { std::cerr << "--duration-ms must be >= 1\n"; return false; }
    if (a.rto_ms <= 0) { std::cerr << "--rto-ms must be >= 1\n"; return false; }
    if (a.retries < 0) { std::cerr << "--retries must be >= 0\n"; return false; }
    if (a.loss < 0.0 || a.loss >= 1.0) { std::cerr << "--loss must be in [0, 1)\n"; return false; }
    return true;
}

int main(int argc, char** argv) {
    gavel::ClientArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    gavel::AuctionClient client(args);
    if (!client.init()) return 2;
    if (!client.run()) return 3;
    return 0;
}
