// Writes an item-detail payload for a seller to hand over after a sale:
// a one-line header naming the item, then printable filler wrapped at 72
// columns, `size` bytes in total.

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static const char charset[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789 ";
static const size_t kLine = 72;

// "10KB", "1.5MiB", "300K", "500" (bytes when no unit)
static size_t parse_size(const std::string& str) {
    size_t i = 0;
    while (i < str.size() && (std::isdigit(static_cast<unsigned char>(str[i])) || str[i] == '.')) ++i;
    if (i == 0) return 0;

    double value = 0;
    try {
        value = std::stod(str.substr(0, i));
    } catch (const std::exception&) {
        return 0;
    }

    std::string unit = str.substr(i);
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    double mult = 0;
    if (unit.empty() || unit == "B") mult = 1;
    else if (unit == "K" || unit == "KB" || unit == "KIB") mult = 1024.0;
    else if (unit == "M" || unit == "MB" || unit == "MIB") mult = 1024.0 * 1024.0;
    else {
        std::cerr << "Unknown unit: " << unit << ". Use B, KB, MB, KiB or MiB.\n";
        return 0;
    }
    return static_cast<size_t>(value * mult);
}

static void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <size> <output_filename> [--name ITEM] [--seed S]\n"
              << "  size: bytes, or with a unit: 200B, 10KB, 1.5MiB\n"
              << "Example:\n"
              << "  " << prog << " 64KB lamp.details --name lamp\n";
}

int main(int argc, char* argv[]) {
    if (argc < 3 || std::string(argv[1]) == "-h") {
        usage(argv[0]);
        return 1;
    }

    size_t total = parse_size(argv[1]);
    if (total == 0) {
        std::cerr << "Invalid size: " << argv[1] << "\n";
        return 1;
    }
    const char* filename = argv[2];

    std::string name = "item";
    unsigned seed = (unsigned)std::time(nullptr);
    for (int i = 3; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--name" && i + 1 < argc) name = argv[++i];
        else if (s == "--seed" && i + 1 < argc) {
            try {
                seed = (unsigned)std::stoul(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Bad value for --seed\n";
                return 1;
            }
        }
        else { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return 1; }
    }

    std::ofstream ofs(filename, std::ios::binary);
    if (!ofs) {
        std::perror("ofstream");
        return 1;
    }

    std::string header = "Item: " + name + "\n";
    if (header.size() > total) header.resize(total);

    std::vector<char> body(total - header.size());
    std::srand(seed);
    static const size_t charset_len = sizeof(charset) - 1;
    for (size_t i = 0; i < body.size(); ++i) {
        body[i] = ((i + 1) % (kLine + 1) == 0) ? '\n' : charset[std::rand() % charset_len];
    }

    ofs.write(header.data(), static_cast<std::streamsize>(header.size()));
    ofs.write(body.data(), static_cast<std::streamsize>(body.size()));
    if (!ofs) {
        std::cerr << "Error writing to file.\n";
        return 1;
    }

    std::cout << "Generated " << filename << ": " << total << " bytes of details for '" << name << "'\n";
    return 0;
}
