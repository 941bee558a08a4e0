#include "utils.hpp"

#include "common.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace bfq::cli {

std::string read_file(const std::string& path) {
    // ifstream happily opens a directory and then reads nothing
    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("cannot open file: " + path + " (not a regular file)");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("cannot read file: " + path);
    }
    return buffer.str();
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("cannot create file: " + path);
    }
    file << content;
    file.flush();
    if (!file) {
        throw std::runtime_error("cannot write file: " + path);
    }
}

void print_usage(std::ostream& out) {
    out << "bfq " << VERSION << ": tape-language to QBE IL compiler\n\n";
    out << "Usage: bfq <file> [options]\n";
    out << "       bfq --help | --version\n\n";
    out << "Options:\n";
    out << "  --emit=qbe|tokens|ast  What to print (default: qbe)\n";
    out << "  -o <path>              Write output to <path> instead of stdout\n";
    out << "  --tape-cells=N         Addressable tape cells (default: 30000)\n";
    out << "  --cell-stride=1|4|8    Bytes per cell (default: 1)\n";
    out << "  --no-zero-tape         Do not memset the tape in the prologue\n";
    out << "  --help, -h             Show this help\n";
    out << "  --version, -V          Show version\n";
    out << "\nLogging:\n";
    out << "  --log-level=L          trace, debug, info, warn, error, off\n";
    out << "  --log-filter=S         Per-module levels, e.g. parser=debug,*=warn\n";
    out << "  --log-file=P           Also write log records to P\n";
    out << "  --log-format=text|json Log line format\n";
    out << "  -v, -vv, -vvv          Info, debug, trace\n";
    out << "  -q                     Errors only\n";
    out << "\nThe BFQ_LOG environment variable is used when no logging flag is given.\n";
}

void print_version() {
    std::cout << "bfq " << VERSION << "\n";
}

} // namespace bfq::cli
