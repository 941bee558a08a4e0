#pragma once
#include <iosfwd>
#include <string>

namespace bfq::cli {

// Reads a whole file. Throws std::runtime_error if it cannot be opened or read.
std::string read_file(const std::string& path);

// Writes (truncates) a file. Throws std::runtime_error on failure.
void write_file(const std::string& path, const std::string& content);

void print_usage(std::ostream& out);
void print_version();

} // namespace bfq::cli
