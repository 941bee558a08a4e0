#include "lexer/source.hpp"

#include <algorithm>
#include <limits>

namespace bfq::lexer {

namespace {

auto saturate(size_t value) -> uint32_t {
    constexpr size_t limit = std::numeric_limits<uint32_t>::max();
    return static_cast<uint32_t>(std::min(value, limit));
}

} // namespace

Source::Source(std::string filename, std::string content)
    : filename_(std::move(filename)), content_(std::move(content)) {
    build_line_index();
}

void Source::build_line_index() {
    line_offsets_.assign(1, 0);
    for (size_t i = 0; i < content_.size(); ++i) {
        if (content_[i] == '\n') {
            line_offsets_.push_back(i + 1);
        }
    }
}

auto Source::at(size_t offset) const -> char {
    return offset < content_.size() ? content_[offset] : '\0';
}

auto Source::location(size_t offset) const -> SourceLocation {
    auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
    --it; // line_offsets_[0] == 0, so there is always a line at or before offset

    auto line_index = static_cast<size_t>(std::distance(line_offsets_.begin(), it));

    return SourceLocation{.file = filename_,
                          .line = saturate(line_index + 1),
                          .column = saturate(offset - *it + 1),
                          .offset = offset,
                          .length = 1};
}

auto Source::line(uint32_t line_num) const -> std::string_view {
    if (line_num == 0 || line_num > line_offsets_.size()) {
        return {};
    }

    size_t start = line_offsets_[line_num - 1];
    size_t end = line_num < line_offsets_.size() ? line_offsets_[line_num] : content_.size();

    // Strip "\n" and a preceding "\r"
    if (end > start && content_[end - 1] == '\n') {
        --end;
    }
    if (end > start && content_[end - 1] == '\r') {
        --end;
    }

    return std::string_view(content_).substr(start, end - start);
}

auto Source::line_count() const -> uint32_t {
    return saturate(line_offsets_.size());
}

auto Source::from_string(std::string content, std::string name) -> Source {
    return Source(std::move(name), std::move(content));
}

} // namespace bfq::lexer
