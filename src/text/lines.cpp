#include "text/lines.hpp"

namespace sublocator {
namespace text {

Terminator find_terminator(std::string_view text, size_t from) {
    size_t pos = text.find_first_of("\r\n", from);
    if (pos == std::string_view::npos) {
        return Terminator{text.size(), 0};
    }
    if (text[pos] == '\r' && pos + 1 < text.size() && text[pos + 1] == '\n') {
        return Terminator{pos, 2};
    }
    return Terminator{pos, 1};
}

std::vector<Line> split_lines(std::string_view text) {
    std::vector<Line> lines;
    int64_t number = 1;
    size_t start   = 0;
    while (true) {
        auto term = find_terminator(text, start);
        lines.push_back(Line{text.substr(start, term.offset - start), number});
        if (!term.found()) {
            break;
        }
        start = term.offset + term.width;
        ++number;
    }
    return lines;
}

} // namespace text
} // namespace sublocator
