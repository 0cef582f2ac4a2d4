#include "text/line_cursor.hpp"

#include "text/lines.hpp"
#include "text/utf8.hpp"

namespace sublocator {
namespace text {

Location advance(Location cursor, std::string_view slice) {
    int64_t terminators = 0;
    size_t tail_start   = 0;
    while (true) {
        auto term = find_terminator(slice, tail_start);
        if (!term.found()) {
            break;
        }
        ++terminators;
        tail_start = term.offset + term.width;
    }

    int64_t tail = utf8::codepoint_length(slice.substr(tail_start));
    if (terminators == 0) {
        return Location{cursor.line, cursor.col + tail};
    }
    return Location{cursor.line + terminators, tail + kColumnOffset};
}

SlicePosition locate_slice(Location cursor, std::string_view preceding,
                           std::string_view matched) {
    Location begin = advance(cursor, preceding);
    return SlicePosition{begin, advance(begin, matched)};
}

Location LineCursor::advance(std::string_view slice) {
    size_t end = offset_ + slice.size();
    bool split_crlf = !slice.empty() && slice.back() == '\r' && end < text_.size() &&
                      text_[end] == '\n';
    if (split_crlf) {
        cursor_ = text::advance(cursor_, slice.substr(0, slice.size() - 1));
        cursor_.col += 1;
    } else {
        cursor_ = text::advance(cursor_, slice);
    }
    offset_ = end;
    return cursor_;
}

Location LineCursor::locate_slice(std::string_view preceding, std::string_view matched) {
    Location begin = advance(preceding);
    advance(matched);
    return begin;
}

} // namespace text
} // namespace sublocator
