#include "match/match_stream.hpp"

#include "text/utf8.hpp"

#include <re2/re2.h>

namespace sublocator {
namespace match {

MatchStream::MatchStream(std::string_view text, const pattern::Matcher& matcher)
    : text_(text), matcher_(matcher) {}

std::optional<MatchSpan> MatchStream::next() {
    size_t begin = 0;
    size_t end   = 0;
    if (done_ || !find_next(begin, end)) {
        done_ = true;
        return std::nullopt;
    }

    MatchSpan span{text_.substr(last_end_, begin - last_end_), text_.substr(begin, end - begin),
                   begin};
    last_end_ = end;
    if (end == begin) {
        // Zero-width: step over one codepoint, a whole CRLF pair, or past the end
        size_t width = splits_crlf(end + 1) ? 2 : utf8::rune_width_at(text_, end);
        search_      = end + (width == 0 ? 1 : width);
    } else {
        search_ = end;
    }
    return span;
}

bool MatchStream::find_next(size_t& begin, size_t& end) {
    while (search_ <= text_.size()) {
        bool found = false;
        if (const auto* literal = std::get_if<pattern::Literal>(&matcher_)) {
            found = find_literal(*literal, begin, end);
        } else {
            found = find_regex(std::get<pattern::Regex>(matcher_), begin, end);
        }
        if (!found) {
            return false;
        }
        if (begin != end || !splits_crlf(begin)) {
            return true;
        }
        // An empty match between '\r' and '\n' belongs to the start of the
        // terminator, unless the previous match already consumed the '\r'.
        if (begin - 1 >= last_end_) {
            begin = end = begin - 1;
            return true;
        }
        search_ = begin + 1;
    }
    return false;
}

bool MatchStream::splits_crlf(size_t pos) const {
    return pos > 0 && pos < text_.size() && text_[pos - 1] == '\r' && text_[pos] == '\n';
}

std::vector<MatchSpan> MatchStream::collect_all() {
    std::vector<MatchSpan> spans;
    while (auto span = next()) {
        spans.push_back(*span);
    }
    return spans;
}

bool MatchStream::find_literal(const pattern::Literal& literal, size_t& begin, size_t& end) const {
    size_t pos = text_.find(literal.text, search_);
    if (pos == std::string_view::npos) {
        return false;
    }
    begin = pos;
    end   = pos + literal.text.size();
    return true;
}

bool MatchStream::find_regex(const pattern::Regex& regex, size_t& begin, size_t& end) const {
    re2::StringPiece text(text_.data(), text_.size());
    re2::StringPiece whole;
    if (!regex.program().Match(text, search_, text_.size(), RE2::UNANCHORED, &whole, 1)) {
        return false;
    }
    begin = static_cast<size_t>(whole.data() - text_.data());
    end   = begin + whole.size();
    return true;
}

} // namespace match
} // namespace sublocator
