#include "voice_gateway/pipeline/response_streamer.hpp"

#include <cctype>
#include <cstring>
#include <utility>

#include "voice_gateway/utils/text.hpp"

namespace voice_gateway {

namespace {

constexpr const char* kEllipsis = "\xE2\x80\xA6";
constexpr const char* kCjkFullStop = "\xE3\x80\x82";
constexpr const char* kCjkExclamation = "\xEF\xBC\x81";
constexpr const char* kCjkQuestion = "\xEF\xBC\x9F";
constexpr const char* kCjkComma = "\xEF\xBC\x8C";

bool is_space(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool matches_at(const std::string& text, size_t index, const char* needle) {
    const size_t length = std::strlen(needle);
    return index + length <= text.size() && text.compare(index, length, needle) == 0;
}

// Position after closing quotes or brackets that trail a terminator.
size_t skip_closers(const std::string& text, size_t index) {
    while (index < text.size() &&
           (text[index] == '"' || text[index] == '\'' || text[index] == ')')) {
        ++index;
    }
    return index;
}

bool followed_by_space(const std::string& text, size_t index) {
    return index < text.size() && is_space(text[index]);
}

}

ResponseStreamer::ResponseStreamer(size_t min_clause_chars,
                                   size_t max_unit_chars,
                                   UnitHandler handler)
    : min_clause_chars_(min_clause_chars),
      max_unit_chars_(max_unit_chars == 0 ? 1 : max_unit_chars),
      handler_(std::move(handler)) {}

std::optional<size_t> ResponseStreamer::find_boundary() const {
    for (size_t i = 0; i < buffer_.size(); ++i) {
        const char ch = buffer_[i];
        if (ch == '.' || ch == '!' || ch == '?') {
            const auto end = skip_closers(buffer_, i + 1);
            if (followed_by_space(buffer_, end)) {
                return end;
            }
            continue;
        }
        if (matches_at(buffer_, i, kEllipsis)) {
            const auto end = skip_closers(buffer_, i + 3);
            if (followed_by_space(buffer_, end)) {
                return end;
            }
            continue;
        }
        // CJK text has no spaces; anything after the mark confirms the boundary.
        if (matches_at(buffer_, i, kCjkFullStop) || matches_at(buffer_, i, kCjkExclamation) ||
            matches_at(buffer_, i, kCjkQuestion)) {
            if (i + 3 < buffer_.size()) {
                return i + 3;
            }
            continue;
        }
        if (ch == ',' || ch == ';' || ch == ':') {
            if (followed_by_space(buffer_, i + 1) &&
                utils::utf8_length(buffer_.substr(0, i + 1)) >= min_clause_chars_) {
                return i + 1;
            }
            continue;
        }
        if (matches_at(buffer_, i, kCjkComma) && i + 3 < buffer_.size() &&
            utils::utf8_length(buffer_.substr(0, i + 3)) >= min_clause_chars_) {
            return i + 3;
        }
    }
    return std::nullopt;
}

std::optional<size_t> ResponseStreamer::find_forced_split() const {
    if (utils::utf8_length(buffer_) <= max_unit_chars_) {
        return std::nullopt;
    }
    // Byte offset of the first code point past the limit.
    size_t chars = 0;
    size_t limit = buffer_.size();
    for (size_t i = 0; i < buffer_.size(); ++i) {
        if ((static_cast<unsigned char>(buffer_[i]) & 0xC0) != 0x80) {
            if (chars == max_unit_chars_) {
                limit = i;
                break;
            }
            ++chars;
        }
    }
    for (size_t i = limit; i > 0; --i) {
        if (is_space(buffer_[i - 1])) {
            return i;
        }
    }
    return limit;
}

void ResponseStreamer::drain() {
    while (!cancelled_.load() && !buffer_.empty()) {
        auto cut = find_boundary();
        if (cut && utils::utf8_length(buffer_.substr(0, *cut)) > max_unit_chars_) {
            cut.reset();
        }
        if (!cut) {
            cut = find_forced_split();
        }
        if (!cut) {
            return;
        }
        const auto unit = buffer_.substr(0, *cut);
        buffer_.erase(0, *cut);
        forward(unit);
    }
}

void ResponseStreamer::forward(const std::string& raw) {
    const auto unit = utils::trim(utils::sanitize_for_speech(raw));
    if (unit.empty() || cancelled_.load()) {
        return;
    }
    ++units_forwarded_;
    if (handler_) {
        handler_(unit);
    }
}

void ResponseStreamer::feed(const std::string& increment) {
    if (cancelled_.load() || increment.empty()) {
        return;
    }
    buffer_ += increment;
    drain();
}

void ResponseStreamer::finish() {
    if (cancelled_.load()) {
        return;
    }
    drain();
    if (!buffer_.empty()) {
        const auto rest = std::move(buffer_);
        buffer_.clear();
        forward(rest);
    }
}

void ResponseStreamer::cancel() {
    cancelled_.store(true);
}

}
