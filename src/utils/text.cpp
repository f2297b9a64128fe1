#include "voice_gateway/utils/text.hpp"

#include <array>
#include <cctype>
#include <cstdint>
#include <utility>

namespace voice_gateway::utils {

namespace {

bool is_emoji_codepoint(uint32_t codepoint) {
    return (codepoint >= 0x1F600 && codepoint <= 0x1F64F) ||
           (codepoint >= 0x1F300 && codepoint <= 0x1F5FF) ||
           (codepoint >= 0x1F680 && codepoint <= 0x1F6FF) ||
           (codepoint >= 0x1F700 && codepoint <= 0x1F77F) ||
           (codepoint >= 0x1F780 && codepoint <= 0x1F7FF) ||
           (codepoint >= 0x1F800 && codepoint <= 0x1F8FF) ||
           (codepoint >= 0x1F900 && codepoint <= 0x1F9FF) ||
           (codepoint >= 0x1FA00 && codepoint <= 0x1FA6F) ||
           (codepoint >= 0x1FA70 && codepoint <= 0x1FAFF) ||
           (codepoint >= 0x2600 && codepoint <= 0x26FF) ||
           (codepoint >= 0x2702 && codepoint <= 0x27B0) ||
           (codepoint >= 0x1F1E6 && codepoint <= 0x1F1FF) ||
           codepoint == 0xFE0F || codepoint == 0x200D;
}

bool decode_utf8(const std::string& text, size_t index, uint32_t& codepoint, size_t& length) {
    const auto byte = static_cast<unsigned char>(text[index]);
    if (byte < 0x80) {
        codepoint = byte;
        length = 1;
        return true;
    }
    if ((byte & 0xE0) == 0xC0 && index + 1 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        if ((b1 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x1F) << 6) | (b1 & 0x3F);
        length = 2;
        return codepoint >= 0x80;
    }
    if ((byte & 0xF0) == 0xE0 && index + 2 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F);
        length = 3;
        return codepoint >= 0x800;
    }
    if ((byte & 0xF8) == 0xF0 && index + 3 < text.size()) {
        const auto b1 = static_cast<unsigned char>(text[index + 1]);
        const auto b2 = static_cast<unsigned char>(text[index + 2]);
        const auto b3 = static_cast<unsigned char>(text[index + 3]);
        if ((b1 & 0xC0) != 0x80 || (b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
            return false;
        }
        codepoint = ((byte & 0x07) << 18) |
                    ((b1 & 0x3F) << 12) |
                    ((b2 & 0x3F) << 6) |
                    (b3 & 0x3F);
        length = 4;
        return codepoint >= 0x10000 && codepoint <= 0x10FFFF;
    }
    return false;
}

const std::array<std::pair<uint32_t, const char*>, 11>& speech_replacements() {
    static const std::array<std::pair<uint32_t, const char*>, 11> table = {{
        {0x2018, "'"},
        {0x2019, "'"},
        {0x201C, "\""},
        {0x201D, "\""},
        {0x00AB, "\""},
        {0x00BB, "\""},
        {0x2013, "-"},
        {0x2014, "-"},
        {0x2026, "..."},
        {0x00A0, " "},
        {0x202F, " "},
    }};
    return table;
}

}

std::string remove_emojis(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        uint32_t codepoint = 0;
        size_t length = 1;
        if (!decode_utf8(text, i, codepoint, length)) {
            result.push_back(text[i]);
            ++i;
            continue;
        }
        if (!is_emoji_codepoint(codepoint)) {
            result.append(text, i, length);
        }
        i += length;
    }
    return result;
}

std::string sanitize_for_speech(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        uint32_t codepoint = 0;
        size_t length = 1;
        if (!decode_utf8(text, i, codepoint, length)) {
            result.push_back(text[i]);
            ++i;
            continue;
        }
        const char* replacement = nullptr;
        for (const auto& item : speech_replacements()) {
            if (item.first == codepoint) {
                replacement = item.second;
                break;
            }
        }
        if (replacement) {
            result += replacement;
        } else if (!is_emoji_codepoint(codepoint)) {
            result.append(text, i, length);
        }
        i += length;
    }
    return result;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

bool is_blank(const std::string& text) {
    for (unsigned char ch : text) {
        if (!std::isspace(ch)) {
            return false;
        }
    }
    return true;
}

bool is_recognition_noise(const std::string& text) {
    const auto trimmed = trim(text);
    size_t index = 0;
    size_t digits = 0;
    while (index < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[index]))) {
        ++digits;
        ++index;
    }
    if (digits == 0 || digits > 2) {
        return false;
    }
    while (index < trimmed.size() && std::isspace(static_cast<unsigned char>(trimmed[index]))) {
        ++index;
    }
    if (index == trimmed.size()) {
        return true;
    }
    const auto rest = trimmed.substr(index);
    // '.', ',', ideographic full stop and fullwidth comma
    return rest == "." || rest == "," || rest == "\xE3\x80\x82" || rest == "\xEF\xBC\x8C";
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char ch : text) {
        if ((ch & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

}
