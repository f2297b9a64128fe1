#pragma once

#include <string>

namespace voice_gateway::utils {

std::string remove_emojis(const std::string& text);

// Replaces typographic characters that synthesis voices read badly (curly
// quotes, dashes, ellipsis, non-breaking spaces) and strips emoji.
std::string sanitize_for_speech(const std::string& text);

std::string trim(const std::string& text);
bool is_blank(const std::string& text);

// One or two digits with at most one trailing punctuation mark; what
// recognisers emit for clicks and breathing.
bool is_recognition_noise(const std::string& text);

// Length in code points, used for unit size limits.
size_t utf8_length(const std::string& text);

}
