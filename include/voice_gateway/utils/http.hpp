#pragma once

#include <map>
#include <optional>
#include <string>

namespace voice_gateway::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path);

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path);

// Joins a base path from parse_url with a request path without doubling '/'.
std::string join_path(const std::string& base_path, const std::string& path);

std::string url_encode(const std::string& value);

std::string build_query(const std::map<std::string, std::string>& params);

// Value of a header in a raw HTTP or SIP message head. Names compare
// case-insensitively; the value is trimmed.
std::optional<std::string> find_header(const std::string& message, const std::string& name);

}
