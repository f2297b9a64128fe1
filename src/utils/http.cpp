#include "voice_gateway/utils/http.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace voice_gateway::utils {

void parse_url(const std::string& url, std::string& scheme, std::string& host,
               int& port, std::string& base_path) {
    std::string working = url;
    scheme = "http";
    base_path = "";
    host.clear();
    port = 0;

    const auto scheme_pos = working.find("://");
    if (scheme_pos != std::string::npos) {
        scheme = working.substr(0, scheme_pos);
        std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        working = working.substr(scheme_pos + 3);
    }

    const auto path_pos = working.find('/');
    if (path_pos != std::string::npos) {
        base_path = working.substr(path_pos);
        working = working.substr(0, path_pos);
    } else {
        base_path = "/";
    }

    const bool secure = scheme == "https" || scheme == "wss";
    const auto port_pos = working.find(':');
    if (port_pos != std::string::npos) {
        host = working.substr(0, port_pos);
        port = std::stoi(working.substr(port_pos + 1));
    } else {
        host = working;
        port = secure ? 443 : 80;
    }
}

std::string build_url(const std::string& scheme,
                      const std::string& host,
                      int port,
                      const std::string& path) {
    std::ostringstream out;
    out << scheme << "://" << host;
    const bool default_port = ((scheme == "https" || scheme == "wss") && port == 443) ||
                              ((scheme == "http" || scheme == "ws") && port == 80);
    if (!default_port && port > 0) {
        out << ":" << port;
    }
    if (!path.empty() && path.front() != '/') {
        out << '/';
    }
    out << path;
    return out.str();
}

std::string join_path(const std::string& base_path, const std::string& path) {
    std::string base = base_path;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty()) {
        return base.empty() ? "/" : base;
    }
    if (path.front() == '/') {
        return base + path;
    }
    return base + "/" + path;
}

std::string url_encode(const std::string& value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;
    for (unsigned char ch : value) {
        if (std::isalnum(ch) || ch == '-' || ch == '_' || ch == '.' || ch == '~') {
            escaped << ch;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(ch);
        }
    }
    return escaped.str();
}

std::string build_query(const std::map<std::string, std::string>& params) {
    std::string query;
    for (const auto& item : params) {
        query += query.empty() ? "?" : "&";
        query += url_encode(item.first);
        query += '=';
        query += url_encode(item.second);
    }
    return query;
}

std::optional<std::string> find_header(const std::string& message, const std::string& name) {
    auto lower = [](std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value;
    };
    const auto wanted = lower(name);
    std::istringstream lines(message);
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            if (first) {
                continue;
            }
            break;
        }
        first = false;
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (lower(line.substr(0, colon)) != wanted) {
            continue;
        }
        auto value = line.substr(colon + 1);
        const auto begin = value.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            return std::string();
        }
        const auto end = value.find_last_not_of(" \t");
        return value.substr(begin, end - begin + 1);
    }
    return std::nullopt;
}

}
