#include "utils/url.h"
#include "utils/text_utils.h"

#include <cctype>
#include <stdexcept>

namespace shroud {
namespace utils {

namespace {

std::string defaultPort(const std::string& scheme) {
    if (scheme == "http") return "80";
    if (scheme == "https") return "443";
    if (scheme == "redis" || scheme == "rediss") return "6379";
    return "";
}

bool isNumeric(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

} // namespace

std::string Url::target() const {
    std::string t = path.empty() ? "/" : path;
    if (!query.empty()) t += "?" + query;
    return t;
}

Url Url::withPath(const std::string& suffix) const {
    Url out = *this;
    std::string base = path;
    while (!base.empty() && base.back() == '/') base.pop_back();
    out.path = base + (startsWith(suffix, "/") ? suffix : "/" + suffix);
    return out;
}

Url Url::parse(const std::string& text) {
    Url url;
    
    size_t scheme_end = text.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw std::invalid_argument("URL has no scheme: " + text);
    }
    url.scheme = asciiLower(text.substr(0, scheme_end));
    
    std::string rest = text.substr(scheme_end + 3);
    size_t path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    std::string path_query = path_start == std::string::npos ? "" : rest.substr(path_start);
    
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        size_t colon = userinfo.find(':');
        if (colon == std::string::npos) {
            url.user = userinfo;
        } else {
            url.user = userinfo.substr(0, colon);
            url.password = userinfo.substr(colon + 1);
        }
    }
    
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated IPv6 host in URL: " + text);
        }
        url.host = authority.substr(1, close - 1);
        std::string after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') throw std::invalid_argument("Bad port in URL: " + text);
            url.port = after.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            url.host = authority.substr(0, colon);
            url.port = authority.substr(colon + 1);
        } else {
            url.host = authority;
        }
    }
    
    if (url.host.empty()) {
        throw std::invalid_argument("URL has no host: " + text);
    }
    if (url.port.empty()) {
        url.port = defaultPort(url.scheme);
    }
    if (!isNumeric(url.port)) {
        throw std::invalid_argument("Bad port in URL: " + text);
    }
    
    size_t q = path_query.find('?');
    if (q != std::string::npos) {
        url.path = path_query.substr(0, q);
        url.query = path_query.substr(q + 1);
    } else {
        url.path = path_query;
    }
    return url;
}

} // namespace utils
} // namespace shroud
