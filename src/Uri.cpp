/**
 * @file Uri.cpp
 * @brief URI reference parsing
 */

#include "flatcfg/Uri.hpp"
#include "flatcfg/Errors.hpp"

#include <cctype>
#include <regex>

namespace flatcfg {

namespace {

/**
 * @brief RFC 3986 Appendix B component split
 *
 * Groups: 2 scheme, 4 authority, 5 path, 7 query, 9 fragment.
 */
const std::regex& component_pattern() {
    static const std::regex re("^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\\?([^#]*))?(#(.*))?$");
    return re;
}

const std::regex& scheme_pattern() {
    static const std::regex re("^[A-Za-z][A-Za-z0-9+.\\-]*$");
    return re;
}

/**
 * @brief Characters allowed anywhere in a URI (unreserved + reserved + '%')
 *
 * Bytes >= 0x80 are let through so UTF-8 text survives, as "other"
 * characters are in java.net.URI.
 */
bool is_uri_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (u >= 0x80) return true;
    if (std::isalnum(u)) return true;
    switch (c) {
        case '-': case '.': case '_': case '~':
        case ':': case '/': case '?': case '#': case '[': case ']': case '@':
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=': case '%':
            return true;
        default:
            return false;
    }
}

/**
 * @brief Position of the first invalid character or bad escape, or npos
 */
std::string::size_type find_invalid(const std::string& s) {
    for (std::string::size_type i = 0; i < s.size(); ++i) {
        if (!is_uri_char(s[i])) return i;
        if (s[i] == '%') {
            if (i + 2 >= s.size() ||
                !std::isxdigit(static_cast<unsigned char>(s[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(s[i + 2]))) {
                return i;
            }
        }
    }
    return std::string::npos;
}

} // anonymous namespace

Uri Uri::parse(const std::string& text, const std::string& key) {
    if (text.empty()) throw UriParseError(key, text, "empty URI");

    auto bad = find_invalid(text);
    if (bad != std::string::npos) {
        throw UriParseError(key, text, "illegal character at index " + std::to_string(bad));
    }

    std::smatch m;
    if (!std::regex_match(text, m, component_pattern())) {
        throw UriParseError(key, text, "unparseable");
    }

    Uri uri;
    uri.text_ = text;

    if (m[1].matched) {
        uri.scheme_ = m[2].str();
        if (!std::regex_match(uri.scheme_, scheme_pattern())) {
            throw UriParseError(key, text, "illegal scheme name");
        }
        if (text.size() == uri.scheme_.size() + 1) {
            throw UriParseError(key, text, "expected scheme-specific part");
        }
    }

    if (m[3].matched) {
        uri.has_authority_ = true;
        uri.authority_ = m[4].str();

        std::string host_port = uri.authority_;
        auto at = host_port.rfind('@');
        if (at != std::string::npos) {
            uri.user_info_ = host_port.substr(0, at);
            host_port = host_port.substr(at + 1);
        }

        std::string port_text;
        if (!host_port.empty() && host_port[0] == '[') {
            auto close = host_port.find(']');
            if (close == std::string::npos) {
                throw UriParseError(key, text, "unterminated IPv6 address");
            }
            uri.host_ = host_port.substr(0, close + 1);
            std::string rest = host_port.substr(close + 1);
            if (!rest.empty()) {
                if (rest[0] != ':') throw UriParseError(key, text, "illegal character after host");
                port_text = rest.substr(1);
            }
        } else {
            auto colon = host_port.rfind(':');
            if (colon != std::string::npos) {
                uri.host_ = host_port.substr(0, colon);
                port_text = host_port.substr(colon + 1);
            } else {
                uri.host_ = host_port;
            }
        }

        if (uri.host_.find_first_of("[]") != std::string::npos && uri.host_.front() != '[') {
            throw UriParseError(key, text, "brackets are only allowed around an IPv6 host");
        }

        if (!port_text.empty()) {
            if (port_text.size() > 5) throw UriParseError(key, text, "port out of range");
            for (char c : port_text) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    throw UriParseError(key, text, "illegal character in port");
                }
            }
            int port = std::stoi(port_text);
            if (port > 65535) throw UriParseError(key, text, "port out of range");
            uri.port_ = port;
        }
    }

    uri.path_ = m[5].str();
    if (m[6].matched) uri.query_ = m[7].str();
    if (m[8].matched) uri.fragment_ = m[9].str();

    if (uri.path_.find_first_of("[]") != std::string::npos ||
        (uri.query_ && uri.query_->find_first_of("[]") != std::string::npos)) {
        throw UriParseError(key, text, "brackets are only allowed around an IPv6 host");
    }
    if (uri.fragment_ && uri.fragment_->find('#') != std::string::npos) {
        throw UriParseError(key, text, "illegal character in fragment");
    }

    return uri;
}

} // namespace flatcfg
