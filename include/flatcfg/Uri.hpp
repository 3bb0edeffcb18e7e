/**
 * @file Uri.hpp
 * @brief Parsed URI reference value
 *
 * Components follow RFC 3986: scheme ":" "//" authority path "?" query "#"
 * fragment. Both absolute URIs ("https://host:8443/x?y#z") and relative
 * references ("../a/b", "/path") are accepted; text with characters outside
 * the URI character set (spaces, quotes, braces, ...) or with a malformed
 * percent-escape, scheme or port is rejected.
 */

#ifndef FLATCFG_URI_HPP
#define FLATCFG_URI_HPP

#include <optional>
#include <ostream>
#include <string>

namespace flatcfg {

class Uri {
public:
    /**
     * @brief Parse URI text
     * @param text Non-empty URI text (not trimmed by this function)
     * @param key Property key used in error messages
     * @throws UriParseError if text is not a valid URI reference
     */
    static Uri parse(const std::string& text, const std::string& key = "");

    const std::string& str() const noexcept { return text_; }

    /// Empty for relative references
    const std::string& scheme() const noexcept { return scheme_; }

    /// Authority text without the leading "//"; empty when absent
    const std::string& authority() const noexcept { return authority_; }
    const std::string& user_info() const noexcept { return user_info_; }
    const std::string& host() const noexcept { return host_; }
    std::optional<int> port() const noexcept { return port_; }

    const std::string& path() const noexcept { return path_; }
    const std::optional<std::string>& query() const noexcept { return query_; }
    const std::optional<std::string>& fragment() const noexcept { return fragment_; }

    bool is_absolute() const noexcept { return !scheme_.empty(); }
    bool has_authority() const noexcept { return has_authority_; }

    bool operator==(const Uri& other) const noexcept { return text_ == other.text_; }
    bool operator!=(const Uri& other) const noexcept { return !(*this == other); }

private:
    Uri() = default;

    std::string text_;
    std::string scheme_;
    bool has_authority_ = false;
    std::string authority_;
    std::string user_info_;
    std::string host_;
    std::optional<int> port_;
    std::string path_;
    std::optional<std::string> query_;
    std::optional<std::string> fragment_;
};

inline std::ostream& operator<<(std::ostream& os, const Uri& uri) {
    return os << uri.str();
}

} // namespace flatcfg

#endif // FLATCFG_URI_HPP
