/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * Properties files use a hand-written parser; JSON and TOML go through
 * nlohmann::json and toml++ and are flattened into dotted keys.
 */

#include "flatcfg/Loader.hpp"
#include "flatcfg/Env.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/Log.hpp"
#include "flatcfg/Util.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace flatcfg {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

bool file_exists(const fs::path& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief 1-based line of a byte offset
 */
int line_of(const std::string& text, std::size_t offset) {
    offset = std::min(offset, text.size());
    return 1 + static_cast<int>(std::count(text.begin(), text.begin() + offset, '\n'));
}

// ============================================================================
// Properties syntax
// ============================================================================

bool is_prop_space(char c) {
    return c == ' ' || c == '\t' || c == '\f';
}

std::string strip_leading_space(const std::string& s) {
    std::size_t i = 0;
    while (i < s.size() && is_prop_space(s[i])) ++i;
    return s.substr(i);
}

/**
 * @brief Physical lines; \n, \r and \r\n all terminate a line
 */
std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(std::move(current));
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            current += c;
        }
    }
    if (!current.empty()) lines.push_back(std::move(current));
    return lines;
}

bool ends_with_continuation(const std::string& line) {
    std::size_t backslashes = 0;
    for (auto it = line.rbegin(); it != line.rend() && *it == '\\'; ++it) {
        ++backslashes;
    }
    return backslashes % 2 == 1;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/**
 * @brief Read the 4 hex digits of a \\u escape starting at pos
 */
std::optional<std::uint32_t> read_hex4(const std::string& s, std::size_t pos) {
    if (pos + 4 > s.size()) return std::nullopt;
    std::uint32_t value = 0;
    for (std::size_t i = pos; i < pos + 4; ++i) {
        char c = s[i];
        value <<= 4;
        if (c >= '0' && c <= '9') value |= static_cast<std::uint32_t>(c - '0');
        else if (c >= 'a' && c <= 'f') value |= static_cast<std::uint32_t>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') value |= static_cast<std::uint32_t>(c - 'A' + 10);
        else return std::nullopt;
    }
    return value;
}

std::string unescape(const std::string& s, const std::string& source, int line) {
    std::string out;
    out.reserve(s.size());

    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            out += s[i];
            continue;
        }

        char next = s[++i];
        switch (next) {
            case 't': out += '\t'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 'f': out += '\f'; break;
            case 'u': {
                auto cp = read_hex4(s, i + 1);
                if (!cp) {
                    throw ConfigParseError(source, line, "Malformed \\uxxxx encoding");
                }
                i += 4;

                // Surrogate pair written as two escapes
                if (*cp >= 0xD800 && *cp <= 0xDBFF && i + 2 < s.size() &&
                    s[i + 1] == '\\' && s[i + 2] == 'u') {
                    auto low = read_hex4(s, i + 3);
                    if (low && *low >= 0xDC00 && *low <= 0xDFFF) {
                        *cp = 0x10000 + ((*cp - 0xD800) << 10) + (*low - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, *cp);
                break;
            }
            default: out += next; break;
        }
    }
    return out;
}

/**
 * @brief Split one logical line into its raw key and raw value
 */
std::pair<std::string, std::string> split_key_value(const std::string& line) {
    std::size_t pos = 0;
    bool escaped = false;
    while (pos < line.size()) {
        char c = line[pos];
        if (escaped) {
            escaped = false;
        } else if (c == '\\') {
            escaped = true;
        } else if (c == '=' || c == ':' || is_prop_space(c)) {
            break;
        }
        ++pos;
    }
    std::string key = line.substr(0, pos);

    bool has_separator = false;
    while (pos < line.size()) {
        char c = line[pos];
        if (!is_prop_space(c)) {
            if (!has_separator && (c == '=' || c == ':')) {
                has_separator = true;
            } else {
                break;
            }
        }
        ++pos;
    }
    return {key, line.substr(pos)};
}

// ============================================================================
// Structured documents
// ============================================================================

Value leaf_value(const nlohmann::json& node) {
    switch (node.type()) {
        case nlohmann::json::value_t::null:
            return std::monostate{};
        case nlohmann::json::value_t::boolean:
            return node.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return node.get<std::int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            auto u = node.get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::int64_t>(u);
            }
            // Too large for long: keep the literal so coercion reports it
            return node.dump();
        }
        case nlohmann::json::value_t::number_float:
            return node.get<double>();
        case nlohmann::json::value_t::string:
            return node.get<std::string>();
        default:
            return Value(std::in_place_type<nlohmann::json>, node);
    }
}

void flatten_into(const nlohmann::json& node, const std::string& key, Properties& out) {
    if (node.is_object() && !node.empty()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string child = key.empty() ? it.key() : key + "." + it.key();
            flatten_into(it.value(), child, out);
        }
        return;
    }
    if (node.is_array() && !node.empty()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            flatten_into(node[i], key + "[" + std::to_string(i) + "]", out);
        }
        return;
    }
    out[key] = leaf_value(node);
}

template <typename T>
std::string toml_text(const T& value) {
    std::ostringstream ss;
    ss << value;
    return ss.str();
}

nlohmann::json toml_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return node.as_string()->get();

        case toml::node_type::integer:
            return node.as_integer()->get();

        case toml::node_type::floating_point:
            return node.as_floating_point()->get();

        case toml::node_type::boolean:
            return node.as_boolean()->get();

        case toml::node_type::date:
            return toml_text(node.as_date()->get());

        case toml::node_type::time:
            return toml_text(node.as_time()->get());

        case toml::node_type::date_time:
            return toml_text(node.as_date_time()->get());

        case toml::node_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_to_json(val);
            }
            return obj;
        }

        default:
            return nullptr;
    }
}

void overlay(Properties& target, const Properties& layer) {
    for (const auto& [key, value] : layer) {
        target.insert_or_assign(key, value);
    }
}

} // anonymous namespace

// ============================================================================
// Properties files
// ============================================================================

Properties parse_properties_text(const std::string& text, const std::string& source) {
    Properties out;
    auto lines = split_lines(text);

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::string logical = strip_leading_space(lines[i]);
        if (logical.empty() || logical[0] == '#' || logical[0] == '!') continue;

        int first_line = static_cast<int>(i) + 1;
        while (ends_with_continuation(logical)) {
            logical.pop_back();
            if (i + 1 >= lines.size()) break;
            logical += strip_leading_space(lines[++i]);
        }

        auto [raw_key, raw_value] = split_key_value(logical);
        out.insert_or_assign(unescape(raw_key, source, first_line),
                             unescape(raw_value, source, first_line));
    }
    return out;
}

Properties load_properties_file(const fs::path& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path.string());
    }
    auto props = parse_properties_text(read_file(path), path.string());
    logger()->debug("loaded {} properties from {}", props.size(), path.string());
    return props;
}

// ============================================================================
// JSON File Loading
// ============================================================================

Properties flatten_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw InvalidArgumentError("top-level document must be an object");
    }
    Properties out;
    flatten_into(doc, "", out);
    // An empty document has no leaves, not one empty key
    out.erase("");
    return out;
}

Properties load_json_file(const fs::path& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path.string());
    }

    std::string content = read_file(path);

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path.string(), line_of(content, e.byte), e.what());
    }

    if (!doc.is_object()) {
        throw ConfigParseError(path.string(), 0, "top-level document must be an object");
    }

    auto props = flatten_json(doc);
    logger()->debug("loaded {} properties from {}", props.size(), path.string());
    return props;
}

// ============================================================================
// TOML File Loading
// ============================================================================

Properties load_toml_file(const fs::path& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path.string());
    }

    toml::table table;
    try {
        table = toml::parse_file(path.string());
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path.string(),
            static_cast<int>(e.source().begin.line),
            std::string(e.description())
        );
    }

    auto props = flatten_json(toml_to_json(table));
    logger()->debug("loaded {} properties from {}", props.size(), path.string());
    return props;
}

// ============================================================================
// Auto-detect File Loading
// ============================================================================

std::string get_file_extension(const fs::path& path) {
    return to_lower(path.extension().string());
}

Properties load_config_file(const fs::path& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path.string());
    }

    std::string ext = get_file_extension(path);
    if (ext == ".properties") {
        return load_properties_file(path);
    } else if (ext == ".json") {
        return load_json_file(path);
    } else if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw ConfigError(
        "Unsupported config file type: " + ext + " (expected .properties, .json or .toml)"
    );
}

// ============================================================================
// Candidate files
// ============================================================================

std::vector<fs::path> candidate_config_files() {
    std::vector<fs::path> out;
    const fs::path relative[] = {
        "application.properties",
        "src/main/resources/application.properties",
    };

    for (const auto& candidate : relative) {
        fs::path resolved = fs::absolute(candidate).lexically_normal();
        if (std::find(out.begin(), out.end(), resolved) == out.end()) {
            out.push_back(std::move(resolved));
        }
    }
    return out;
}

std::optional<fs::path> first_existing_file(const std::vector<fs::path>& candidates) {
    if (candidates.empty()) {
        throw InvalidArgumentError("at least one candidate path is required");
    }

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (!fs::exists(candidate, ec)) continue;
        return fs::absolute(candidate).lexically_normal();
    }
    return std::nullopt;
}

// ============================================================================
// Layered loading
// ============================================================================

Properties load(const LoadOptions& options) {
    Properties out = options.defaults;

    std::optional<fs::path> file = options.file_path;
    if (!file && !options.candidates.empty()) {
        file = first_existing_file(options.candidates);
        if (!file) {
            logger()->debug("no config file found among {} candidates",
                            options.candidates.size());
        }
    }
    if (file) {
        overlay(out, load_config_file(*file));
    }

    if (options.env_prefix) {
        overlay(out, env_overlay(*options.env_prefix));
    }

    overlay(out, options.overrides);
    return out;
}

} // namespace flatcfg
