/**
 * @file Accessors.cpp
 * @brief Typed getters: presence policy on top of Coerce.cpp
 */

#include "flatcfg/Accessors.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/Util.hpp"

#include <utility>

namespace flatcfg {

namespace {

/**
 * @brief Coerced value or nullopt when missing/absent
 */
template <typename Coerce>
auto lookup(const Properties& props, const std::string& key, Coerce coerce)
    -> decltype(coerce(std::declval<const Value&>(), key)) {
    require_key(key);
    const Value* value = find_value(props, key);
    if (value == nullptr) return std::nullopt;
    return coerce(*value, key);
}

template <typename T, typename Coerce>
std::optional<T> optional_of(const Properties& props, const std::string& key,
                             std::optional<T> default_value, Coerce coerce) {
    auto out = lookup(props, key, coerce);
    if (!out) return default_value;
    return out;
}

template <typename Coerce>
auto required_of(const Properties& props, const std::string& key, Coerce coerce) {
    auto out = lookup(props, key, coerce);
    if (!out) throw MissingRequiredError(key);
    return std::move(*out);
}

/**
 * @brief Run a getter, then erase key; nothing is erased if get throws
 */
template <typename Get>
auto consume(Properties& props, const std::string& key, Get get) {
    auto out = get();
    props.erase(key);
    return out;
}

} // anonymous namespace

const Value* find_value(const Properties& props, const std::string& key) {
    auto it = props.find(key);
    if (it == props.end()) return nullptr;
    return &it->second;
}

// ============================================================================
// Boolean
// ============================================================================

std::optional<bool> get_optional_bool(const Properties& props, const std::string& key,
                                      std::optional<bool> default_value) {
    return optional_of(props, key, default_value, coerce_bool);
}

bool get_required_bool(const Properties& props, const std::string& key) {
    return required_of(props, key, coerce_bool);
}

std::optional<bool> consume_optional_bool(Properties& props, const std::string& key,
                                          std::optional<bool> default_value) {
    return consume(props, key, [&] { return get_optional_bool(props, key, default_value); });
}

bool consume_required_bool(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_bool(props, key); });
}

// ============================================================================
// Int
// ============================================================================

std::optional<std::int32_t> get_optional_int(const Properties& props, const std::string& key,
                                             std::optional<std::int32_t> default_value) {
    return optional_of(props, key, default_value, coerce_int);
}

std::int32_t get_required_int(const Properties& props, const std::string& key) {
    return required_of(props, key, coerce_int);
}

std::optional<std::int32_t> consume_optional_int(Properties& props, const std::string& key,
                                                 std::optional<std::int32_t> default_value) {
    return consume(props, key, [&] { return get_optional_int(props, key, default_value); });
}

std::int32_t consume_required_int(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_int(props, key); });
}

// ============================================================================
// Long
// ============================================================================

std::optional<std::int64_t> get_optional_long(const Properties& props, const std::string& key,
                                              std::optional<std::int64_t> default_value) {
    return optional_of(props, key, default_value, coerce_long);
}

std::int64_t get_required_long(const Properties& props, const std::string& key) {
    return required_of(props, key, coerce_long);
}

std::optional<std::int64_t> consume_optional_long(Properties& props, const std::string& key,
                                                  std::optional<std::int64_t> default_value) {
    return consume(props, key, [&] { return get_optional_long(props, key, default_value); });
}

std::int64_t consume_required_long(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_long(props, key); });
}

// ============================================================================
// String
// ============================================================================

std::optional<std::string> get_optional_string(const Properties& props, const std::string& key,
                                               std::optional<std::string> default_value) {
    return optional_of(props, key, std::move(default_value), coerce_string);
}

std::string get_required_string(const Properties& props, const std::string& key) {
    return required_of(props, key, coerce_string);
}

std::optional<std::string> consume_optional_string(Properties& props, const std::string& key,
                                                   std::optional<std::string> default_value) {
    return consume(props, key, [&] {
        return get_optional_string(props, key, std::move(default_value));
    });
}

std::string consume_required_string(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_string(props, key); });
}

// ============================================================================
// Port
// ============================================================================

int get_optional_port(const Properties& props, const std::string& key, int default_value) {
    auto value = get_optional_int(props, key, default_value);
    return static_cast<int>(check_port(key, *value));
}

int get_required_port(const Properties& props, const std::string& key) {
    return static_cast<int>(check_port(key, get_required_int(props, key)));
}

int consume_optional_port(Properties& props, const std::string& key, int default_value) {
    return consume(props, key, [&] { return get_optional_port(props, key, default_value); });
}

int consume_required_port(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_port(props, key); });
}

// ============================================================================
// URI
// ============================================================================

std::optional<Uri> get_optional_uri(const Properties& props, const std::string& key,
                                    const std::optional<std::string>& default_value) {
    auto out = lookup(props, key, coerce_uri);
    if (out) return out;

    if (!default_value || is_blank(*default_value)) return std::nullopt;
    return Uri::parse(trim(*default_value), key);
}

Uri get_optional_uri(const Properties& props, const std::string& key,
                     const Uri& default_value) {
    auto out = lookup(props, key, coerce_uri);
    if (!out) return default_value;
    return *out;
}

Uri get_required_uri(const Properties& props, const std::string& key) {
    return required_of(props, key, coerce_uri);
}

std::optional<Uri> consume_optional_uri(Properties& props, const std::string& key,
                                        const std::optional<std::string>& default_value) {
    return consume(props, key, [&] { return get_optional_uri(props, key, default_value); });
}

Uri consume_optional_uri(Properties& props, const std::string& key,
                         const Uri& default_value) {
    return consume(props, key, [&] { return get_optional_uri(props, key, default_value); });
}

Uri consume_required_uri(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_uri(props, key); });
}

// ============================================================================
// Path
// ============================================================================

std::filesystem::path get_required_path(const Properties& props, const std::string& key) {
    return required_of(props, key, coerce_path);
}

std::optional<std::filesystem::path> get_optional_path(
    const Properties& props, const std::string& key,
    std::optional<std::filesystem::path> default_value) {
    return optional_of(props, key, std::move(default_value), coerce_path);
}

std::filesystem::path consume_required_path(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_path(props, key); });
}

// ============================================================================
// Regex
// ============================================================================

std::optional<std::regex> get_optional_regex(const Properties& props, const std::string& key,
                                             std::optional<std::regex> default_value) {
    return optional_of(props, key, std::move(default_value), coerce_regex);
}

std::regex get_required_regex(const Properties& props, const std::string& key) {
    return required_of(props, key, coerce_regex);
}

std::optional<std::regex> consume_optional_regex(Properties& props, const std::string& key,
                                                 std::optional<std::regex> default_value) {
    return consume(props, key, [&] {
        return get_optional_regex(props, key, std::move(default_value));
    });
}

std::regex consume_required_regex(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_regex(props, key); });
}

// ============================================================================
// UUID
// ============================================================================

std::optional<boost::uuids::uuid> get_optional_uuid(
    const Properties& props, const std::string& key,
    std::optional<boost::uuids::uuid> default_value) {
    return optional_of(props, key, default_value, coerce_uuid);
}

boost::uuids::uuid get_required_uuid(const Properties& props, const std::string& key) {
    return required_of(props, key, coerce_uuid);
}

std::optional<boost::uuids::uuid> consume_optional_uuid(
    Properties& props, const std::string& key,
    std::optional<boost::uuids::uuid> default_value) {
    return consume(props, key, [&] { return get_optional_uuid(props, key, default_value); });
}

boost::uuids::uuid consume_required_uuid(Properties& props, const std::string& key) {
    return consume(props, key, [&] { return get_required_uuid(props, key); });
}

} // namespace flatcfg
