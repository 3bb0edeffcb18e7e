/**
 * @file Paths.cpp
 * @brief Filesystem-checked path properties
 */

#include "flatcfg/Paths.hpp"
#include "flatcfg/Accessors.hpp"
#include "flatcfg/Coerce.hpp"
#include "flatcfg/Errors.hpp"

namespace fs = std::filesystem;

namespace flatcfg {

namespace {

const char* const DIRECTORY = "directory";
const char* const REGULAR_FILE = "regular file";

/**
 * @brief String form of the value, made absolute and normalized
 *
 * Non-string values are stringified first, unlike get_required_path().
 */
fs::path resolve_path(const Properties& props, const std::string& key) {
    Value text(std::in_place_type<std::string>, get_required_string(props, key));
    return *coerce_path(text, key);
}

} // anonymous namespace

fs::path get_required_dir_path(const Properties& props, const std::string& key) {
    fs::path path = resolve_path(props, key);

    std::error_code ec;
    if (fs::exists(path, ec) && !fs::is_directory(path, ec)) {
        throw PathKindError(key, path.string(), DIRECTORY);
    }
    return path;
}

fs::path get_required_file_path(const Properties& props, const std::string& key) {
    fs::path path = resolve_path(props, key);

    std::error_code ec;
    if (fs::exists(path, ec) && !fs::is_regular_file(path, ec)) {
        throw PathKindError(key, path.string(), REGULAR_FILE);
    }
    return path;
}

fs::path get_required_existing_dir_path(const Properties& props, const std::string& key) {
    fs::path path = resolve_path(props, key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw PathNotFoundError(key, path.string(), DIRECTORY);
    }
    if (!fs::is_directory(path, ec)) {
        throw PathKindError(key, path.string(), DIRECTORY);
    }
    return path;
}

fs::path get_required_existing_file_path(const Properties& props, const std::string& key) {
    fs::path path = resolve_path(props, key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw PathNotFoundError(key, path.string(), "file");
    }
    // Anything but a directory: sockets, devices and fifos are accepted
    if (fs::is_directory(path, ec)) {
        throw PathKindError(key, path.string(), REGULAR_FILE);
    }
    return path;
}

fs::path consume_required_dir_path(Properties& props, const std::string& key) {
    auto out = get_required_dir_path(props, key);
    props.erase(key);
    return out;
}

fs::path consume_required_file_path(Properties& props, const std::string& key) {
    auto out = get_required_file_path(props, key);
    props.erase(key);
    return out;
}

fs::path consume_required_existing_dir_path(Properties& props, const std::string& key) {
    auto out = get_required_existing_dir_path(props, key);
    props.erase(key);
    return out;
}

fs::path consume_required_existing_file_path(Properties& props, const std::string& key) {
    auto out = get_required_existing_file_path(props, key);
    props.erase(key);
    return out;
}

} // namespace flatcfg
