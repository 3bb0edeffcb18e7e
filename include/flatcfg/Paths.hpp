/**
 * @file Paths.hpp
 * @brief Path properties checked against the filesystem
 *
 * All functions read the property with get_required_string(), so non-string
 * values are stringified, then make it absolute and normalized
 * (MissingRequiredError when absent) and apply one rule:
 *
 * | function                         | must exist | kind when it exists     |
 * |----------------------------------|------------|-------------------------|
 * | get_required_dir_path            | no         | directory               |
 * | get_required_file_path           | no         | regular file            |
 * | get_required_existing_dir_path   | yes        | directory               |
 * | get_required_existing_file_path  | yes        | anything but a directory|
 *
 * Violations throw PathNotFoundError or PathKindError naming the key.
 */

#ifndef FLATCFG_PATHS_HPP
#define FLATCFG_PATHS_HPP

#include "flatcfg/Value.hpp"

#include <filesystem>
#include <string>

namespace flatcfg {

std::filesystem::path get_required_dir_path(const Properties& props, const std::string& key);
std::filesystem::path get_required_file_path(const Properties& props, const std::string& key);
std::filesystem::path get_required_existing_dir_path(const Properties& props,
                                                     const std::string& key);
std::filesystem::path get_required_existing_file_path(const Properties& props,
                                                      const std::string& key);

std::filesystem::path consume_required_dir_path(Properties& props, const std::string& key);
std::filesystem::path consume_required_file_path(Properties& props, const std::string& key);
std::filesystem::path consume_required_existing_dir_path(Properties& props,
                                                         const std::string& key);
std::filesystem::path consume_required_existing_file_path(Properties& props,
                                                          const std::string& key);

} // namespace flatcfg

#endif // FLATCFG_PATHS_HPP
