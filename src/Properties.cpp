#include "flatcfg/Properties.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/Util.hpp"

#include <vector>

namespace flatcfg {

Properties filter_by_prefix(const Properties& props, const std::string& prefix) {
    require_trimmed_prefix(prefix);

    Properties out;
    for (auto it = props.lower_bound(prefix); it != props.end(); ++it) {
        if (!starts_with(it->first, prefix)) break;
        out.emplace(it->first, it->second);
    }
    return out;
}

std::map<std::string, ConfigEntry> build_entries_for_prefix(const Properties& props,
                                                            const std::string& prefix) {
    require_trimmed_prefix(prefix);

    std::map<std::string, ConfigEntry> out;
    for (auto it = props.lower_bound(prefix); it != props.end(); ++it) {
        if (!starts_with(it->first, prefix)) break;

        ConfigEntry entry(it->first, it->first.substr(prefix.size()), it->second);
        std::string short_key = entry.short_key();
        out.insert_or_assign(std::move(short_key), std::move(entry));
    }
    return out;
}

void require_fully_consumed(const Properties& props, const std::string& type_name) {
    if (is_blank(type_name)) {
        throw InvalidArgumentError("targetTypeName is required");
    }
    if (props.empty()) return;

    // std::map iterates in sorted key order
    std::vector<std::string> keys;
    keys.reserve(props.size());
    for (const auto& kv : props) {
        keys.push_back(kv.first);
    }
    throw UnconsumedKeysError(type_name, std::move(keys));
}

} // namespace flatcfg
