/**
 * @file site_grouper.cpp
 * @brief Endpoint grouping
 */

#include "kcenon/blob_migration/inventory/site_grouper.h"
#include "kcenon/blob_migration/core/logging.h"

#include <algorithm>
#include <cctype>

namespace kcenon::blob_migration {

namespace {

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

auto contains_ci(const std::string& haystack, const std::string& needle) -> bool {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

}  // namespace

auto normalize_endpoint_address(const std::string& address) -> std::string {
    auto begin = address.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = address.find_last_not_of(" \t\r\n");
    std::string result = address.substr(begin, end - begin + 1);

    auto lowered = to_lower(result);
    for (const char* marker : {"/sites/", "/teams/"}) {
        auto pos = lowered.find(marker);
        if (pos == std::string::npos) {
            continue;
        }
        auto name_start = pos + std::char_traits<char>::length(marker);
        auto name_end = lowered.find('/', name_start);
        if (name_end != std::string::npos && name_end > name_start) {
            result.resize(name_end);
        }
        break;
    }

    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

auto endpoint_addresses(const std::vector<file_record>& records)
    -> std::vector<std::string> {
    std::vector<std::string> addresses;
    addresses.reserve(records.size());
    for (const auto& record : records) {
        addresses.push_back(normalize_endpoint_address(record.site_address));
    }

    std::stable_sort(addresses.begin(), addresses.end(),
                     [](const std::string& a, const std::string& b) {
                         return to_lower(a) < to_lower(b);
                     });
    addresses.erase(std::unique(addresses.begin(), addresses.end(),
                                [](const std::string& a, const std::string& b) {
                                    return to_lower(a) == to_lower(b);
                                }),
                    addresses.end());
    return addresses;
}

auto records_for(const std::vector<file_record>& records, const std::string& address)
    -> std::vector<file_record> {
    std::vector<file_record> matched;
    for (const auto& record : records) {
        if (contains_ci(record.site_address, address)) {
            matched.push_back(record);
        }
    }
    return matched;
}

auto group_by_endpoint(const std::vector<file_record>& records)
    -> std::vector<endpoint_group> {
    auto addresses = endpoint_addresses(records);

    std::vector<endpoint_group> groups;
    groups.reserve(addresses.size());
    for (const auto& address : addresses) {
        groups.push_back(endpoint_group{address, {}});
    }

    for (const auto& record : records) {
        std::size_t best = groups.size();
        for (std::size_t i = 0; i < groups.size(); ++i) {
            if (!contains_ci(record.site_address, groups[i].address)) {
                continue;
            }
            if (best == groups.size() ||
                groups[i].address.size() > groups[best].address.size()) {
                best = i;
            }
        }
        // A record always contains its own normalized address.
        if (best < groups.size()) {
            groups[best].records.push_back(record);
        }
    }

    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const endpoint_group& g) { return g.records.empty(); }),
                 groups.end());

    BM_LOG_DEBUG(log_category::grouping,
        std::to_string(records.size()) + " record(s) in " +
        std::to_string(groups.size()) + " endpoint group(s)");
    return groups;
}

}  // namespace kcenon::blob_migration
