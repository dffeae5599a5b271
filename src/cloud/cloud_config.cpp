/**
 * @file cloud_config.cpp
 * @brief Azure connection string parsing
 */

#include "kcenon/blob_migration/cloud/cloud_config.h"

namespace kcenon::blob_migration {

auto parse_connection_string(
    const std::string& connection_string,
    azure_blob_config* config) -> std::optional<azure_credentials> {
    azure_credentials creds;
    std::string endpoint_suffix;
    std::string protocol;
    std::string blob_endpoint;

    std::size_t pos = 0;
    while (pos < connection_string.size()) {
        auto semi_pos = connection_string.find(';', pos);
        auto segment = connection_string.substr(
            pos, semi_pos == std::string::npos ? std::string::npos : semi_pos - pos);
        pos = (semi_pos == std::string::npos) ? connection_string.size() : semi_pos + 1;

        // Values (keys, SAS tokens) may themselves contain '='.
        auto eq_pos = segment.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        auto key = segment.substr(0, eq_pos);
        auto value = segment.substr(eq_pos + 1);

        if (key == "AccountName") {
            creds.account_name = value;
        } else if (key == "AccountKey") {
            creds.account_key = value;
        } else if (key == "SharedAccessSignature") {
            creds.sas_token = value;
        } else if (key == "EndpointSuffix") {
            endpoint_suffix = value;
        } else if (key == "DefaultEndpointsProtocol") {
            protocol = value;
        } else if (key == "BlobEndpoint") {
            blob_endpoint = value;
        }
    }

    if (!creds.is_valid()) {
        return std::nullopt;
    }

    if (config) {
        config->account_name = creds.account_name;
        if (!endpoint_suffix.empty()) {
            config->endpoint_suffix = endpoint_suffix;
        }
        if (!protocol.empty()) {
            config->use_ssl = (protocol != "http");
        }
        if (!blob_endpoint.empty()) {
            config->endpoint = blob_endpoint;
        }
    }

    return creds;
}

}  // namespace kcenon::blob_migration
