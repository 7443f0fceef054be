#include <socialgraph/graph/data/http_relationship_source.h>
#include <socialgraph/config.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <memory>
#include <mutex>
#include <string>

namespace socialgraph {
namespace graph {

namespace {

// Standard CURL write callback appending the received body to a std::string.
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// curl_global_init is not thread-safe; run it once before the first request.
void EnsureCurlInitialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string EscapePathSegment(CURL* curl, const std::string& segment) {
    char* escaped = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.size()));
    if (!escaped) {
        throw DataFetchError("Failed to escape URL segment: " + segment);
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

int ReadCount(const nlohmann::json& object, const char* key) {
    if (!object.contains(key) || object[key].is_null()) return 0;
    const auto& value = object[key];
    if (!value.is_number()) {
        throw DataFetchError(std::string("Field '") + key + "' is not a number");
    }
    // Counts beyond int saturate; the readout shows a lower bound rather than garbage.
    constexpr int kMaxCount = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        return static_cast<int>(std::min<std::uint64_t>(value.get<std::uint64_t>(), kMaxCount));
    }
    if (value.is_number_integer()) {
        const std::int64_t count = value.get<std::int64_t>();
        if (count < 0) {
            throw DataFetchError(std::string("Field '") + key + "' is negative: " + std::to_string(count));
        }
        return static_cast<int>(std::min<std::int64_t>(count, kMaxCount));
    }
    const double count = value.get<double>();
    if (!std::isfinite(count) || count < 0.0 || std::floor(count) != count) {
        throw DataFetchError(std::string("Field '") + key + "' is not a whole non-negative count: " + value.dump());
    }
    return count >= static_cast<double>(kMaxCount) ? kMaxCount : static_cast<int>(count);
}

std::string ReadString(const nlohmann::json& object, const char* key) {
    if (!object.contains(key) || object[key].is_null()) return "";
    const auto& value = object[key];
    if (value.is_string()) return value.get<std::string>();
    if (value.is_number_integer()) return std::to_string(value.get<long long>());
    throw DataFetchError(std::string("Field '") + key + "' is not a string");
}

} // namespace

HttpRelationshipSource::HttpRelationshipSource(std::string base_url, std::string bearer_token)
    : base_url_(std::move(base_url)), bearer_token_(std::move(bearer_token)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

std::string HttpRelationshipSource::ResolveBaseUrl() {
    const char* env_url = std::getenv("SOCIALGRAPH_API_BASE_URL");
    if (env_url && env_url[0] != '\0') {
        return std::string(env_url);
    }
    return SOCIALGRAPH_API_BASE_URL;
}

std::string HttpRelationshipSource::ResolveToken() {
    const char* env_token = std::getenv("SOCIALGRAPH_API_TOKEN");
    return env_token ? std::string(env_token) : std::string();
}

NetworkStats HttpRelationshipSource::GetNetworkStats(const std::string& subject_id) {
    EnsureCurlInitialized();
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl{curl_easy_init(), curl_easy_cleanup};
    if (!curl) {
        throw DataFetchError("Failed to initialize CURL");
    }
    std::string url = base_url_ + "/social/" + EscapePathSegment(curl.get(), subject_id) + "/network-stats";
    return ParseNetworkStats(Get(url));
}

std::vector<MutualConnection> HttpRelationshipSource::GetMutualConnections(const std::string& subject_id, int max_count) {
    EnsureCurlInitialized();
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl{curl_easy_init(), curl_easy_cleanup};
    if (!curl) {
        throw DataFetchError("Failed to initialize CURL");
    }
    std::string url = base_url_ + "/social/" + EscapePathSegment(curl.get(), subject_id) +
                      "/mutual-connections?limit=" + std::to_string(max_count);
    auto connections = ParseMutualConnections(Get(url));
    if (max_count >= 0 && connections.size() > static_cast<size_t>(max_count)) {
        connections.resize(static_cast<size_t>(max_count));
    }
    return connections;
}

std::string HttpRelationshipSource::Get(const std::string& url) const {
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw DataFetchError("Failed to initialize CURL");
    }
    auto curl_guard = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>{curl, curl_easy_cleanup};

    struct curl_slist* headers = nullptr;
    auto headers_guard = std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>{nullptr, curl_slist_free_all};
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!bearer_token_.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + bearer_token_).c_str());
    }
    headers_guard.reset(headers);

    std::string response_buffer;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw DataFetchError("Request to " + url + " failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        throw DataFetchError("Request to " + url + " returned HTTP status " + std::to_string(http_code));
    }
    return response_buffer;
}

NetworkStats ParseNetworkStats(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw DataFetchError("Malformed network stats payload: " + std::string(e.what()));
    }
    // Some deployments wrap the payload as {"data": {...}}.
    if (j.is_object() && j.contains("data") && j["data"].is_object()) {
        j = j["data"];
    }
    if (!j.is_object()) {
        throw DataFetchError("Network stats payload is not an object");
    }

    NetworkStats stats;
    stats.total_connections = ReadCount(j, "totalConnections");
    stats.followers = ReadCount(j, "followers");
    stats.following = ReadCount(j, "following");
    stats.mutual_connections = ReadCount(j, "mutualConnections");
    return stats;
}

std::vector<MutualConnection> ParseMutualConnections(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw DataFetchError("Malformed mutual connections payload: " + std::string(e.what()));
    }
    if (j.is_object()) {
        if (j.contains("connections") && j["connections"].is_array()) {
            j = j["connections"];
        } else if (j.contains("data") && j["data"].is_array()) {
            j = j["data"];
        }
    }
    if (!j.is_array()) {
        throw DataFetchError("Mutual connections payload is not an array");
    }

    std::vector<MutualConnection> connections;
    connections.reserve(j.size());
    for (const auto& item : j) {
        if (!item.is_object()) {
            throw DataFetchError("Mutual connection entry is not an object");
        }
        MutualConnection connection;
        connection.id = ReadString(item, "id");
        connection.username = ReadString(item, "username");
        connection.display_name = ReadString(item, "displayName");
        if (connection.id.empty()) continue; // unusable without an identity
        connections.push_back(std::move(connection));
    }
    return connections;
}

} // namespace graph
} // namespace socialgraph
