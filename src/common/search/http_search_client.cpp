// common/search/http_search_client.cpp
#include "common/search/http_search_client.h"
#include "core/types/error.h"
#include "common/utils/text_utils.h"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stop_token>

namespace researchflow {

HttpSearchClient::HttpSearchClient(Config config) : config_(std::move(config)) {}

std::vector<SearchHit> HttpSearchClient::search(const std::string& query, int max_results, std::stop_token stop) {
    httplib::Client cli(config_.host, config_.port);
    cli.set_connection_timeout(config_.timeout_sec, 0);
    cli.set_read_timeout(config_.timeout_sec, 0);
    std::stop_callback abort_request(stop, [&cli] { cli.stop(); });
    if (stop.stop_requested()) {
        throw ClassifiedError(ErrorKind::TIMEOUT, "Search request cancelled");
    }

    httplib::Params params{{"q", query}, {"format", "json"}};
    auto res = cli.Get(config_.path, params, httplib::Headers{});
    if (!res) {
        if (stop.stop_requested()) {
            throw ClassifiedError(ErrorKind::TIMEOUT, "Search request cancelled");
        }
        throw ClassifiedError(ErrorKind::UNAVAILABLE,
            "Search connection failed: " + httplib::to_string(res.error()));
    }
    if (res->status == 429) {
        throw ClassifiedError(ErrorKind::RATE_LIMITED, "Search rate limited");
    }
    if (res->status == 503) {
        throw ClassifiedError(ErrorKind::UNAVAILABLE, "Search service unavailable");
    }
    if (res->status >= 500) {
        throw ClassifiedError(ErrorKind::TRANSIENT, "Search HTTP error " + std::to_string(res->status));
    }
    if (res->status >= 400) {
        throw ClassifiedError(ErrorKind::INVALID_INPUT,
            "Search rejected query (HTTP " + std::to_string(res->status) + ")");
    }
    return parse_results(res->body, max_results, config_.max_snippet_length);
}

std::vector<SearchHit> HttpSearchClient::parse_results(const std::string& body, int max_results, size_t max_snippet_length) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw ClassifiedError(ErrorKind::TRANSIENT, std::string("Malformed search response: ") + e.what());
    }

    std::vector<SearchHit> hits;
    if (!doc.contains("results") || !doc["results"].is_array()) {
        return hits;
    }
    for (const auto& item : doc["results"]) {
        if (static_cast<int>(hits.size()) >= max_results) break;
        SearchHit hit;
        hit.title = item.value("title", std::string{});
        hit.url = item.value("url", std::string{});
        hit.snippet = utf8_truncate(item.value("content", std::string{}), max_snippet_length);
        hits.push_back(std::move(hit));
    }
    return hits;
}

} // namespace researchflow
