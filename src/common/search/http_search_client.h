#ifndef RESEARCHFLOW_COMMON_SEARCH_HTTP_SEARCH_CLIENT_H
#define RESEARCHFLOW_COMMON_SEARCH_HTTP_SEARCH_CLIENT_H

#include "common/search/search_client.h"
#include <string>
#include <vector>

namespace researchflow {

// SearxNG 风格的 JSON 搜索接口：GET <path>?q=...&format=json
class HttpSearchClient : public SearchClient {
public:
    struct Config {
        std::string host = "localhost";
        int port = 8888;
        std::string path = "/search";
        int timeout_sec = 30;
        size_t max_snippet_length = 2000;
    };

    explicit HttpSearchClient(Config config);

    std::vector<SearchHit> search(const std::string& query, int max_results, std::stop_token stop) override;

    // 将响应体解析为结果列表（便于离线测试）
    static std::vector<SearchHit> parse_results(const std::string& body, int max_results, size_t max_snippet_length);

private:
    Config config_;
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_SEARCH_HTTP_SEARCH_CLIENT_H
