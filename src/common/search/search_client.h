#ifndef RESEARCHFLOW_COMMON_SEARCH_SEARCH_CLIENT_H
#define RESEARCHFLOW_COMMON_SEARCH_SEARCH_CLIENT_H

#include "core/types/context.h"
#include <stop_token>
#include <string>
#include <vector>

namespace researchflow {

struct SearchHit {
    std::string title;
    std::string url;
    std::string snippet;
};

inline void to_json(Value& j, const SearchHit& hit) {
    j = Value{{"title", hit.title}, {"url", hit.url}, {"snippet", hit.snippet}};
}

inline void from_json(const Value& j, SearchHit& hit) {
    hit.title = j.value("title", std::string{});
    hit.url = j.value("url", std::string{});
    hit.snippet = j.value("snippet", std::string{});
}

// 网页搜索协作者。失败时抛出 ClassifiedError；stop 语义同 TextGenerator。
class SearchClient {
public:
    virtual ~SearchClient() = default;
    virtual std::vector<SearchHit> search(const std::string& query, int max_results, std::stop_token stop) = 0;
};

} // namespace researchflow

#endif // RESEARCHFLOW_COMMON_SEARCH_SEARCH_CLIENT_H
