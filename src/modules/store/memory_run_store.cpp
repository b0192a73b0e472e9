// modules/store/memory_run_store.cpp
#include "modules/store/memory_run_store.h"

namespace researchflow {

void MemoryRunStore::save(const PipelineRun& run) {
    std::string document = serialize_run(run);
    std::lock_guard<std::mutex> lock(mutex_);
    documents_[run.run_id] = std::move(document);
    ++save_count_;
}

std::optional<PipelineRun> MemoryRunStore::load(const std::string& run_id) const {
    std::string text;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(run_id);
        if (it == documents_.end()) {
            return std::nullopt;
        }
        text = it->second;
    }
    return Value::parse(text).get<PipelineRun>();
}

std::vector<std::string> MemoryRunStore::list_runs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, _] : documents_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> MemoryRunStore::list_incomplete() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [id, text] : documents_) {
        auto state = Value::parse(text).at("state").get<std::string>();
        if (state != "completed" && state != "failed") {
            ids.push_back(id);
        }
    }
    return ids;
}

int MemoryRunStore::save_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_count_;
}

} // namespace researchflow
