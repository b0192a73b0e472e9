// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>

namespace researchflow {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

bool matches_prefix(const std::string& trace_id, const std::string& prefix) {
    return trace_id == prefix || trace_id.starts_with(prefix + "#");
}

} // namespace

Value trace_to_json(const TraceRecord& record) {
    Value j;
    j["trace_id"] = record.trace_id;
    j["step_path"] = record.step_path;
    j["kind"] = record.kind;
    j["start_time_ms"] = to_epoch_ms(record.start_time);
    j["end_time_ms"] = to_epoch_ms(record.end_time);
    j["status"] = record.status;
    j["error_code"] = record.error_code ? Value(*record.error_code) : Value(nullptr);
    j["state_delta"] = record.state_delta;
    j["budget_snapshot"] = record.budget_snapshot;
    j["metadata"] = record.metadata;
    return j;
}

void TraceExporter::on_step_start(const std::string& trace_id, const Step& step, const Value& budget_snapshot) {
    TraceRecord record;
    record.trace_id = trace_id;
    record.step_path = step.path;
    record.kind = to_string(step.kind);
    record.start_time = std::chrono::system_clock::now();
    record.end_time = record.start_time;
    record.status = "running";
    record.state_delta = Value::object();
    record.budget_snapshot = budget_snapshot;
    record.metadata = step.metadata;

    std::lock_guard<std::mutex> lock(mutex_);
    traces_.push_back(std::move(record));
}

void TraceExporter::on_step_end(
    const std::string& trace_id,
    const StepPath& path,
    const std::string& status,
    const std::optional<std::string>& error_code,
    const Value& state_delta,
    const Value& budget_snapshot) {

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(traces_.rbegin(), traces_.rend(), [&](const TraceRecord& r) {
        return r.trace_id == trace_id && r.step_path == path && r.status == "running";
    });
    if (it == traces_.rend()) {
        return;
    }
    it->end_time = std::chrono::system_clock::now();
    it->status = status;
    it->error_code = error_code;
    it->state_delta = state_delta;
    it->budget_snapshot = budget_snapshot;
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return traces_;
}

std::vector<TraceRecord> TraceExporter::get_traces(const std::string& trace_prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TraceRecord> out;
    for (const auto& r : traces_) {
        if (matches_prefix(r.trace_id, trace_prefix)) out.push_back(r);
    }
    return out;
}

Value TraceExporter::export_json(const std::string& trace_prefix) const {
    Value arr = Value::array();
    for (const auto& r : get_traces(trace_prefix)) {
        arr.push_back(trace_to_json(r));
    }
    return arr;
}

void TraceExporter::clear_traces() {
    std::lock_guard<std::mutex> lock(mutex_);
    traces_.clear();
}

size_t TraceExporter::clear_traces(const std::string& trace_prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::erase_if(traces_, [&](const TraceRecord& r) { return matches_prefix(r.trace_id, trace_prefix); });
}

} // namespace researchflow
