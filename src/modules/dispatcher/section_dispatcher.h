// modules/dispatcher/section_dispatcher.h
#ifndef RESEARCHFLOW_MODULES_DISPATCHER_SECTION_DISPATCHER_H
#define RESEARCHFLOW_MODULES_DISPATCHER_SECTION_DISPATCHER_H

#include "core/types/research.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <stop_token>
#include <vector>

namespace researchflow {

// 执行一个章节的 Research 子流水线
using SectionRunner = std::function<SectionOutcome(const SectionSpec&, std::stop_token)>;
// 每个章节出结果时调用（可能来自工作线程，需自行保证线程安全）
using SectionCallback = std::function<void(const SectionOutcome&)>;

struct DispatchOptions {
    int concurrency_limit = 4;
    std::chrono::milliseconds stage_timeout{0}; // 0 表示不限
};

// 有界并发地运行各章节子流水线，结果按章节 id 返回。
// 单个章节失败不影响其他章节；阶段超时后未完成的章节被取消并记为 TIMEOUT。
class SectionDispatcher {
public:
    SectionDispatcher(SectionRunner runner, DispatchOptions options);

    std::map<int, SectionOutcome> dispatch(const std::vector<SectionSpec>& sections,
                                           const SectionCallback& on_complete = nullptr);

    // 最近一次 dispatch 中同时运行的最大子流水线数
    int peak_concurrency() const { return peak_active_.load(); }

private:
    SectionRunner runner_;
    DispatchOptions options_;
    std::atomic<int> active_{0};
    std::atomic<int> peak_active_{0};

    SectionOutcome run_section(const SectionSpec& spec, std::stop_token stop);
};

} // namespace researchflow

#endif // RESEARCHFLOW_MODULES_DISPATCHER_SECTION_DISPATCHER_H
