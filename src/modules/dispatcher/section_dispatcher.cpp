// modules/dispatcher/section_dispatcher.cpp
#include "modules/dispatcher/section_dispatcher.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace researchflow {

SectionDispatcher::SectionDispatcher(SectionRunner runner, DispatchOptions options)
    : runner_(std::move(runner)), options_(options) {
    if (options_.concurrency_limit <= 0) {
        throw std::runtime_error("concurrency_limit must be positive");
    }
}

SectionOutcome SectionDispatcher::run_section(const SectionSpec& spec, std::stop_token stop) {
    SectionOutcome outcome;
    try {
        outcome = runner_(spec, stop);
    } catch (const ClassifiedError& e) {
        outcome.result.reset();
        outcome.error = e.kind();
        outcome.message = e.what();
    } catch (const std::exception& e) {
        outcome.result.reset();
        outcome.error = ErrorKind::INTERNAL;
        outcome.message = e.what();
    }
    outcome.section_id = spec.id;
    if (!outcome.succeeded() && !outcome.error) {
        outcome.error = ErrorKind::INTERNAL;
    }
    return outcome;
}

std::map<int, SectionOutcome> SectionDispatcher::dispatch(const std::vector<SectionSpec>& sections,
                                                          const SectionCallback& on_complete) {
    std::map<int, SectionOutcome> outcomes;
    active_ = 0;
    peak_active_ = 0;
    if (sections.empty()) {
        return outcomes;
    }

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<SectionSpec> queue(sections.begin(), sections.end());
    size_t finished = 0;
    bool deadline_passed = false;
    std::exception_ptr callback_error;
    std::stop_source stop_source;

    auto worker = [&]() {
        while (true) {
            SectionSpec spec;
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (queue.empty() || stop_source.stop_requested()) return;
                spec = std::move(queue.front());
                queue.pop_front();
            }

            int now_active = ++active_;
            int peak = peak_active_.load();
            while (now_active > peak && !peak_active_.compare_exchange_weak(peak, now_active)) {
            }

            SectionOutcome outcome = run_section(spec, stop_source.get_token());
            --active_;

            bool accepted = false;
            {
                std::lock_guard<std::mutex> lock(mutex);
                accepted = !deadline_passed;
                if (accepted) {
                    outcomes[spec.id] = outcome;
                }
                ++finished;
            }
            if (accepted && on_complete) {
                // 回调在工作线程上执行；异常带回调用线程再抛出
                try {
                    on_complete(outcome);
                } catch (const std::exception& e) {
                    log_error("dispatcher", "completion callback for section " + std::to_string(spec.id) +
                              " failed: " + e.what());
                    std::lock_guard<std::mutex> lock(mutex);
                    if (!callback_error) {
                        callback_error = std::current_exception();
                    }
                    stop_source.request_stop();
                }
            }
            cv.notify_all();
        }
    };

    size_t worker_count = std::min(sections.size(), static_cast<size_t>(options_.concurrency_limit));
    std::vector<std::thread> pool;
    pool.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        pool.emplace_back(worker);
    }

    {
        std::unique_lock<std::mutex> lock(mutex);
        auto all_done = [&] { return finished == sections.size() || callback_error != nullptr; };
        if (options_.stage_timeout.count() > 0) {
            if (!cv.wait_for(lock, options_.stage_timeout, all_done)) {
                deadline_passed = true;
            }
        } else {
            cv.wait(lock, all_done);
        }
    }

    if (deadline_passed) {
        log_warning("dispatcher", "research stage deadline of " +
                    std::to_string(options_.stage_timeout.count()) + " ms elapsed, cancelling outstanding sections");
        stop_source.request_stop();
    }
    for (auto& t : pool) {
        t.join();
    }
    if (callback_error) {
        std::rethrow_exception(callback_error);
    }

    for (const auto& spec : sections) {
        if (outcomes.count(spec.id)) continue;
        SectionOutcome timed_out;
        timed_out.section_id = spec.id;
        timed_out.error = ErrorKind::TIMEOUT;
        timed_out.message = "section '" + spec.title + "' cancelled at research stage deadline";
        outcomes[spec.id] = timed_out;
        if (on_complete) {
            on_complete(timed_out);
        }
    }
    return outcomes;
}

} // namespace researchflow
