// main.cpp
#include "researchflow/core/engine.h"
#include "common/llm/llama_adapter.h"
#include "common/llm/ollama_client.h"
#include "common/search/http_search_client.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace researchflow;

namespace {

struct CliOptions {
    std::string command;
    std::vector<std::string> positional;
    std::string config_path;
    std::string output_path;
    std::string trace_path;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage:\n"
              << "  " << argv0 << " research \"<topic>\" [sections] [depth] [--config FILE] [--output FILE] [--trace FILE]\n"
              << "  " << argv0 << " resume [--config FILE]\n"
              << "  " << argv0 << " status <run_id> [--config FILE]\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;
    CliOptions opts;
    opts.command = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto take_value = [&](std::string& out) {
            if (i + 1 >= argc) return false;
            out = argv[++i];
            return true;
        };
        if (arg == "--config") {
            if (!take_value(opts.config_path)) return std::nullopt;
        } else if (arg == "--output") {
            if (!take_value(opts.output_path)) return std::nullopt;
        } else if (arg == "--trace") {
            if (!take_value(opts.trace_path)) return std::nullopt;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return opts;
}

std::optional<int> parse_count(const std::vector<std::string>& args, size_t index, const char* name) {
    if (index >= args.size()) return std::nullopt;
    const std::string& text = args[index];
    bool digits = !text.empty() && text.size() <= 6 &&
                  std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
    if (!digits) {
        throw std::runtime_error(std::string(name) + " must be a non-negative integer, got '" + text + "'");
    }
    return std::stoi(text);
}

PipelineConfig load_config(const CliOptions& opts) {
    PipelineConfig config = opts.config_path.empty() ? PipelineConfig{} : load_pipeline_config(opts.config_path);
    // 环境变量优先于配置文件
    if (config.log_level && !std::getenv("RESEARCHFLOW_LOG_LEVEL")) {
        set_log_level(*config.log_level);
    }
    return config;
}

std::shared_ptr<TextGenerator> make_text_generator(const PipelineConfig& config) {
    if (config.model.provider == "ollama") {
        OllamaClient::Config c;
        c.host = config.model.host;
        c.port = config.model.port;
        c.timeout_sec = config.model.timeout_sec;
        return std::make_shared<OllamaClient>(c);
    }
    LlamaAdapter::Config c;
    c.model_path = config.model.model_path;
    c.n_ctx = config.model.n_ctx;
    c.n_threads = config.model.n_threads;
    c.n_gpu_layers = config.model.n_gpu_layers;
    c.min_p = config.model.min_p;
    return std::make_shared<LlamaAdapter>(c);
}

std::shared_ptr<SearchClient> make_search_client(const PipelineConfig& config) {
    HttpSearchClient::Config c;
    c.host = config.search.host;
    c.port = config.search.port;
    c.path = config.search.path;
    c.timeout_sec = config.search.timeout_sec;
    c.max_snippet_length = static_cast<size_t>(config.search.max_snippet_length);
    return std::make_shared<HttpSearchClient>(c);
}

void print_run(const PipelineRun& run) {
    std::cout << "Run:     " << run.run_id << "\n"
              << "Topic:   " << run.request.topic << "\n"
              << "State:   " << to_string(run.state) << "\n";
    if (run.plan) {
        int done = 0;
        for (const auto& [id, outcome] : run.sections) {
            if (outcome.succeeded()) ++done;
        }
        std::cout << "Sections: " << done << "/" << run.plan->sections.size() << " completed\n";
        for (const auto& spec : run.plan->sections) {
            auto it = run.sections.find(spec.id);
            std::string status = "pending";
            if (it != run.sections.end()) {
                status = it->second.succeeded() ? "completed" : "failed (" + to_string(*it->second.error) + ")";
            }
            std::cout << "  " << spec.id << ". " << spec.title << " - " << status << "\n";
        }
    }
    if (run.failure) {
        std::cout << "Failure: " << to_string(run.failure->kind) << " in " << to_string(run.failure->stage)
                  << ": " << run.failure->message << "\n";
    }
    if (run.report) {
        const auto& m = run.report->metadata;
        std::cout << "Report:  " << m.word_count << " words, " << m.total_sources << " sources, "
                  << m.total_queries << " queries\n";
    }
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Cannot write " + path);
    }
    out << content;
}

int cmd_research(const CliOptions& opts) {
    if (opts.positional.empty()) {
        std::cerr << "research: missing topic\n";
        return 1;
    }
    PipelineConfig config = load_config(opts);
    ResearchEngine engine(config, make_text_generator(config), make_search_client(config),
                          make_run_store(config.store));

    auto request = engine.make_request(opts.positional[0],
                                       parse_count(opts.positional, 1, "sections"),
                                       parse_count(opts.positional, 2, "depth"));
    auto submitted = engine.submit(request);
    if (!submitted.accepted) {
        std::cerr << "[ERROR] request rejected (" << to_string(*submitted.error) << "): "
                  << submitted.message << "\n";
        return 2;
    }
    std::cout << "Run " << submitted.run_id << " accepted\n";

    auto run = engine.wait(submitted.run_id);
    if (!opts.trace_path.empty()) {
        write_file(opts.trace_path, engine.export_traces(submitted.run_id).dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
        std::cout << "Trace exported to " << opts.trace_path << "\n";
    }
    if (!run) {
        std::cerr << "[ERROR] run " << submitted.run_id << " not found in store\n";
        return 1;
    }
    print_run(*run);
    if (run->state != RunState::COMPLETED) {
        return 1;
    }

    std::string output = opts.output_path.empty() ? "research_report_" + run->run_id + ".md" : opts.output_path;
    write_file(output, run->report->markdown);
    std::cout << "Report written to " << output << "\n";
    return 0;
}

int cmd_resume(const CliOptions& opts) {
    PipelineConfig config = load_config(opts);
    ResearchEngine engine(config, make_text_generator(config), make_search_client(config),
                          make_run_store(config.store));
    auto runs = engine.resume_incomplete();
    if (runs.empty()) {
        std::cout << "No incomplete runs\n";
        return 0;
    }
    int failed = 0;
    for (const auto& run : runs) {
        print_run(run);
        if (run.state == RunState::COMPLETED) {
            std::string output = "research_report_" + run.run_id + ".md";
            write_file(output, run.report->markdown);
            std::cout << "Report written to " << output << "\n";
        } else {
            ++failed;
        }
        std::cout << "\n";
    }
    return failed == 0 ? 0 : 1;
}

int cmd_status(const CliOptions& opts) {
    if (opts.positional.empty()) {
        std::cerr << "status: missing run id\n";
        return 1;
    }
    PipelineConfig config = load_config(opts);
    auto store = make_run_store(config.store);
    auto run = store->load(opts.positional[0]);
    if (!run) {
        std::cerr << "Unknown run: " << opts.positional[0] << "\n";
        return 1;
    }
    print_run(*run);
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        if (opts->command == "research") return cmd_research(*opts);
        if (opts->command == "resume") return cmd_resume(*opts);
        if (opts->command == "status") return cmd_status(*opts);
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }

    print_usage(argv[0]);
    return 1;
}
