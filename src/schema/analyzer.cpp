#include "schema/analyzer.hpp"

#include "log/log.hpp"
#include "schema/builder.hpp"
#include "schema/reporter.hpp"
#include "schema/validator.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace argschema::schema {

SchemaAnalyzer::SchemaAnalyzer(const metadata::MetadataProvider& provider, DiagnosticSink& sink,
                               AnalyzerConfig config)
    : provider_(provider), sink_(sink), config_(std::move(config)),
      reader_(config_.annotation_namespace) {}

auto SchemaAnalyzer::analyze_type(const metadata::TypeSymbol& type) const -> TypeAnalysis {
    return analyze_type(type, sink_);
}

auto SchemaAnalyzer::analyze_type(const metadata::TypeSymbol& type, DiagnosticSink& sink) const
    -> TypeAnalysis {
    TypeAnalysis result;
    result.type = &type;

    auto members = reader_.read(type);
    if (members.empty()) {
        ARGSCHEMA_LOG_TRACE("analyzer", "Skipping " << type.name << ": no recognized attributes");
        result.skipped = true;
        return result;
    }

    ARGSCHEMA_LOG_DEBUG("analyzer",
                        "Analyzing " << type.name << " (" << members.size() << " member(s))");

    DiagnosticReporter reporter(sink, config_, type.name);

    SchemaBuilder builder(provider_, reporter);
    auto model = builder.build(members);

    GroupValidator validator(reporter);
    validator.validate(model.groups);

    result.action = std::move(model.action);
    result.groups = std::move(model.groups);
    result.errors = reporter.errors();
    result.warnings = reporter.warnings();
    result.infos = reporter.infos();
    return result;
}

auto SchemaAnalyzer::worker_count(size_t type_count) const -> unsigned {
    unsigned jobs = config_.jobs;
    if (jobs == 0) {
        jobs = std::max(1u, std::thread::hardware_concurrency());
    }
    return static_cast<unsigned>(std::min<size_t>(jobs, std::max<size_t>(type_count, 1)));
}

auto SchemaAnalyzer::analyze_all() const -> AnalysisSummary {
    auto types = provider_.types();
    unsigned threads = worker_count(types.size());

    AnalysisSummary summary;

    if (threads <= 1) {
        for (const auto* type : types) {
            summary.merge(analyze_type(*type, sink_));
        }
        ARGSCHEMA_LOG_DEBUG("analyzer", "Analyzed " << summary.types_analyzed << " of "
                                                    << summary.types_seen << " type(s)");
        return summary;
    }

    ARGSCHEMA_LOG_DEBUG("analyzer",
                        "Analyzing " << types.size() << " type(s) with " << threads << " threads");

    SynchronizedSink shared_sink(sink_);
    std::atomic<size_t> next{0};
    std::mutex summary_mutex;

    auto worker = [&]() {
        AnalysisSummary local;
        while (true) {
            size_t index = next.fetch_add(1);
            if (index >= types.size()) {
                break;
            }
            local.merge(analyze_type(*types[index], shared_sink));
        }
        std::lock_guard<std::mutex> lock(summary_mutex);
        summary.merge(local);
    };

    std::vector<std::thread> workers;
    workers.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) {
        w.join();
    }

    ARGSCHEMA_LOG_DEBUG("analyzer", "Analyzed " << summary.types_analyzed << " of "
                                                << summary.types_seen << " type(s)");
    return summary;
}

} // namespace argschema::schema
