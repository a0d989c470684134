#include "tablewright/cleaning/pipeline.hpp"
#include "tablewright/cleaning/column_sanitizer.hpp"
#include "tablewright/cleaning/content_normalizer.hpp"
#include "tablewright/core/logger.hpp"

namespace tablewright {

namespace {

Table run_pipeline(const Table& table, const EngineConfig& config, InferenceReport* report) {
    Table sanitized = ColumnSanitizer::sanitize(table);
    Table normalized = ContentNormalizer(config).normalize(sanitized);
    Table typed = TypeInferenceEngine(config).infer(normalized, report);

    Logger::register_component("Pipeline");
    INFO("Normalized table: " << table.num_rows() << "x" << table.num_columns() << " -> "
                              << typed.num_rows() << "x" << typed.num_columns());
    return typed;
}

}  // namespace

Table normalize_and_infer(const Table& table) {
    return run_pipeline(table, EngineConfig{}, nullptr);
}

Result<Table> normalize_and_infer(const Table& table, const EngineConfig& config,
                                  InferenceReport* report) {
    auto valid = config.validate();
    if (valid.is_error()) {
        Logger::register_component("Pipeline");
        ERROR("Rejected engine config: " << valid.error()->what());
        return make_error<Table>(valid.error()->code(), valid.error()->what(), "Pipeline");
    }
    return Result<Table>(run_pipeline(table, config, report));
}

}  // namespace tablewright
