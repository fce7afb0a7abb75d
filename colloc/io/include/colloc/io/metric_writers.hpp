#pragma once

/// @file metric_writers.hpp
/// @brief Serialisation of metrics for export.
/// @ingroup io_writers

#include <colloc/core/metric.hpp>

#include <ostream>

namespace colloc::io {

/// @brief Write metrics as a JSON array.
///
/// Each element is `{"name": ..., "value": ..., "type": ..., "labels": {...}}`.
///
/// @param metrics  Metrics to write.
/// @param out      Output stream.
/// @throws WriterError  If a metric value is NaN or infinite.
void write_metrics_to_stream(const core::Metrics& metrics, std::ostream& out);

/// @brief Write metrics in the text exposition format.
///
/// One `name{key="value",...} value` line per metric, preceded by a
/// `# TYPE name <type>` line the first time a name appears. Label values
/// are escaped (`\\`, `\"`, `\n`). Non-finite values are written as
/// `NaN`, `+Inf` or `-Inf`.
///
/// @param metrics  Metrics to write.
/// @param out      Output stream.
void write_metrics_text(const core::Metrics& metrics, std::ostream& out);

} // namespace colloc::io
