#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace wfrun::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace nostd       = opentelemetry::nostd;

namespace {

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const wfrun::runtime::config::ObservabilityConfig& config) {
  if (config.transport() == wfrun::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpMetricExporterOptions options;
    if (!config.otlp_endpoint().empty()) options.url = config.otlp_endpoint();
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  if (!config.otlp_endpoint().empty()) options.endpoint = config.otlp_endpoint();
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

nostd::string_view View(std::string_view value) {
  return nostd::string_view(value.data(), value.size());
}

} // namespace

bool InitializeMetrics(const wfrun::runtime::config::ObservabilityConfig& config) {
  ShutdownMetrics();
  if (!config.metrics_enabled()) {
    return false;
  }

  const std::string                                    service = config.service_name().empty() ? "wfrun" : config.service_name();
  const opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", service}};

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(5000);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(1000);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           opentelemetry::sdk::resource::Resource::Create(attributes));
  g_provider->AddMetricReader(sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(config), reader_options));

  metrics_api::Provider::SetMeterProvider(nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
    g_provider.reset();
  }
}

struct Metrics::Impl {
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operations;
  nostd::shared_ptr<metrics_api::Histogram<double>>      latency_ms;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> runs_created;
  nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> node_advances;
};

// Instruments bind to whichever meter provider is installed on first use.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("wfrun");

  impl_->operations    = meter->CreateUInt64Counter("wfrun.engine.operations", "RunEngine operations by outcome", "1");
  impl_->latency_ms    = meter->CreateDoubleHistogram("wfrun.engine.latency", "RunEngine operation latency", "ms");
  impl_->runs_created  = meter->CreateUInt64Counter("wfrun.runs.created", "Workflow runs created", "1");
  impl_->node_advances = meter->CreateUInt64Counter("wfrun.nodes.advanced", "Node status reports applied", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, Outcome outcome, double latency_ms) {
  impl_->operations->Add(1, {{"operation", View(operation)}, {"outcome", ToString(outcome)}});
  impl_->latency_ms->Record(latency_ms, {{"operation", View(operation)}}, opentelemetry::context::Context{});
}

void Metrics::RecordRunCreated(std::string_view project_key) {
  impl_->runs_created->Add(1, {{"project", View(project_key)}});
}

void Metrics::RecordNodeAdvance(std::string_view status) {
  impl_->node_advances->Add(1, {{"status", View(status)}});
}

} // namespace wfrun::observability

#endif
