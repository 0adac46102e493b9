#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/scope.h>

#include <string>
#include <utility>

#include "config/config.pb.h"

namespace wfrun::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const wfrun::runtime::config::ObservabilityConfig& config) {
  if (config.transport() == wfrun::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpExporterOptions options;
    if (!config.otlp_endpoint().empty()) options.url = config.otlp_endpoint();
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  if (!config.otlp_endpoint().empty()) options.endpoint = config.otlp_endpoint();
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const wfrun::runtime::config::ObservabilityConfig& config) {
  ShutdownTracing();
  if (!config.tracing_enabled()) {
    return false;
  }

  const std::string                                    service = config.service_name().empty() ? "wfrun" : config.service_name();
  const opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", service}};

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});
  g_provider     = sdktrace::TracerProviderFactory::Create(std::move(processor), opentelemetry::sdk::resource::Resource::Create(attributes));
  g_tracer       = g_provider->GetTracer("wfrun");
  return true;
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (g_provider) {
    // wfrunctl exits right after; pending batches go out now
    g_provider->ForceFlush();
    g_provider->Shutdown();
    g_provider.reset();
  }
}

struct OperationSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
  bool                                              ended = false;
};

OperationSpan::OperationSpan(std::string_view operation, int64_t run_id) {
  if (!g_tracer) {
    return;
  }
  impl_       = std::make_unique<Impl>();
  impl_->span = g_tracer->StartSpan(opentelemetry::nostd::string_view(operation.data(), operation.size()));
  if (run_id != 0) {
    impl_->span->SetAttribute("wfrun.run_id", run_id);
  }
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

OperationSpan::~OperationSpan() {
  if (impl_ && !impl_->ended) {
    impl_->span->End();
  }
}

void OperationSpan::End(Outcome outcome, std::string_view error) {
  if (!impl_ || impl_->ended) {
    return;
  }
  impl_->span->SetAttribute("wfrun.outcome", ToString(outcome));
  if (outcome == Outcome::kRejected || outcome == Outcome::kFailed) {
    impl_->span->SetStatus(trace_api::StatusCode::kError, opentelemetry::nostd::string_view(error.data(), error.size()));
  }
  impl_->scope.reset();
  impl_->span->End();
  impl_->ended = true;
}

} // namespace wfrun::observability

#endif
