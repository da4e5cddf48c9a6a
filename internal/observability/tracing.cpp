#include "internal/observability/spans.hpp"

#include <string>
#include <utility>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/scope.h>

#include <cctype>
#include <cstdlib>
#endif

namespace streamctl::observability {

using streamctl::runtime::config::RuntimeConfig;

namespace {

thread_local std::string t_stream_id;

} // namespace

std::string_view CurrentStreamId() {
  return t_stream_id;
}

#ifdef ENABLE_OTEL

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {

constexpr const char* kServiceName    = "streamctld";
constexpr const char* kServiceVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider> g_tracer_provider;

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  return trace_api::Provider::GetTracerProvider()->GetTracer(kServiceName, kServiceVersion);
}

} // namespace

namespace detail {

std::string ResolveOtlpEndpoint(const streamctl::runtime::config::ObservabilityConfig& config, std::string_view signal) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  std::string variable = "OTEL_EXPORTER_OTLP_";
  for (const char c : signal) {
    variable.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  variable += "_ENDPOINT";
  for (const auto& name : {variable, std::string("OTEL_EXPORTER_OTLP_ENDPOINT")}) {
    if (const char* value = std::getenv(name.c_str())) {
      return value;
    }
  }

  if (config.transport() == streamctl::runtime::config::OTLP_TRANSPORT_HTTP) {
    return "http://localhost:4318/v1/" + std::string(signal);
  }
  return "localhost:4317";
}

} // namespace detail

bool InitializeTracing(const RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto                              endpoint = detail::ResolveOtlpEndpoint(observability, "traces");
  std::unique_ptr<sdktrace::SpanExporter> exporter;
  if (observability.transport() == streamctl::runtime::config::OTLP_TRANSPORT_HTTP) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcExporterOptions options;
    options.endpoint = endpoint;
    exporter         = otlp::OtlpGrpcExporterFactory::Create(options);
  }

  const opentelemetry::sdk::resource::ResourceAttributes attributes = {{"service.name", std::string(kServiceName)},
                                                                       {"service.version", std::string(kServiceVersion)}};
  const auto resource  = opentelemetry::sdk::resource::Resource::Create(attributes);
  auto       processor = sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});

  g_tracer_provider = std::shared_ptr<sdktrace::TracerProvider>(sdktrace::TracerProviderFactory::Create(std::move(processor), resource));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_tracer_provider));
  return true;
}

void ShutdownTracing() {
  if (!g_tracer_provider) {
    return;
  }
  g_tracer_provider->ForceFlush();
  g_tracer_provider->Shutdown();
  g_tracer_provider.reset();
}

struct RequestSpan::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

RequestSpan::RequestSpan(std::string_view route, std::string_view stream_id) : outer_stream_id_(std::exchange(t_stream_id, std::string(stream_id))) {
  auto span = Tracer()->StartSpan(std::string(route));
  span->SetAttribute("streamctl.route", std::string(route));
  if (!stream_id.empty()) {
    span->SetAttribute("streamctl.stream_id", std::string(stream_id));
  }
  impl_ = std::make_unique<Impl>(span);
}

RequestSpan::~RequestSpan() {
  impl_->span->End();
  t_stream_id = std::move(outer_stream_id_);
}

void RequestSpan::Fail(std::string_view error) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(error)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(error));
}

#else

bool InitializeTracing(const RuntimeConfig&) {
  return false;
}

void ShutdownTracing() {
}

RequestSpan::RequestSpan(std::string_view, std::string_view stream_id) : outer_stream_id_(std::exchange(t_stream_id, std::string(stream_id))) {
}

RequestSpan::~RequestSpan() {
  t_stream_id = std::move(outer_stream_id_);
}

void RequestSpan::Fail(std::string_view) {
}

#endif

} // namespace streamctl::observability
