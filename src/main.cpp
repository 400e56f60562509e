#include <httplib.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <CLI/CLI.hpp>
#include <chrono>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#include "cat_detector.hpp"
#include "config_manager.hpp"
#include "error_handler.hpp"
#include "frame_source.hpp"
#include "health.hpp"
#include "metrics.hpp"
#include "notifier.hpp"
#include "output_manager.hpp"
#include "performance_optimizer.hpp"
#include "pipeline.hpp"
#include "serialization.hpp"
#include "system_metrics.hpp"
#include "util.hpp"

using nlohmann::json;

namespace {
json time_json(const std::optional<WallTime>& t) {
  if (!t) return nullptr;
  return std::chrono::duration_cast<std::chrono::milliseconds>(t->time_since_epoch()).count();
}

json settings_json(const OptimizationSettings& s) {
  return {{"target_fps", s.target_fps},
          {"max_cpu_percent", s.max_cpu_percent},
          {"max_memory_percent", s.max_memory_percent},
          {"frame_downsample_factor", s.frame_downsample_factor},
          {"detection_skip_frames", s.detection_skip_frames},
          {"gc_frequency_frames", s.gc_frequency_frames},
          {"enable_frame_caching", s.enable_frame_caching},
          {"enable_roi_optimization", s.enable_roi_optimization}};
}

json metrics_json(const PerformanceMetrics& m) {
  json j{{"timestamp", time_json(m.timestamp)},
         {"cpu_percent", m.cpu_percent},
         {"memory_percent", m.memory_percent},
         {"memory_available_mb", m.memory_available_mb},
         {"fps", m.fps},
         {"frame_processing_time_ms", m.frame_processing_time_ms},
         {"detection_time_ms", m.detection_time_ms},
         {"total_detections", m.total_detections},
         {"error_count", m.error_count}};
  j["temperature_celsius"] = m.temperature_celsius ? json(*m.temperature_celsius) : json(nullptr);
  return j;
}
}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"CatCounter: kitchen-counter cat detection service"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  std::string sensitivity;
  cli_app.add_option("-s,--sensitivity", sensitivity, "Override detection sensitivity")
      ->check(CLI::IsMember({"low", "medium", "high"}));

  int port_override = 0;
  cli_app.add_option("-p,--port", port_override, "Override HTTP port")->check(CLI::Range(1, 65535));

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "CatCounter v1.0.0" << std::endl;
    std::cout << "Cascade cat detection with adaptive performance control" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const YAML::Exception& e) {
    spdlog::error("Failed to load config {}: {}", cfg_path, e.what());
    return 1;
  }
  if (!sensitivity.empty()) apply_sensitivity(app, sensitivity);
  if (port_override > 0) app.http_port = port_override;

  const auto problems = validate_config(app);
  if (!problems.empty()) {
    for (const auto& p : problems) spdlog::error("Invalid configuration: {}", p);
    return 1;
  }

  setup_logging(app.logging);
  spdlog::info("CatCounter starting (config: {})", cfg_path);

  ErrorHandler errors;
  ConfigManager config(app, cfg_path);

  ProcSystemMetrics system_metrics;
  PerformanceOptimizer optimizer(
      errors, config, system_metrics,
      std::chrono::milliseconds(static_cast<int64_t>(app.performance.monitor_interval_s * 1000)));

  auto source = createFrameSource(app.input);
  auto detector = createCatDetector(app.detection);
  OutputManager output(app.storage);
  Notifier notifier(app.notifications, errors);
  notifier.add_channel(std::make_unique<LogNotificationChannel>());

  MetricsRegistry metrics;
  Pipeline pipe(config, errors, metrics, optimizer, *source, *detector, output, notifier);

  HealthChecker health(errors);
  health.register_component(pipe);
  health.register_component(optimizer);
  health.register_component(*detector);
  health.register_component(output);
  health.register_component(notifier);

  errors.register_recovery_callback("pipeline", [] { spdlog::info("Pipeline recovered"); });

  if (!pipe.open()) {
    spdlog::error("Failed to open pipeline. Exiting.");
    return 1;
  }

  config.start_watching();
  if (app.performance.adaptive) optimizer.start_monitoring();

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(std::string("{\"ready\":") + (pipe.running() ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Post("/pipeline/start", [&](const httplib::Request&, httplib::Response& res) {
    pipe.start();
    res.set_content("{\"started\":true}", "application/json");
  });

  svr.Post("/pipeline/stop", [&](const httplib::Request&, httplib::Response& res) {
    pipe.stop();
    res.set_content("{\"stopped\":true}", "application/json");
  });

  svr.Get("/pipeline/stats", [&](const httplib::Request&, httplib::Response& res) {
    const auto s = pipe.status();
    const auto v = pipe.validation_stats();
    json j{{"running", s.running},
           {"healthy", s.healthy},
           {"monitoring_active", s.monitoring_active},
           {"frames_processed", s.frames_processed},
           {"fps", s.fps},
           {"detections", s.detections},
           {"errors", s.errors},
           {"consecutive_errors", s.consecutive_errors},
           {"last_detection", time_json(s.last_detection)},
           {"optimization_level", s.optimization_level}};
    j["validator"] = {{"confidence_threshold", v.confidence_threshold},
                      {"min_detection_size", v.min_detection_size},
                      {"roi", {v.counter_roi.x, v.counter_roi.y, v.counter_roi.width,
                               v.counter_roi.height}},
                      {"temporal_consistency_frames", v.temporal_consistency_frames},
                      {"window_size", v.window_size},
                      {"examined", v.examined},
                      {"accepted", v.accepted},
                      {"rejected_confidence", v.rejected_confidence},
                      {"rejected_size", v.rejected_size},
                      {"rejected_position", v.rejected_position},
                      {"rejected_temporal", v.rejected_temporal}};
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/optimizer", [&](const httplib::Request&, httplib::Response& res) {
    const auto s = optimizer.performance_summary();
    const auto p = optimizer.detection_parameters();
    json j{{"status", s.has_data ? "active" : "no_data"},
           {"optimization_level", s.optimization_level},
           {"current_settings", settings_json(s.settings)},
           {"total_frames_processed", s.total_frames_processed},
           {"metrics_count", s.metrics_count},
           {"memory_reclaims", optimizer.reclaim_count()},
           {"recommendations", optimizer.recommendations()}};
    j["detection_parameters"] = {{"scale_factor", p.scale_factor},
                                 {"min_neighbors", p.min_neighbors},
                                 {"min_size", p.min_size},
                                 {"max_size", p.max_size},
                                 {"blur_kernel_size", p.blur_kernel_size},
                                 {"contrast_alpha", p.contrast_alpha},
                                 {"brightness_beta", p.brightness_beta},
                                 {"roi_shrink", p.roi_shrink}};
    if (s.has_data) {
      j["performance_averages"] = {{"cpu_percent", s.avg_cpu_percent},
                                   {"memory_percent", s.avg_memory_percent},
                                   {"fps", s.avg_fps},
                                   {"processing_time_ms", s.avg_processing_time_ms}};
      j["latest_metrics"] = metrics_json(*s.latest);
    }
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    const auto report = health.run_checks();
    json comps = json::array();
    for (const auto& c : report.components) {
      json cj{{"name", c.name},
              {"healthy", c.healthy},
              {"consecutive_failures", c.consecutive_failures},
              {"failed", c.failed}};
      if (auto h = errors.component_health(c.name)) cj["status"] = to_string(h->status);
      comps.push_back(cj);
    }
    const auto es = errors.error_statistics();
    json patterns = json::array();
    for (const auto& p : es.top_patterns) patterns.push_back({{"pattern", p.first}, {"count", p.second}});
    json j{{"overall", to_string(report.overall)},
           {"system_degraded", report.system_degraded},
           {"components", comps},
           {"errors", {{"total", es.total_errors},
                       {"last_hour", es.errors_last_hour},
                       {"top_patterns", patterns}}}};
    res.status = report.overall == HealthStatus::CRITICAL ? 503 : 200;
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    auto s = pipe.stats();
    res.set_content(metrics.prometheus_text(s), "text/plain; version=0.0.4");
  });

  svr.Post("/detection/test", [&](const httplib::Request&, httplib::Response& res) {
    const auto v = pipe.trigger_test_detection();
    json j{{"triggered", true}, {"detection", v}, {"message", Notifier::format_message(v)}};
    res.set_content(j.dump(2), "application/json");
  });

  svr.Post("/config/sensitivity", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string level = req.get_param_value("level");
    const bool ok = config.set_detection_sensitivity(level);
    res.status = ok ? 200 : 400;
    json j{{"updated", ok}, {"sensitivity", level}};
    res.set_content(j.dump(2), "application/json");
  });

  pipe.start();

  spdlog::info("HTTP server listening on 0.0.0.0:{}", app.http_port);
  if (!svr.listen("0.0.0.0", app.http_port)) {
    spdlog::error("HTTP server could not bind port {}", app.http_port);
  }

  // Cleanup
  optimizer.stop_monitoring();
  pipe.stop();
  config.stop_watching();
  output.cleanup();
  spdlog::info("Shutdown complete.");
  return 0;
}
