#include "config.hpp"
#include "detector.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "ingest.hpp"
#include "redis_bus.hpp"
#include "state.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <fstream>
#include <memory>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("swingdag", console_sink);
    
    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }
    
    spdlog::set_default_logger(logger);
    spdlog::info("Logging initialized at level: {}", log_level);
}

DetectionConfig load_detection_config(const ServiceConfig& service) {
    if (service.config_file.empty()) {
        return DetectionConfig::from_env();
    }

    std::ifstream in(service.config_file);
    if (!in) {
        throw ConfigError("Cannot open detection config " + service.config_file);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Invalid JSON in " + service.config_file + ": " + e.what());
    }
    spdlog::info("Loaded detection config from {}", service.config_file);
    return DetectionConfig::from_json(j);
}

std::unique_ptr<Detector> make_detector(RedisBus& redis, const ServiceConfig& service,
                                        const DetectionConfig& detection) {
    auto stored = redis.load_snapshot(service.snapshot_key);
    if (!stored) {
        spdlog::info("No snapshot under {}, starting empty", service.snapshot_key);
        return std::make_unique<Detector>(detection);
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*stored);
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError(std::string("Snapshot is not JSON: ") + e.what());
    }
    return std::make_unique<Detector>(Detector::restore(DetectorState::from_json(j), detection));
}

void write_snapshot(RedisBus& redis, const ServiceConfig& service,
                    const Detector& detector, HealthMonitor& health) {
    std::string payload = detector.snapshot().to_json().dump();
    if (redis.store_snapshot(service.snapshot_key, payload)) {
        health.record_snapshot();
        spdlog::debug("Snapshot written at bar {} ({} bytes)",
                      detector.last_bar_index(), payload.size());
    } else {
        spdlog::warn("Snapshot at bar {} not persisted", detector.last_bar_index());
    }
}

int main() {
    try {
        // Load configuration
        ServiceConfig service = ServiceConfig::from_env();
        setup_logging(service.log_level);
        service.validate();

        DetectionConfig detection = load_detection_config(service);
        
        spdlog::info("Starting {} on {}:{}", 
                     service.service_name, service.listen_addr, service.listen_port);
        
        RedisBus redis(service.redis_url);
        HealthMonitor health;
        
        if (!redis.ping()) {
            spdlog::error("Failed to connect to Redis");
            return 1;
        }
        health.set_redis(true);
        health.set_loop_status("idle");

        auto detector = make_detector(redis, service, detection);
        redis.create_consumer_group(service.stream_bars, service.consumer_group);
        
        httplib::Server http_server;
        
        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health.to_json().dump(), "application/json");
            res.status = health.is_ok() ? 200 : 503;
        });
        
        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}", 
                         service.listen_addr, service.listen_port);
            http_server.listen(service.listen_addr.c_str(), service.listen_port);
        });
        
        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);
        
        spdlog::info("Entering main loop");
        health.set_loop_status("running");
        int64_t bars_since_snapshot = 0;
        bool state_trusted = true;
        
        while (!shutdown_requested) {
            try {
                auto messages = redis.read_bars(
                    service.stream_bars,
                    service.consumer_group,
                    service.consumer_name,
                    100,
                    100  // block ms
                );
                
                for (const auto& [msg_id, payload] : messages) {
                    IngestResult result = ingest_bar(*detector, payload);

                    if (result.status == IngestStatus::Processed) {
                        for (const auto& event : result.events) {
                            redis.publish_event(service.stream_events, event.to_json());
                        }

                        health.record_bar(detector->last_bar_index(),
                                          detector->hierarchy().size(),
                                          detector->swings().size());

                        if (++bars_since_snapshot >= service.snapshot_interval) {
                            write_snapshot(redis, service, *detector, health);
                            bars_since_snapshot = 0;
                        }
                    } else if (result.status == IngestStatus::Rejected) {
                        spdlog::warn("Rejected bar {}: {}", msg_id, result.error);
                    } else {
                        spdlog::error("Failed to process bar {}: {}", msg_id, result.error);
                    }

                    redis.ack_message(service.stream_bars, service.consumer_group, msg_id);
                }
                
                health.set_redis(redis.ping());
                
            } catch (const InvariantError& e) {
                // Detector state can no longer be trusted
                spdlog::error("Invariant violated: {}", e.what());
                health.set_loop_status("error");
                state_trusted = false;
                shutdown_requested = true;
            } catch (const std::exception& e) {
                spdlog::error("Error in main loop: {}", e.what());
                health.set_loop_status("error");
                std::this_thread::sleep_for(std::chrono::seconds(1));
                health.set_loop_status("running");
            }
        }
        
        spdlog::info("Shutting down gracefully");
        if (state_trusted && detector->last_bar_index() >= 0) {
            write_snapshot(redis, service, *detector, health);
        }
        health.set_loop_status("shutdown");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }
        
        spdlog::info("Shutdown complete");
        return 0;
        
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
