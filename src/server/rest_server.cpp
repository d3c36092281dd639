#include "honeybee/server/rest_server.hpp"

#include <chrono>

#include "honeybee/logging.hpp"
#include "honeybee/metrics.hpp"

namespace honeybee {

namespace {

constexpr auto kEventPollInterval = std::chrono::milliseconds(1000);

nlohmann::json message_body(const std::string& message) {
    return nlohmann::json{{"message", message}};
}

}

RestServer::RestServer(const Config& config,
                       recorder::RecordingController& controller,
                       recorder::RecordingStore& store,
                       events::EventHub& events)
    : config_(config),
      controller_(controller),
      store_(store),
      events_(events) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();
    stopping_ = false;

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    register_recording_routes();
    register_library_routes();
    register_event_stream();

    server_thread_ = std::thread([this]() {
        logging::info("REST server listening",
                      {kv("host", config_.rest_api_host), kv("port", config_.rest_api_port)});
        if (!server_->listen(config_.rest_api_host, config_.rest_api_port)) {
            if (!stopping_) {
                logging::error("REST server failed to listen",
                               {kv("host", config_.rest_api_host),
                                kv("port", config_.rest_api_port)});
            }
        }
    });
}

void RestServer::stop() {
    stopping_ = true;
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void RestServer::register_recording_routes() {
    server_->Post("/recording/start", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        timed("start", [&]() {
            try {
                write_json(res, 200, message_body(controller_.start()));
            } catch (const std::exception& ex) {
                logging::error("Failed to handle /recording/start", {kv("error", ex.what())});
                write_json(res, 500, message_body("failed to start recording"));
            }
        });
    });

    server_->Post("/recording/stop", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        timed("stop", [&]() {
            try {
                const auto result = controller_.stop();
                write_json(res, 200, result);
            } catch (const recorder::NotRecordingError& ex) {
                write_json(res, 409, message_body(ex.what()));
            } catch (const std::exception& ex) {
                logging::error("Failed to handle /recording/stop", {kv("error", ex.what())});
                write_json(res, 500, message_body("failed to stop recording"));
            }
        });
    });

    server_->Get("/recording/status", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        write_json(res, 200, nlohmann::json{{"recording", controller_.status()}});
    });
}

void RestServer::register_library_routes() {
    server_->Get("/recordings", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        timed("list", [&]() {
            try {
                write_json(res, 200, nlohmann::json(store_.list()));
            } catch (const std::exception& ex) {
                logging::error("Failed to list recordings", {kv("error", ex.what())});
                write_json(res, 500, message_body(ex.what()));
            }
        });
    });

    server_->Get(R"(/recordings/([^/]+))",
                 [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto name = req.matches[1].str();
        timed("read", [&]() {
            try {
                res.status = 200;
                res.set_content(store_.read(name), "audio/wav");
            } catch (const recorder::RecordingAccessError& ex) {
                write_json(res, 403, message_body(ex.what()));
            } catch (const recorder::RecordingNotFoundError& ex) {
                write_json(res, 404, message_body(ex.what()));
            } catch (const std::exception& ex) {
                logging::error("Failed to read recording",
                               {kv("name", name), kv("error", ex.what())});
                write_json(res, 500, message_body(ex.what()));
            }
        });
    });

    server_->Delete(R"(/recordings/([^/]+))",
                    [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto name = req.matches[1].str();
        timed("delete", [&]() {
            try {
                store_.remove(name);
                write_json(res, 200, nlohmann::json{{"deleted", true}});
            } catch (const recorder::RecordingAccessError& ex) {
                write_json(res, 403, message_body(ex.what()));
            } catch (const recorder::RecordingNotFoundError& ex) {
                write_json(res, 404, message_body(ex.what()));
            } catch (const std::exception& ex) {
                logging::error("Failed to delete recording",
                               {kv("name", name), kv("error", ex.what())});
                write_json(res, 500, message_body(ex.what()));
            }
        });
    });
}

void RestServer::register_event_stream() {
    server_->Get("/events", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        const auto subscriber = events_.subscribe();
        logging::debug("Event stream opened", {kv("subscriber", subscriber)});
        res.set_header("Cache-Control", "no-cache");
        res.set_chunked_content_provider(
            "text/event-stream",
            [this, subscriber](size_t, httplib::DataSink& sink) {
                if (stopping_) {
                    return false;
                }
                const auto event = events_.next(subscriber, kEventPollInterval);
                std::string chunk;
                if (event) {
                    chunk = "event: " + event->name + "\ndata: " + event->payload.dump() + "\n\n";
                } else if (stopping_) {
                    return false;
                } else {
                    chunk = ": keep-alive\n\n";
                }
                return sink.write(chunk.data(), chunk.size());
            },
            [this, subscriber](bool) {
                events_.unsubscribe(subscriber);
                logging::debug("Event stream closed", {kv("subscriber", subscriber)});
            });
    });
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    const auto it = request.headers.find("Authorization");
    if (it == request.headers.end()) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (it->second != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response,
                            int status,
                            const nlohmann::json& body) const {
    response.status = status;
    response.set_content(body.dump(), "application/json");
}

void RestServer::timed(const std::string& command, const std::function<void()>& handler) const {
    const auto start = std::chrono::steady_clock::now();
    handler();
    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    Metrics::instance().observe_command_time(command, elapsed);
}

}
