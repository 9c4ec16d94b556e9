#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "app_context.hpp"
#include "logging.hpp"
#include "session/chat_session.hpp"
#include "session/session_store.hpp"
#include "settings.hpp"

using json = nlohmann::json;

class RagServer {
public:
    explicit RagServer(campus_rag::AppContext ctx)
        : ctx_(std::move(ctx)),
          sessions_(ctx_.pipeline, ctx_.settings.max_sessions,
                    std::chrono::seconds(ctx_.settings.session_idle_seconds)) {
        setup_routes();
    }

    void run() {
        spdlog::info("Starting campus_rag server on {}:{}", ctx_.settings.host, ctx_.settings.port);
        if (!server_.listen(ctx_.settings.host.c_str(), ctx_.settings.port)) {
            throw std::runtime_error("Cannot listen on " + ctx_.settings.host + ":" + std::to_string(ctx_.settings.port));
        }
    }

private:
    campus_rag::AppContext ctx_;
    campus_rag::SessionStore sessions_;
    httplib::Server server_;
    std::mutex reload_mutex_;

    static void send_error(httplib::Response& res, int status, const std::string& message) {
        res.status = status;
        res.set_content(json{{"error", message}}.dump(), "application/json");
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
            auto index = ctx_.retriever->index();
            json response = {
                {"status", "ok"},
                {"chunks", index->size()},
                {"embed_model", index->embed_model()},
                {"llm_model", ctx_.llm ? json(ctx_.llm->model_name()) : json(nullptr)},
                {"llm_keys", ctx_.key_manager->get_active_key_count()},
                {"rerank_model", ctx_.cross_encoder->model_id()},
                {"sessions", sessions_.size()}
            };
            res.set_content(response.dump(), "application/json");
        });

        server_.Post("/chat", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_chat(req, res);
        });

        server_.Post("/retrieve", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_retrieve(req, res);
        });

        server_.Delete(R"(/chat/session/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            const std::string session_id = req.matches[1];
            const bool removed = sessions_.erase(session_id);
            res.set_content(json{{"session_id", session_id}, {"removed", removed}}.dump(), "application/json");
        });

        server_.Post("/api/reload-index", [this](const httplib::Request&, httplib::Response& res) {
            this->handle_reload(res);
        });
    }

    void handle_chat(const httplib::Request& req, httplib::Response& res) {
        auto start_time = std::chrono::steady_clock::now();
        try {
            auto body = json::parse(req.body);
            std::string question = body.value("question", "");
            if (question.empty()) {
                send_error(res, 400, "Missing question");
                return;
            }
            auto mode = campus_rag::chat_mode_from_string(body.value("mode", "student"));
            if (!mode) {
                send_error(res, 400, "mode must be 'student' or 'staff'");
                return;
            }
            std::string locale = body.value("locale", "IE");
            std::string session_id = body.value("session_id", "default");
            if (session_id.empty()) session_id = "default";

            auto slot = sessions_.acquire(session_id, *mode, locale);
            campus_rag::ChatTurn turn;
            {
                std::lock_guard<std::mutex> lock(slot->mutex);
                slot->session->set_mode(*mode);
                slot->session->set_locale(locale);
                turn = slot->session->ask(question);
            }

            json citations = json::array();
            for (const auto& c : turn.citations) {
                citations.push_back(c.to_json());
            }
            json plan = turn.meta.contains("plan") ? turn.meta["plan"] : json(nullptr);
            json meta = turn.meta;
            meta.erase("plan");

            res.set_content(json{
                {"answer", turn.content},
                {"citations", citations},
                {"mode", campus_rag::to_string(*mode)},
                {"meta", meta},
                {"plan", plan},
                {"session_id", session_id}
            }.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
        } catch (const json::exception& e) {
            send_error(res, 400, std::string("Invalid request body: ") + e.what());
        } catch (const std::exception& e) {
            spdlog::error("Chat error: {}", e.what());
            send_error(res, 500, "Something went wrong while answering. Please try again.");
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count();
        spdlog::info("POST /chat -> {} in {} ms", res.status, duration);
    }

    void handle_retrieve(const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = json::parse(req.body);
            std::string query = body.value("query", "");
            int max_chunks = body.value("max_chunks", ctx_.settings.default_max_chunks);
            if (max_chunks <= 0) max_chunks = ctx_.settings.default_max_chunks;
            if (max_chunks > ctx_.settings.max_chunks_cap) max_chunks = ctx_.settings.max_chunks_cap;

            std::optional<std::string> domain_hint;
            if (body.contains("domain_hint") && body["domain_hint"].is_string() &&
                !body["domain_hint"].get<std::string>().empty()) {
                domain_hint = body["domain_hint"].get<std::string>();
            }
            auto mode = campus_rag::retrieval_mode_from_string(body.value("retrieval_mode", "hybrid"))
                            .value_or(campus_rag::RetrievalMode::kHybrid);

            json docs = json::array();
            for (const auto& doc : ctx_.retriever->retrieve(query, max_chunks, domain_hint, mode)) {
                docs.push_back(doc.to_json());
            }
            res.set_content(json{{"docs", docs}}.dump(-1, ' ', false, json::error_handler_t::replace),
                            "application/json");
        } catch (const json::exception& e) {
            send_error(res, 400, std::string("Invalid request body: ") + e.what());
        } catch (const std::exception& e) {
            spdlog::error("Retrieve error: {}", e.what());
            send_error(res, 500, e.what());
        }
    }

    void handle_reload(httplib::Response& res) {
        std::lock_guard<std::mutex> lock(reload_mutex_);
        try {
            auto index = campus_rag::load_index_checked(ctx_.settings);
            const size_t count = index->size();
            ctx_.retriever->replace_index(std::move(index));
            res.set_content(json{{"success", true}, {"chunks", count}}.dump(), "application/json");
        } catch (const std::exception& e) {
            spdlog::error("Index reload failed, keeping current index: {}", e.what());
            send_error(res, 500, e.what());
        }
    }
};

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
    }

    try {
        auto settings = campus_rag::load_settings(config_path);
        campus_rag::init_logging(settings);
        RagServer server(campus_rag::build_app_context(settings));
        server.run();
    } catch (const std::exception& e) {
        spdlog::critical("campus_rag_server failed to start: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
