#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "analysis_pool.hpp"
#include "face_detector.hpp"
#include "frame_analyzer.hpp"
#include "interview_engine.hpp"
#include "proctor_service.hpp"
#include "redis_session_store.hpp"
#include "server_config.hpp"
#include "session_registry.hpp"
#include "session_store.hpp"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <optional>

using json = nlohmann::json;

class WebServer {
public:
    WebServer();
    ~WebServer();

    // Wires stores, detectors, pools and routes from the configuration.
    bool initialize(const ServerConfig& config);

    void start();

    void stop();

    // Request field parsing. Missing or null fields fall back; anything that
    // does not fit throws ValidationError.
    static int64_t requireId(const json& data, const std::string& key);
    static std::optional<int64_t> optionalId(const json& data, const std::string& key);
    static int optionalInt(const json& data, const std::string& key, int default_value);
    static int64_t parseIdField(const std::string& key, const std::string& value);

private:
    ServerConfig config_;

    // Core components
    std::shared_ptr<SessionStore> store_;
    std::shared_ptr<RedisSessionStore> redis_store_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<AnalysisPool> analysis_pool_;
    std::shared_ptr<FrameAnalyzer> frame_analyzer_;
    std::unique_ptr<InterviewEngine> interview_engine;
    std::unique_ptr<ProctorService> proctor_service;

    crow::SimpleApp app;

    bool initialized;

    // Endpoint handlers
    crow::response handleHealthCheck(const crow::request& req);
    crow::response handleRegisterContext(const crow::request& req);
    crow::response handleStartInterview(const crow::request& req);
    crow::response handleSubmitAnswer(const crow::request& req);
    crow::response handleProctorFrame(const crow::request& req);
    crow::response handleProctoringTimeline(const crow::request& req, int session_id);

    // Helper methods
    json parseRequestBody(const std::string& body);
    FrameSubmission parseFrameSubmission(const crow::request& req);
    json createErrorResponse(const std::string& error_message, int status_code = 400);
    json createSuccessResponse(const json& data);
    crow::response createResponse(int status_code, const json& data);
    crow::response errorResponse(const std::exception& e, const std::string& operation);

    void setupStore();
    void setupRoutes();

    class Timer {
    private:
        std::chrono::high_resolution_clock::time_point start_time;
    public:
        Timer() : start_time(std::chrono::high_resolution_clock::now()) {}

        int64_t elapsed_ms() const {
            auto end_time = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
        }
    };
};

#endif // WEB_SERVER_HPP
