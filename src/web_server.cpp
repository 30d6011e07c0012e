#include "web_server.hpp"
#include "answer_scorer.hpp"
#include "interview_errors.hpp"
#include "memory_session_store.hpp"
#include "question_generator.hpp"
#include "question_source.hpp"
#include <cmath>
#include <cstdint>
#include <ctime>
#include <limits>
#include <iostream>

WebServer::WebServer() : initialized(false) {
}

WebServer::~WebServer() {
    if (analysis_pool_) {
        analysis_pool_->shutdown();
    }
}

bool WebServer::initialize(const ServerConfig& config) {
    config_ = config;

    try {
        setupStore();

        registry_ = std::make_shared<SessionRegistry>(config_.registry_capacity);
        analysis_pool_ = std::make_shared<AnalysisPool>(config_.analysis_threads, config_.analysis_queue);

        std::shared_ptr<FaceDetector> detector = createFaceDetector(config_.detector, config_.cascade_path);
        frame_analyzer_ = std::make_shared<FrameAnalyzer>(detector);

        std::shared_ptr<QuestionGenerator> generator;
        if (!config_.generator.api_key.empty()) {
            generator = std::make_shared<HttpQuestionGenerator>(config_.generator);
            std::cout << "Question generator enabled: " << config_.generator.model << " at "
                      << config_.generator.endpoint_url << std::endl;
        } else {
            std::cerr << "Warning: GENERATOR_API_KEY not set - using pool and template questions only" << std::endl;
        }

        interview_engine = std::make_unique<InterviewEngine>(
            store_, registry_, std::make_shared<QuestionSource>(generator), std::make_shared<KeywordOverlapScorer>());
        proctor_service = std::make_unique<ProctorService>(
            store_, registry_, frame_analyzer_, analysis_pool_, config_.upload_root);

        setupRoutes();

        initialized = true;
        std::cout << "Web server initialized successfully!" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error initializing web server: " << e.what() << std::endl;
        return false;
    }
}

void WebServer::setupStore() {
    RedisEndpoint endpoint = parseRedisUrl(config_.redis_url);
    if (endpoint.tls) {
        std::cerr << "Warning: TLS Redis URLs are connected without TLS" << std::endl;
    }
    std::cout << "Attempting to connect to Redis at " << endpoint.host << ":" << endpoint.port << std::endl;

    auto redis_store = std::make_shared<RedisSessionStore>();
    if (redis_store->initialize(endpoint.host, endpoint.port, endpoint.password, endpoint.database)) {
        redis_store_ = redis_store;
        store_ = redis_store;
        std::cout << "Session store: redis (" << redis_store->getConnectionStatus() << ")" << std::endl;
        return;
    }

    std::cerr << "Warning: Redis unavailable - sessions are kept in memory and lost on restart" << std::endl;
    store_ = std::make_shared<MemorySessionStore>();
}

void WebServer::setupRoutes() {
    CROW_ROUTE(app, "/health").methods("GET"_method)
    ([this](const crow::request& req) {
        return handleHealthCheck(req);
    });

    CROW_ROUTE(app, "/contexts").methods("POST"_method)
    ([this](const crow::request& req) {
        return handleRegisterContext(req);
    });

    CROW_ROUTE(app, "/interview/start").methods("POST"_method)
    ([this](const crow::request& req) {
        return handleStartInterview(req);
    });

    CROW_ROUTE(app, "/interview/answer").methods("POST"_method)
    ([this](const crow::request& req) {
        return handleSubmitAnswer(req);
    });

    CROW_ROUTE(app, "/proctor/frame").methods("POST"_method)
    ([this](const crow::request& req) {
        return handleProctorFrame(req);
    });

    CROW_ROUTE(app, "/hr/proctoring/<int>").methods("GET"_method)
    ([this](const crow::request& req, int session_id) {
        return handleProctoringTimeline(req, session_id);
    });
}

void WebServer::start() {
    if (!initialized) {
        std::cerr << "Server not initialized. Call initialize() first." << std::endl;
        return;
    }

    std::cout << "Starting server on port " << config_.port << std::endl;
    app.port(config_.port).multithreaded().run();
}

void WebServer::stop() {
    app.stop();
}

crow::response WebServer::handleHealthCheck(const crow::request& req) {
    (void)req;
    json health_data = {
        {"status", "healthy"},
        {"store", store_ ? store_->backendName() : "none"},
        {"redis_connected", redis_store_ && redis_store_->isConnected()},
        {"face_detection_enabled", frame_analyzer_ && frame_analyzer_->detectionEnabled()},
        {"face_detector", frame_analyzer_ ? frame_analyzer_->detectorName() : "none"},
        {"question_generator_enabled", !config_.generator.api_key.empty()},
        {"live_sessions", registry_ ? registry_->size() : 0},
        {"pending_frames", analysis_pool_ ? analysis_pool_->pending() : 0},
        {"version", "1.0.0"},
        {"timestamp", std::time(nullptr)}
    };

    return createResponse(200, createSuccessResponse(health_data));
}

crow::response WebServer::handleRegisterContext(const crow::request& req) {
    try {
        json request_data = parseRequestBody(req.body);
        if (!request_data.is_object()) {
            throw ValidationError("Request body must be a JSON object");
        }

        InterviewContext context;
        context.result_id = requireId(request_data, "result_id");
        context.candidate_id = requireId(request_data, "candidate_id");
        context.shortlisted = request_data.value("shortlisted", false);
        context.job_title = request_data.value("job_title", std::string());
        context.job_text = request_data.value("job_text", std::string());
        context.resume_text = request_data.value("resume_text", std::string());
        if (request_data.contains("questions")) {
            context.questions = InterviewContext::normalizeQuestions(request_data["questions"]);
        }

        interview_engine->registerContext(context);

        json response_data = {
            {"result_id", context.result_id},
            {"candidate_id", context.candidate_id},
            {"question_pool_size", context.questions.size()}
        };
        return createResponse(201, createSuccessResponse(response_data));

    } catch (const std::exception& e) {
        return errorResponse(e, "registering context");
    }
}

crow::response WebServer::handleStartInterview(const crow::request& req) {
    Timer timer;

    try {
        json request_data = parseRequestBody(req.body);
        if (!request_data.is_object()) {
            throw ValidationError("Request body must be a JSON object");
        }

        StartRequest start;
        start.candidate_id = requireId(request_data, "candidate_id");
        start.result_id = optionalId(request_data, "result_id");
        start.per_question_seconds = optionalInt(request_data, "per_question_seconds", 60);
        start.total_time_seconds = optionalInt(request_data, "total_time_seconds", 1200);
        start.max_questions = optionalInt(request_data, "max_questions", 8);

        InterviewTurn turn = interview_engine->startSession(start);

        json response_data = turn.toJson();
        response_data["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(200, response_data);

    } catch (const std::exception& e) {
        return errorResponse(e, "starting interview");
    }
}

crow::response WebServer::handleSubmitAnswer(const crow::request& req) {
    Timer timer;

    try {
        json request_data = parseRequestBody(req.body);
        if (!request_data.is_object()) {
            throw ValidationError("Request body must be a JSON object");
        }

        AnswerRequest answer;
        answer.candidate_id = requireId(request_data, "candidate_id");
        answer.session_id = requireId(request_data, "session_id");
        answer.question_id = requireId(request_data, "question_id");
        if (request_data.contains("answer_text") && request_data["answer_text"].is_string()) {
            answer.answer_text = request_data["answer_text"].get<std::string>();
        }
        if (request_data.contains("skipped")) {
            if (!request_data["skipped"].is_boolean()) {
                throw ValidationError("skipped must be a boolean");
            }
            answer.skipped = request_data["skipped"].get<bool>();
        }
        answer.time_taken_seconds = optionalInt(request_data, "time_taken_sec", 0);

        InterviewTurn turn = interview_engine->submitAnswer(answer);

        json response_data = turn.toJson();
        response_data["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(200, response_data);

    } catch (const std::exception& e) {
        return errorResponse(e, "submitting answer");
    }
}

crow::response WebServer::handleProctorFrame(const crow::request& req) {
    Timer timer;

    try {
        FrameSubmission submission = parseFrameSubmission(req);
        FrameOutcome outcome = proctor_service->submitFrame(submission);

        json response_data = outcome.toJson();
        response_data["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(200, response_data);

    } catch (const std::exception& e) {
        return errorResponse(e, "processing proctor frame");
    }
}

crow::response WebServer::handleProctoringTimeline(const crow::request& req, int session_id) {
    (void)req;
    try {
        ProctoringTimeline timeline = proctor_service->timeline(session_id);
        return createResponse(200, timeline.toJson());
    } catch (const std::exception& e) {
        return errorResponse(e, "loading proctoring timeline");
    }
}

FrameSubmission WebServer::parseFrameSubmission(const crow::request& req) {
    FrameSubmission submission;
    std::string content_type = req.get_header_value("Content-Type");

    if (content_type.find("multipart/form-data") != std::string::npos) {
        crow::multipart::message message(req);

        auto field = [&message](const std::string& name) {
            return message.get_part_by_name(name).body;
        };

        submission.frame_bytes = field("file");
        submission.session_id = parseIdField("session_id", field("session_id"));
        submission.candidate_id = parseIdField("candidate_id", field("candidate_id"));
        submission.requested_event_type = field("event_type");
        return submission;
    }

    json request_data = parseRequestBody(req.body);
    if (!request_data.is_object()) {
        throw ValidationError("Request body must be a JSON object");
    }
    if (!request_data.contains("frame") || !request_data["frame"].is_string() ||
        request_data["frame"].get<std::string>().empty()) {
        throw ValidationError("Invalid request format. Required: frame, session_id and candidate_id");
    }

    submission.session_id = requireId(request_data, "session_id");
    submission.candidate_id = requireId(request_data, "candidate_id");
    submission.frame_bytes = FrameAnalyzer::decodeBase64Payload(request_data["frame"].get<std::string>());
    submission.requested_event_type = request_data.value("event_type", std::string("scan"));
    return submission;
}

json WebServer::parseRequestBody(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const std::exception&) {
        throw ValidationError("Invalid JSON in request body");
    }
}

int64_t WebServer::requireId(const json& data, const std::string& key) {
    auto value = optionalId(data, key);
    if (!value) {
        throw ValidationError(key + " is required");
    }
    return *value;
}

std::optional<int64_t> WebServer::optionalId(const json& data, const std::string& key) {
    if (!data.contains(key) || data[key].is_null()) {
        return std::nullopt;
    }
    const json& value = data[key];
    if (value.is_number_integer()) {
        int64_t id = value.get<int64_t>();
        if (id <= 0) {
            throw ValidationError(key + " must be a positive integer");
        }
        return id;
    }
    if (value.is_string()) {
        return parseIdField(key, value.get<std::string>());
    }
    throw ValidationError(key + " must be a positive integer");
}

int WebServer::optionalInt(const json& data, const std::string& key, int default_value) {
    if (!data.contains(key) || data[key].is_null()) {
        return default_value;
    }
    const json& value = data[key];
    if (value.is_number_unsigned()) {
        uint64_t number = value.get<uint64_t>();
        if (number > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            throw ValidationError(key + " is out of range");
        }
        return static_cast<int>(number);
    }
    if (value.is_number_integer()) {
        int64_t number = value.get<int64_t>();
        if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
            throw ValidationError(key + " is out of range");
        }
        return static_cast<int>(number);
    }
    if (value.is_number()) {
        double number = value.get<double>();
        if (!std::isfinite(number) || number < std::numeric_limits<int>::min() ||
            number > std::numeric_limits<int>::max()) {
            throw ValidationError(key + " is out of range");
        }
        return static_cast<int>(number);
    }
    throw ValidationError(key + " must be a number");
}

int64_t WebServer::parseIdField(const std::string& key, const std::string& value) {
    size_t consumed = 0;
    long long id = 0;
    try {
        id = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw ValidationError(key + " must be a positive integer");
    }
    if (consumed != value.size() || id <= 0) {
        throw ValidationError(key + " must be a positive integer");
    }
    return static_cast<int64_t>(id);
}

json WebServer::createErrorResponse(const std::string& error_message, int status_code) {
    return json{
        {"success", false},
        {"error", error_message},
        {"status_code", status_code}
    };
}

json WebServer::createSuccessResponse(const json& data) {
    json response = data;
    response["success"] = true;
    return response;
}

crow::response WebServer::createResponse(int status_code, const json& data) {
    crow::response res(status_code, data.dump());
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Content-Type", "application/json");
    return res;
}

crow::response WebServer::errorResponse(const std::exception& e, const std::string& operation) {
    if (const auto* interview_error = dynamic_cast<const InterviewError*>(&e)) {
        int status = interview_error->statusCode();
        std::cerr << "Error " << operation << " (" << status << "): " << e.what() << std::endl;
        return createResponse(status, createErrorResponse(e.what(), status));
    }
    std::cerr << "Error " << operation << ": " << e.what() << std::endl;
    return createResponse(500, createErrorResponse("Internal server error", 500));
}
