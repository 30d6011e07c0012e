#include "redis_session_store.hpp"
#include "interview_errors.hpp"
#include <algorithm>
#include <cstdarg>
#include <iostream>

const std::string RedisSessionStore::KEY_PREFIX = "interview:";

RedisSessionStore::RedisSessionStore() : context(nullptr), port_(6379), database_(0), connected_(false) {
}

RedisSessionStore::~RedisSessionStore() {
    cleanup();
}

bool RedisSessionStore::initialize(const std::string& host, int port, const std::string& password, int database) {
    std::lock_guard<std::mutex> lock(mutex_);
    host_ = host;
    port_ = port;
    password_ = password;
    database_ = database;
    return connect();
}

bool RedisSessionStore::connect() {
    cleanup();

    context = redisConnect(host_.c_str(), port_);
    if (context == nullptr || context->err) {
        if (context) {
            std::cerr << "Redis connection error: " << context->errstr << std::endl;
            redisFree(context);
            context = nullptr;
        } else {
            std::cerr << "Redis connection error: Can't allocate redis context" << std::endl;
        }
        connected_ = false;
        return false;
    }

    if (!password_.empty()) {
        redisReply* reply = (redisReply*)redisCommand(context, "AUTH %s", password_.c_str());
        if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
            std::cerr << "Redis authentication failed";
            if (reply && reply->str) {
                std::cerr << ": " << reply->str;
            }
            std::cerr << std::endl;

            if (reply) freeReplyObject(reply);
            cleanup();
            return false;
        }
        freeReplyObject(reply);
    }

    if (database_ > 0) {
        redisReply* reply = (redisReply*)redisCommand(context, "SELECT %d", database_);
        if (reply == nullptr || reply->type == REDIS_REPLY_ERROR) {
            std::cerr << "Redis SELECT " << database_ << " failed" << std::endl;
            if (reply) freeReplyObject(reply);
            cleanup();
            return false;
        }
        freeReplyObject(reply);
    }

    redisReply* ping_reply = (redisReply*)redisCommand(context, "PING");
    if (ping_reply == nullptr || ping_reply->type != REDIS_REPLY_STATUS ||
        std::string(ping_reply->str) != "PONG") {
        std::cerr << "Redis PING test failed" << std::endl;
        if (ping_reply) freeReplyObject(ping_reply);
        cleanup();
        return false;
    }
    freeReplyObject(ping_reply);

    connected_ = true;
    std::cout << "Redis connection established successfully to " << host_ << ":" << port_ << std::endl;
    return true;
}

bool RedisSessionStore::isConnected() const {
    return connected_ && context != nullptr && context->err == 0;
}

std::string RedisSessionStore::getConnectionStatus() const {
    if (!connected_ || !context) {
        return "Disconnected";
    }
    if (context->err != 0) {
        return std::string("Error: ") + context->errstr;
    }
    return "Connected to " + host_ + ":" + std::to_string(port_);
}

bool RedisSessionStore::reconnect() {
    std::cout << "Reconnecting to Redis at " << host_ << ":" << port_ << std::endl;
    return connect();
}

void RedisSessionStore::cleanup() {
    if (context) {
        redisFree(context);
        context = nullptr;
    }
    connected_ = false;
}

RedisSessionStore::Reply RedisSessionStore::command(const char* format, ...) {
    if (!isConnected() && !reconnect()) {
        throw StoreError("Redis not connected");
    }

    va_list args;
    va_start(args, format);
    void* raw = redisvCommand(context, format, args);
    va_end(args);

    if (raw == nullptr) {
        std::string reason = context ? context->errstr : "no context";
        std::cerr << "Redis command failed: " << reason << std::endl;
        connected_ = false;
        throw StoreError("Redis command failed: " + reason);
    }

    Reply reply(static_cast<redisReply*>(raw), freeReplyObject);
    if (reply->type == REDIS_REPLY_ERROR) {
        std::string reason = reply->str ? std::string(reply->str, reply->len) : "unknown error";
        std::cerr << "Redis replied with error: " << reason << std::endl;
        throw StoreError("Redis error: " + reason);
    }
    return reply;
}

int64_t RedisSessionStore::nextId(const std::string& kind) {
    std::string key = sequenceKey(kind);
    Reply reply = command("INCR %s", key.c_str());
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw StoreError("Unexpected reply type for INCR " + key);
    }
    return static_cast<int64_t>(reply->integer);
}

void RedisSessionStore::setValue(const std::string& key, const std::string& value) {
    Reply reply = command("SET %s %b", key.c_str(), value.data(), value.size());
    if (reply->type != REDIS_REPLY_STATUS) {
        throw StoreError("Unexpected reply type for SET " + key);
    }
}

std::optional<std::string> RedisSessionStore::getValue(const std::string& key) {
    Reply reply = command("GET %s", key.c_str());
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_STRING) {
        throw StoreError("Unexpected reply type for GET " + key);
    }
    return std::string(reply->str, reply->len);
}

std::vector<int64_t> RedisSessionStore::listIds(const std::string& key) {
    Reply reply = command("LRANGE %s 0 -1", key.c_str());
    std::vector<int64_t> ids;
    if (reply->type != REDIS_REPLY_ARRAY) {
        return ids;
    }
    for (size_t i = 0; i < reply->elements; ++i) {
        redisReply* element = reply->element[i];
        if (element->type == REDIS_REPLY_STRING) {
            ids.push_back(std::stoll(std::string(element->str, element->len)));
        }
    }
    return ids;
}

void RedisSessionStore::saveContext(const InterviewContext& context_record) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string key = contextKey(context_record.result_id);
    setValue(key, context_record.toJson().dump());

    std::string index_key = candidateContextsKey(context_record.candidate_id);
    command("SADD %s %lld", index_key.c_str(), static_cast<long long>(context_record.result_id));
    std::cout << "Context for result " << context_record.result_id << " stored in Redis" << std::endl;
}

std::optional<InterviewContext> RedisSessionStore::getContext(int64_t result_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = getValue(contextKey(result_id));
    if (!data) {
        return std::nullopt;
    }
    return InterviewContext::fromJson(json::parse(*data));
}

std::vector<InterviewContext> RedisSessionStore::listContextsForCandidate(int64_t candidate_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string index_key = candidateContextsKey(candidate_id);
    Reply reply = command("SMEMBERS %s", index_key.c_str());

    std::vector<int64_t> result_ids;
    if (reply->type == REDIS_REPLY_ARRAY) {
        for (size_t i = 0; i < reply->elements; ++i) {
            redisReply* element = reply->element[i];
            if (element->type == REDIS_REPLY_STRING) {
                result_ids.push_back(std::stoll(std::string(element->str, element->len)));
            }
        }
    }
    std::sort(result_ids.begin(), result_ids.end());

    std::vector<InterviewContext> contexts;
    for (int64_t result_id : result_ids) {
        auto data = getValue(contextKey(result_id));
        if (!data) {
            continue;
        }
        InterviewContext context_record = InterviewContext::fromJson(json::parse(*data));
        if (context_record.candidate_id == candidate_id) {
            contexts.push_back(context_record);
        }
    }
    return contexts;
}

Session RedisSessionStore::createSession(Session session) {
    std::lock_guard<std::mutex> lock(mutex_);
    session.id = nextId("session");
    setValue(sessionKey(session.id), session.toJson().dump());
    if (!session.isCompleted()) {
        std::string active_key = activeSessionKey(session.candidate_id, session.result_id);
        command("SET %s %lld", active_key.c_str(), static_cast<long long>(session.id));
    }
    std::cout << "Session " << session.id << " created in Redis" << std::endl;
    return session;
}

std::optional<Session> RedisSessionStore::getSession(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = getValue(sessionKey(session_id));
    if (!data) {
        return std::nullopt;
    }
    return Session::fromJson(json::parse(*data));
}

void RedisSessionStore::updateSession(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    setValue(sessionKey(session.id), session.toJson().dump());
    if (session.isCompleted()) {
        std::string active_key = activeSessionKey(session.candidate_id, session.result_id);
        auto active = getValue(active_key);
        if (active && std::stoll(*active) == session.id) {
            command("DEL %s", active_key.c_str());
        }
    }
}

std::optional<Session> RedisSessionStore::findActiveSession(int64_t candidate_id, int64_t result_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto active = getValue(activeSessionKey(candidate_id, result_id));
    if (!active) {
        return std::nullopt;
    }
    auto data = getValue(sessionKey(std::stoll(*active)));
    if (!data) {
        return std::nullopt;
    }
    Session session = Session::fromJson(json::parse(*data));
    if (session.isCompleted()) {
        return std::nullopt;
    }
    return session;
}

Question RedisSessionStore::createQuestion(Question question) {
    std::lock_guard<std::mutex> lock(mutex_);
    question.id = nextId("question");
    setValue(questionKey(question.id), question.toJson().dump());
    std::string list_key = sessionQuestionsKey(question.session_id);
    command("RPUSH %s %lld", list_key.c_str(), static_cast<long long>(question.id));
    return question;
}

std::optional<Question> RedisSessionStore::getQuestion(int64_t question_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto data = getValue(questionKey(question_id));
    if (!data) {
        return std::nullopt;
    }
    return Question::fromJson(json::parse(*data));
}

std::vector<Question> RedisSessionStore::listQuestions(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Question> questions;
    for (int64_t id : listIds(sessionQuestionsKey(session_id))) {
        auto data = getValue(questionKey(id));
        if (data) {
            questions.push_back(Question::fromJson(json::parse(*data)));
        }
    }
    return questions;
}

void RedisSessionStore::updateQuestion(const Question& question) {
    std::lock_guard<std::mutex> lock(mutex_);
    setValue(questionKey(question.id), question.toJson().dump());
}

ProctorEvent RedisSessionStore::createEvent(ProctorEvent event) {
    std::lock_guard<std::mutex> lock(mutex_);
    event.id = nextId("event");
    setValue(eventKey(event.id), event.toJson().dump());
    std::string list_key = sessionEventsKey(event.session_id);
    command("RPUSH %s %lld", list_key.c_str(), static_cast<long long>(event.id));
    return event;
}

std::vector<ProctorEvent> RedisSessionStore::listEvents(int64_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProctorEvent> events;
    for (int64_t id : listIds(sessionEventsKey(session_id))) {
        auto data = getValue(eventKey(id));
        if (data) {
            events.push_back(ProctorEvent::fromJson(json::parse(*data)));
        }
    }
    return events;
}

std::string RedisSessionStore::contextKey(int64_t result_id) {
    return KEY_PREFIX + "context:" + std::to_string(result_id);
}

std::string RedisSessionStore::candidateContextsKey(int64_t candidate_id) {
    return KEY_PREFIX + "candidate:" + std::to_string(candidate_id) + ":contexts";
}

std::string RedisSessionStore::sessionKey(int64_t session_id) {
    return KEY_PREFIX + "session:" + std::to_string(session_id);
}

std::string RedisSessionStore::activeSessionKey(int64_t candidate_id, int64_t result_id) {
    return KEY_PREFIX + "active:" + std::to_string(candidate_id) + ":" + std::to_string(result_id);
}

std::string RedisSessionStore::questionKey(int64_t question_id) {
    return KEY_PREFIX + "question:" + std::to_string(question_id);
}

std::string RedisSessionStore::sessionQuestionsKey(int64_t session_id) {
    return sessionKey(session_id) + ":questions";
}

std::string RedisSessionStore::eventKey(int64_t event_id) {
    return KEY_PREFIX + "event:" + std::to_string(event_id);
}

std::string RedisSessionStore::sessionEventsKey(int64_t session_id) {
    return sessionKey(session_id) + ":events";
}

std::string RedisSessionStore::sequenceKey(const std::string& kind) {
    return KEY_PREFIX + "seq:" + kind;
}
