#include "src/web_server.hpp"
#include "src/interview_errors.hpp"
#include <iostream>
#include <string>

namespace {

bool rejectsInt(const json& data, const std::string& key) {
    try {
        WebServer::optionalInt(data, key, 0);
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

bool rejectsId(const json& data, const std::string& key) {
    try {
        WebServer::optionalId(data, key);
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    std::cout << "=== Testing Request Fields ===" << std::endl;

    int failures = 0;
    auto check = [&failures](const std::string& name, bool condition) {
        std::cout << (condition ? "✅ " : "❌ ") << name << std::endl;
        if (!condition) {
            ++failures;
        }
    };

    std::cout << "\n--- Integer fields ---" << std::endl;
    check("Missing field uses the default", WebServer::optionalInt(json::object(), "max_questions", 8) == 8);
    check("Null field uses the default",
          WebServer::optionalInt(json{{"max_questions", nullptr}}, "max_questions", 8) == 8);
    check("Plain integer", WebServer::optionalInt(json{{"time_taken_sec", 60}}, "time_taken_sec", 0) == 60);
    check("Negative integer kept for validation",
          WebServer::optionalInt(json{{"time_taken_sec", -5}}, "time_taken_sec", 0) == -5);
    check("Fractional number truncated",
          WebServer::optionalInt(json{{"time_taken_sec", 42.9}}, "time_taken_sec", 0) == 42);

    check("Value wrapping past 32 bits rejected",
          rejectsInt(json::parse(R"({"time_taken_sec": 4294967356})"), "time_taken_sec"));
    check("Large negative integer rejected",
          rejectsInt(json::parse(R"({"time_taken_sec": -4294967296})"), "time_taken_sec"));
    check("Unsigned beyond int64 rejected",
          rejectsInt(json::parse(R"({"time_taken_sec": 18446744073709551615})"), "time_taken_sec"));
    check("Huge float rejected", rejectsInt(json::parse(R"({"time_taken_sec": 1e20})"), "time_taken_sec"));
    check("Huge negative float rejected", rejectsInt(json::parse(R"({"time_taken_sec": -1e20})"), "time_taken_sec"));
    check("String rejected", rejectsInt(json{{"time_taken_sec", "60"}}, "time_taken_sec"));

    std::cout << "\n--- Id fields ---" << std::endl;
    check("Integer id", WebServer::optionalId(json{{"session_id", 42}}, "session_id") == 42);
    check("String id", WebServer::optionalId(json{{"session_id", "42"}}, "session_id") == 42);
    check("Missing id is empty", !WebServer::optionalId(json::object(), "session_id"));
    check("Zero id rejected", rejectsId(json{{"session_id", 0}}, "session_id"));
    check("Trailing junk rejected", rejectsId(json{{"session_id", "42abc"}}, "session_id"));
    check("Float id rejected", rejectsId(json{{"session_id", 4.5}}, "session_id"));

    bool required = false;
    try {
        WebServer::requireId(json::object(), "candidate_id");
    } catch (const ValidationError& e) {
        required = std::string(e.what()) == "candidate_id is required";
    }
    check("Required id must be present", required);

    if (failures == 0) {
        std::cout << "\n✅ All request field tests passed" << std::endl;
        return 0;
    }
    std::cout << "\n❌ " << failures << " request field test(s) failed" << std::endl;
    return 1;
}
