#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include "question_generator.hpp"
#include <cstddef>
#include <string>
#include <vector>

struct RedisEndpoint {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password;
    int database = 0;
    bool tls = false;
};

// redis[s]://[username:][password@]host[:port][/db]
RedisEndpoint parseRedisUrl(const std::string& redis_url);

struct ServerConfig {
    int port = 8080;
    std::string upload_root = "./uploads";
    std::string detector = "cascade";
    std::string cascade_path;
    size_t analysis_threads = 2;
    size_t analysis_queue = 64;
    size_t registry_capacity = 1024;
    std::string redis_url = "redis://127.0.0.1:6379";
    GeneratorConfig generator;
    bool show_help = false;
};

// Parses command-line flags (program name excluded).
// Throws std::invalid_argument for unknown flags or bad values.
ServerConfig parseArguments(const std::vector<std::string>& args);

// Reads REDIS_URL and GENERATOR_API_KEY.
void applyEnvironment(ServerConfig& config);

void printUsage(const char* program_name);

#endif // SERVER_CONFIG_HPP
