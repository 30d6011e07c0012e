#include "server_config.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

RedisEndpoint parseRedisUrl(const std::string& redis_url) {
    RedisEndpoint endpoint;
    std::string url = redis_url;

    if (url.find("redis://") == 0) {
        url = url.substr(8);
    } else if (url.find("rediss://") == 0) {
        url = url.substr(9);
        endpoint.tls = true;
    }

    // Database part (/db)
    size_t db_pos = url.find('/');
    if (db_pos != std::string::npos) {
        std::string db_part = url.substr(db_pos + 1);
        url = url.substr(0, db_pos);
        if (!db_part.empty()) {
            try {
                endpoint.database = std::stoi(db_part);
            } catch (const std::exception&) {
                std::cerr << "Warning: invalid Redis database '" << db_part << "', using 0" << std::endl;
                endpoint.database = 0;
            }
        }
    }

    size_t at_pos = url.find('@');
    if (at_pos != std::string::npos) {
        std::string auth_part = url.substr(0, at_pos);
        url = url.substr(at_pos + 1);

        size_t colon_pos = auth_part.find(':');
        if (colon_pos != std::string::npos) {
            endpoint.password = auth_part.substr(colon_pos + 1);
        } else {
            endpoint.password = auth_part;
        }
    }

    // [::1]:6379 style IPv6 host
    if (!url.empty() && url[0] == '[') {
        size_t close = url.find(']');
        if (close != std::string::npos) {
            endpoint.host = url.substr(1, close - 1);
            url = url.substr(close + 1);
            if (!url.empty() && url[0] == ':') {
                url = url.substr(1);
            } else {
                url.clear();
            }
            if (!url.empty()) {
                try {
                    endpoint.port = std::stoi(url);
                } catch (const std::exception&) {
                    endpoint.port = 6379;
                }
            }
            return endpoint;
        }
    }

    size_t colon_pos = url.find(':');
    if (colon_pos != std::string::npos) {
        endpoint.host = url.substr(0, colon_pos);
        try {
            endpoint.port = std::stoi(url.substr(colon_pos + 1));
        } catch (const std::exception&) {
            endpoint.port = 6379;
        }
    } else if (!url.empty()) {
        endpoint.host = url;
    }

    if (endpoint.host.empty()) {
        endpoint.host = "127.0.0.1";
    }
    return endpoint;
}

namespace {

long parseNumber(const std::string& flag, const std::string& value, long min_value, long max_value) {
    long number = 0;
    try {
        size_t consumed = 0;
        number = std::stol(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + value);
    }
    if (number < min_value || number > max_value) {
        throw std::invalid_argument(flag + " must be between " + std::to_string(min_value) +
                                    " and " + std::to_string(max_value));
    }
    return number;
}

}  // namespace

ServerConfig parseArguments(const std::vector<std::string>& args) {
    ServerConfig config;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            config.show_help = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Unknown argument or missing value: " + arg);
        }
        const std::string& value = args[++i];

        if (arg == "--port") {
            config.port = static_cast<int>(parseNumber(arg, value, 1, 65535));
        } else if (arg == "--upload-root") {
            config.upload_root = value;
        } else if (arg == "--detector") {
            if (value != "cascade" && value != "dlib" && value != "none") {
                throw std::invalid_argument("--detector must be one of cascade, dlib, none");
            }
            config.detector = value;
        } else if (arg == "--cascade") {
            config.cascade_path = value;
        } else if (arg == "--analysis-threads") {
            config.analysis_threads = static_cast<size_t>(parseNumber(arg, value, 1, 256));
        } else if (arg == "--analysis-queue") {
            config.analysis_queue = static_cast<size_t>(parseNumber(arg, value, 1, 100000));
        } else if (arg == "--registry-capacity") {
            config.registry_capacity = static_cast<size_t>(parseNumber(arg, value, 1, 1000000));
        } else if (arg == "--generator-url") {
            config.generator.endpoint_url = value;
        } else if (arg == "--generator-model") {
            config.generator.model = value;
        } else if (arg == "--generator-timeout") {
            config.generator.timeout_seconds = parseNumber(arg, value, 1, 300);
        } else {
            throw std::invalid_argument("Unknown argument " + arg);
        }
    }

    return config;
}

void applyEnvironment(ServerConfig& config) {
    const char* redis_url = std::getenv("REDIS_URL");
    if (redis_url && *redis_url) {
        config.redis_url = redis_url;
    }
    const char* api_key = std::getenv("GENERATOR_API_KEY");
    if (api_key && *api_key) {
        config.generator.api_key = api_key;
    }
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --port PORT               Server port (default: 8080)\n"
              << "  --upload-root PATH        Snapshot root directory (default: ./uploads)\n"
              << "  --detector KIND           cascade, dlib or none (default: cascade)\n"
              << "  --cascade PATH            Haar cascade file (default: search install paths)\n"
              << "  --analysis-threads N      Frame analysis workers (default: 2)\n"
              << "  --analysis-queue N        Pending frame limit (default: 64)\n"
              << "  --registry-capacity N     Live session runtime slots (default: 1024)\n"
              << "  --generator-url URL       Chat completions endpoint\n"
              << "  --generator-model NAME    Generator model name\n"
              << "  --generator-timeout SEC   Generator request timeout (default: 15)\n"
              << "  --help                    Show this help message\n"
              << "Environment:\n"
              << "  REDIS_URL                 redis[s]://[user:][password@]host[:port][/db]\n"
              << "  GENERATOR_API_KEY         Enables the question generator\n"
              << std::endl;
}
