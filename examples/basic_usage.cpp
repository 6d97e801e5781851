// Basic JsonDescent usage example
// Compile: g++ -std=c++20 -I../include basic_usage.cpp -o basic_usage

#include <JsonDescent/error_formatting.hpp>
#include <JsonDescent/parser.hpp>
#include <JsonDescent/value.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace JsonDescent;

struct Config {
    std::string app_name;
    int version;
    bool debug_mode;

    struct Server {
        std::string host;
        std::uint16_t port;
    };
    Server server;
    std::vector<std::string> plugins;
    std::optional<double> timeout;
};

int main() {
    const char* json = R"({
        "app_name": "MyApp",
        "version": 1,
        "debug_mode": true,
        "server": {
            "host": "localhost",
            "port": 8080
        },
        "plugins": ["auth", "metrics"]
    })";

    Config config;
    auto result = Parse(config, std::string_view(json));

    if (!result) {
        std::cout << "Parse error: " << ParseResultToString(result, json) << std::endl;
        return 1;
    }

    std::cout << "Successfully parsed!" << std::endl;
    std::cout << "App: " << config.app_name << std::endl;
    std::cout << "Version: " << config.version << std::endl;
    std::cout << "Debug: " << (config.debug_mode ? "ON" : "OFF") << std::endl;
    std::cout << "Server: " << config.server.host << ":" << config.server.port << std::endl;
    std::cout << "Plugins: " << config.plugins.size() << std::endl;
    std::cout << "Timeout: " << (config.timeout ? std::to_string(*config.timeout) : "default") << std::endl;

    // Port out of range for uint16_t
    const char* bad = R"({"app_name": "x", "version": 1, "debug_mode": false,
                          "server": {"host": "h", "port": 70000}, "plugins": []})";
    result = Parse(config, std::string_view(bad));
    std::cout << "Expected error: " << ErrorToString(result.error()) << std::endl;

    // Schemaless
    Value doc;
    if (Parse(doc, std::string_view(json))) {
        for (const auto& [key, value] : *doc.as_object()) {
            std::cout << "  " << key << (value.is_object() ? " {...}" : "") << std::endl;
        }
    }

    return 0;
}
