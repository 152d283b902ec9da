#include "auth/auth_mode.hpp"
#include "auth/nonce_store.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace authguard;

namespace {

constexpr int kExitAccepted = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* prog) {
    std::cerr << std::format(
        "usage: {} <config.toml> <request.json>\n"
        "\n"
        "request.json holds either \"headers\" (object of header name -> value)\n"
        "or \"frame\" (any JSON value), plus optional \"nonces\" (api key -> next nonce).\n",
        prog);
}

nlohmann::json read_json_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::format("cannot open {}", path));
    }
    return nlohmann::json::parse(in);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc != 3) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    try {
        const std::string config_file = argv[1];
        const std::string request_file = argv[2];

        utils::log::info(std::format("Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitUsage;
        }
        const auto& config = config_result.config;
        utils::log::set_level(config.logging.level);

        const auto request = read_json_file(request_file);

        auto nonce_store = std::make_shared<InMemoryNonceStore>();
        if (const auto nonces = request.find("nonces"); nonces != request.end()) {
            for (const auto& [key, value] : nonces->items()) {
                nonce_store->seed(key, value.get<uint64_t>());
            }
        }

        const AuthMode mode = make_auth_mode(config.auth, lookup_from(nonce_store), commit_to(nonce_store));
        utils::log::info(std::format("Auth mode: {}", to_string(mode.kind())));

        Status status = Status::ok();
        if (const auto headers = request.find("headers"); headers != request.end()) {
            HeaderMap header_map;
            for (const auto& [name, value] : headers->items()) {
                header_map.emplace(name, value.get<std::string>());
            }
            mode.require(RequestShape::HTTP_HEADER);
            status = mode.validate(AuthRequest(header_map));
        } else if (const auto frame = request.find("frame"); frame != request.end()) {
            mode.require(RequestShape::FRAME);
            status = mode.validate(AuthRequest(*frame));
        } else {
            utils::log::error("request file needs a \"headers\" or \"frame\" entry");
            return kExitUsage;
        }

        if (status.is_ok()) {
            std::cout << "accepted\n";
            return kExitAccepted;
        }
        std::cout << std::format("rejected ({}): {}\n",
            to_string(status.error_category()), status.error_message());
        return kExitRejected;

    } catch (const ConfigurationError& e) {
        utils::log::error(std::format("Configuration error: {}", e.what()));
        return kExitUsage;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitUsage;
    }
}
