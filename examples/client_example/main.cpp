/// Client example: send one JSON-RPC call and print the decoded reply.
/// Usage: ./client_example --url http://127.0.0.1:8082/math-api --method mul
///            [--params '[2.5, 3.5]'] [--id 7] [--api-key NAME=VALUE]
///            [--timeout-ms 5000] [--log-level debug]

#include <rpcwire/rpcwire.hpp>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " --url <url> --method <name> [--params <json>]"
              << " [--id <id>] [--api-key NAME=VALUE] [--timeout-ms <ms>] [--log-level <level>]\n";
}

rpcwire::RequestId parse_id(const std::string& s) {
    try {
        std::size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used == s.size()) return rpcwire::RequestId{static_cast<int64_t>(v)};
    } catch (const std::exception&) {
        // not an integer, sent as a string id
    }
    return rpcwire::RequestId{s};
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string url, method, params_text = "[]", log_level = "warn";
    std::optional<std::string> id_text;
    std::optional<rpcwire::ApiKey> api_key;
    std::optional<std::chrono::milliseconds> timeout;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            usage(argv[0]);
            return 1;
        }
        std::string value = argv[++i];
        if (arg == "--url") {
            url = value;
        } else if (arg == "--method") {
            method = value;
        } else if (arg == "--params") {
            params_text = value;
        } else if (arg == "--id") {
            id_text = value;
        } else if (arg == "--api-key") {
            auto eq = value.find('=');
            if (eq == std::string::npos) {
                usage(argv[0]);
                return 1;
            }
            api_key = rpcwire::ApiKey(value.substr(0, eq), value.substr(eq + 1));
        } else if (arg == "--timeout-ms") {
            timeout = std::chrono::milliseconds(std::stol(value));
        } else if (arg == "--log-level") {
            log_level = value;
        } else {
            usage(argv[0]);
            return 1;
        }
    }
    if (url.empty() || method.empty()) {
        usage(argv[0]);
        return 1;
    }

    rpcwire::LogManager::initialize(log_level);

    try {
        rpcwire::RpcClient::Options opts{rpcwire::ServiceAddress::from_url(url)};
        opts.api_key = api_key;
        opts.transport.timeout = timeout;
        rpcwire::RpcClient client{std::move(opts)};

        auto params = rpcwire::Codec::parse_body(params_text);
        auto resp = id_text ? client.call(method, params, parse_id(*id_text))
                            : client.call(method, params);

        if (resp.error) {
            std::cout << "error " << resp.error->code << ": " << resp.error->message << "\n";
            return 2;
        }
        std::cout << resp.result.value_or(rpcwire::Json()).dump() << "\n";
    } catch (const rpcwire::RpcError& e) {
        std::cerr << rpcwire::error_kind_name(e.kind()) << " error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
