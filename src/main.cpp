#include "webtender/client.hpp"
#include "webtender/util.hpp"

#include <iostream>
#include <string>

namespace {

bool report_failure(const std::string& label, const webtender::ApiResult& result) {
    if (result.ok()) {
        return false;
    }
    std::cerr << "[Webtender] " << label << " failed (" << webtender::to_string(result.error->kind())
              << "): " << result.error->what() << std::endl;
    return true;
}

std::string id_of(const nlohmann::json& value) {
    if (!value.is_object() || !value.contains("id")) {
        return value.dump();
    }
    const auto& id = value.at("id");
    return id.is_string() ? id.get<std::string>() : id.dump();
}

} // namespace

int main(int argc, char** argv) {
    webtender::load_env_file(".env");

    try {
        const auto client = webtender::Client::from_env();
        std::cout << "[Webtender] Using API at " << client.base_url() << std::endl;

        const auto list = client.get("/v1/servers");
        if (report_failure("GET /v1/servers", list)) {
            return 1;
        }

        const auto& servers = list.response.data;
        if (servers.is_array()) {
            std::cout << "[Webtender] Found " << servers.size() << " servers" << std::endl;
            for (const auto& server : servers) {
                std::cout << "  server " << id_of(server) << std::endl;
            }
        } else {
            std::cout << "[Webtender] Servers: " << servers.dump() << std::endl;
        }
        std::cout << "[Webtender] REST latency: total=" << list.response.timings.total_ms << " ms"
                  << ", connect=" << list.response.timings.connect_ms << " ms"
                  << ", tls=" << list.response.timings.app_connect_ms << " ms" << std::endl;

        if (argc < 2) {
            return 0;
        }

        const nlohmann::json payload = {{"name", argv[1]}};
        const auto created = client.post("/v1/servers", payload.dump());
        if (report_failure("POST /v1/servers", created)) {
            return 1;
        }

        const auto server_id = id_of(created.response.data);
        std::cout << "[Webtender] Server created: " << server_id << std::endl;

        const auto deleted = client.del("/v1/servers/" + server_id);
        if (report_failure("DELETE /v1/servers/" + server_id, deleted)) {
            return 1;
        }
        std::cout << "[Webtender] Server deleted: " << server_id << std::endl;
    } catch (const webtender::Error& ex) {
        std::cerr << "[Webtender] " << webtender::to_string(ex.kind()) << " error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
