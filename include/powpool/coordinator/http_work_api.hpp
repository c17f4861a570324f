#pragma once

#include <string>

#include <powpool/coordinator/work_api.hpp>
#include <powpool/logging/logger.hpp>

namespace powpool::coordinator {

/**
 * WorkApi over HTTPS using libcurl.
 *
 *   GET  <base>/generate_work?d=<difficulty>   -> {"data": "<payload>"}
 *   POST <base>/validate_work  {"d":..,"n":"..","h":".."}
 *
 * Every request carries "Authorization: Bearer <api_key>".
 */
class HttpWorkApi : public WorkApi {
public:
    HttpWorkApi(std::string base_url, std::string api_key, powpool::logging::Logger& log,
                long timeout_seconds = 30);
    ~HttpWorkApi() override;

    HttpWorkApi(const HttpWorkApi&) = delete;
    HttpWorkApi& operator=(const HttpWorkApi&) = delete;

    std::string generate_task(int difficulty) override;
    bool validate(int difficulty, const std::string& nonce_hex, const std::string& hash_hex) override;

private:
    struct Response {
        long status{0};
        std::string body;
    };

    // post_body empty means GET.
    Response perform(const std::string& url, const std::string* post_body);

    std::string base_url_;
    std::string api_key_;
    powpool::logging::Logger& log_;
    long timeout_seconds_;
};

} // namespace powpool::coordinator
