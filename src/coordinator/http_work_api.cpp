#include <powpool/coordinator/http_work_api.hpp>

#include <memory>

#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace powpool::coordinator {

namespace {

std::size_t append_body(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

} // namespace

HttpWorkApi::HttpWorkApi(std::string base_url, std::string api_key,
                         powpool::logging::Logger& log, long timeout_seconds)
    : base_url_(trim_trailing_slash(std::move(base_url))),
      api_key_(std::move(api_key)),
      log_(log),
      timeout_seconds_(timeout_seconds) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpWorkApi::~HttpWorkApi() { curl_global_cleanup(); }

HttpWorkApi::Response HttpWorkApi::perform(const std::string& url, const std::string* post_body) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) throw ApiError("failed to initialize curl");

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, fmt::format("Authorization: Bearer {}", api_key_).c_str());
    if (post_body) raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    Response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (post_body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw ApiError(fmt::format("request to {} failed: {}", url, curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::string HttpWorkApi::generate_task(int difficulty) {
    const auto url = fmt::format("{}/generate_work?d={}", base_url_, difficulty);
    log_.debug(fmt::format("GET {}", url));
    auto response = perform(url, nullptr);
    if (response.status >= 400) {
        throw ApiError(fmt::format("generate_work returned HTTP {}: {}", response.status, response.body));
    }
    try {
        auto j = json::parse(response.body);
        if (!j.is_object() || !j.contains("data") || !j["data"].is_string()) {
            throw ApiError("generate_work response has no 'data' string");
        }
        return j["data"].get<std::string>();
    } catch (const json::exception& e) {
        throw ApiError(fmt::format("generate_work response is not JSON: {}", e.what()));
    }
}

bool HttpWorkApi::validate(int difficulty, const std::string& nonce_hex, const std::string& hash_hex) {
    json body = {{"d", difficulty}, {"n", nonce_hex}, {"h", hash_hex}};
    const auto text = body.dump();
    const auto url = base_url_ + "/validate_work";
    log_.debug(fmt::format("POST {} {}", url, text));
    auto response = perform(url, &text);
    if (response.status >= 400) {
        log_.warn(fmt::format("validate_work rejected (HTTP {}): {}", response.status, response.body));
        return false;
    }
    return true;
}

} // namespace powpool::coordinator
