#pragma once

#include <stdexcept>
#include <string>

namespace powpool::coordinator {

// Transport failure or unusable response from the work service.
class ApiError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Work generation and validation authority.
class WorkApi {
public:
    virtual ~WorkApi() = default;

    // Returns the task payload for the given difficulty. Throws ApiError.
    virtual std::string generate_task(int difficulty) = 0;

    // True when the service accepts the candidate. Throws ApiError on transport failure.
    virtual bool validate(int difficulty, const std::string& nonce_hex, const std::string& hash_hex) = 0;
};

} // namespace powpool::coordinator
