#include <powpool/coordinator/partition.hpp>

namespace powpool::coordinator {

std::vector<NonceAssignment> assign_nonces(std::size_t worker_count) {
    std::vector<NonceAssignment> out;
    out.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        out.push_back(NonceAssignment{static_cast<std::uint64_t>(i),
                                      static_cast<std::uint64_t>(worker_count)});
    }
    return out;
}

std::size_t owner_of(std::uint64_t nonce, std::size_t worker_count) {
    if (worker_count == 0) return 0;
    return static_cast<std::size_t>(nonce % worker_count);
}

} // namespace powpool::coordinator
