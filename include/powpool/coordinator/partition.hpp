#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace powpool::coordinator {

// Worker i of N walks start, start+step, start+2*step, ...
struct NonceAssignment {
    std::uint64_t start{0};
    std::uint64_t step{1};
};

// Position i of an N-worker snapshot gets (i, N). Together the N congruence
// classes cover every non-negative integer exactly once.
std::vector<NonceAssignment> assign_nonces(std::size_t worker_count);

// Index of the assignment whose class contains nonce, or worker_count when
// the partition is empty.
std::size_t owner_of(std::uint64_t nonce, std::size_t worker_count);

} // namespace powpool::coordinator
