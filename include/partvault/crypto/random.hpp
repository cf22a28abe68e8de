#pragma once

#include <cstdint>

namespace partvault::crypto {

class SecureRandom {
public:
    // Uniform in [0, upper_bound); returns 0 when upper_bound is 0
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);
};

} // namespace partvault::crypto
