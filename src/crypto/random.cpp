#include "partvault/crypto/random.hpp"
#include "partvault/crypto/hash.hpp"
#include <sodium.h>

namespace partvault::crypto {

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    if (upper_bound == 0 || !ensure_sodium_initialized()) {
        return 0;
    }
    return randombytes_uniform(upper_bound);
}

}
