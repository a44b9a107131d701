#ifndef COMMIT_SECURERANDOM_HPP
#define COMMIT_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace commit {

// Fills dest from the OpenSSL CSPRNG, throws std::runtime_error if it is not seeded
void GenerateSecureBytes(std::span<uint8_t> dest);

// Unbiased draw from [0, range) on top of GenerateSecureBytes
uint32_t GenerateSecureUniform(uint32_t range);

} // namespace commit

#endif // COMMIT_SECURERANDOM_HPP
