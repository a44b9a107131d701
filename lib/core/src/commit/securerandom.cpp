#include "commit/securerandom.hpp"

#include "utils/format.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <array>
#include <climits>
#include <limits>
#include <stdexcept>

namespace commit {

void GenerateSecureBytes(std::span<uint8_t> dest)
{
   if (dest.empty())
      return;
   if (dest.size() > static_cast<size_t>(INT_MAX))
      throw std::length_error("Too many random bytes requested");

   if (RAND_bytes(dest.data(), static_cast<int>(dest.size())) != 1)
      throw std::runtime_error(
         fmt::ToString("RAND_bytes() failed, OpenSSL error {}", ERR_get_error()));
}

uint32_t GenerateSecureUniform(uint32_t range)
{
   if (range == 0)
      throw std::invalid_argument("Range must not be empty");

   // reject the tail that would make lower values more likely
   constexpr uint64_t span = uint64_t(std::numeric_limits<uint32_t>::max()) + 1;
   const uint64_t limit = span - span % range;

   for (;;) {
      std::array<uint8_t, sizeof(uint32_t)> bytes{};
      GenerateSecureBytes(bytes);
      uint32_t candidate = 0;
      for (uint8_t byte : bytes)
         candidate = (candidate << 8) | byte;
      if (candidate < limit)
         return candidate % range;
   }
}

} // namespace commit
