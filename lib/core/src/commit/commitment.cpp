#include "commit/commitment.hpp"
#include "commit/securerandom.hpp"

#include "utils/format.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <charconv>
#include <stdexcept>

namespace commit {

Tag ComputeTag(std::span<const uint8_t> key, uint32_t value)
{
   std::array<char, 16> message{};
   const auto [last, _] = std::to_chars(message.data(), message.data() + message.size(), value);
   const size_t length = static_cast<size_t>(last - message.data());

   Tag tag{};
   unsigned int tagLength = 0;
   const unsigned char * result = HMAC(EVP_sha3_256(),
                                       key.data(),
                                       static_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char *>(message.data()),
                                       length,
                                       tag.data(),
                                       &tagLength);
   if (!result || tagLength != tag.size())
      throw std::runtime_error("HMAC-SHA3-256 computation failed");
   return tag;
}

std::string ToHex(std::span<const uint8_t> bytes)
{
   return fmt::ToString("{}", fmt::Hex{bytes});
}

std::optional<std::vector<uint8_t>> FromHex(std::string_view hex)
{
   if (hex.size() % 2 != 0)
      return std::nullopt;

   std::vector<uint8_t> bytes(hex.size() / 2);
   for (size_t i = 0; i < bytes.size(); ++i) {
      const char * first = hex.data() + 2 * i;
      const auto [ptr, ec] = std::from_chars(first, first + 2, bytes[i], 16);
      if (ec != std::errc{} || ptr != first + 2)
         return std::nullopt;
   }
   return bytes;
}

bool VerifyCommitment(std::string_view tagHex, std::string_view keyHex, uint32_t value)
{
   auto tag = FromHex(tagHex);
   auto key = FromHex(keyHex);
   if (!tag || !key || tag->size() != TAG_SIZE || key->size() != KEY_SIZE)
      return false;

   const Tag expected = ComputeTag(*key, value);
   return CRYPTO_memcmp(expected.data(), tag->data(), TAG_SIZE) == 0;
}

Commitment Commitment::Draw(uint32_t range)
{
   return Commitment(range);
}

Commitment::Commitment(uint32_t range)
   : m_range(range)
   , m_value(GenerateSecureUniform(range))
   , m_key{}
   , m_tag{}
{
   GenerateSecureBytes(m_key);
   m_tag = ComputeTag(m_key, m_value);
}

Commitment::~Commitment()
{
   OPENSSL_cleanse(m_key.data(), m_key.size());
}

} // namespace commit
