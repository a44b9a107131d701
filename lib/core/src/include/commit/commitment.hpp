#ifndef COMMIT_COMMITMENT_HPP
#define COMMIT_COMMITMENT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace commit {

inline constexpr size_t KEY_SIZE = 32;
inline constexpr size_t TAG_SIZE = 32;

using Key = std::array<uint8_t, KEY_SIZE>;
using Tag = std::array<uint8_t, TAG_SIZE>;

// HMAC-SHA3-256 over the decimal representation of value
Tag ComputeTag(std::span<const uint8_t> key, uint32_t value);

std::string ToHex(std::span<const uint8_t> bytes);
std::optional<std::vector<uint8_t>> FromHex(std::string_view hex);

// Recomputes the tag from disclosed artifacts, the way an observer would check a reveal
bool VerifyCommitment(std::string_view tagHex, std::string_view keyHex, uint32_t value);

struct Disclosure
{
   uint32_t value;
   Key key;
};

// A secret value bound to a published tag. Only Draw() creates one, so every commitment
// carries a fresh key and a fresh value.
class Commitment
{
public:
   static Commitment Draw(uint32_t range);

   Commitment(Commitment && other) noexcept = default;
   Commitment & operator=(Commitment && other) noexcept = default;
   Commitment(const Commitment &) = delete;
   Commitment & operator=(const Commitment &) = delete;
   ~Commitment();

   uint32_t GetRange() const noexcept { return m_range; }
   const Tag & GetTag() const noexcept { return m_tag; }

   // Hand out the secret. Callers must not do this before the counterparty has committed.
   Disclosure Open() const noexcept { return Disclosure{m_value, m_key}; }

private:
   explicit Commitment(uint32_t range);

   uint32_t m_range;
   uint32_t m_value;
   Key m_key;
   Tag m_tag;
};

} // namespace commit

#endif // COMMIT_COMMITMENT_HPP
