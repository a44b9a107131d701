#ifndef DICE_DIE_HPP
#define DICE_DIE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace dice {
class IEngine;

inline constexpr size_t FACE_COUNT = 6;
inline constexpr size_t MIN_DICE = 3;

using Faces = std::array<int32_t, FACE_COUNT>;

// Immutable face set. Faces may repeat and may be negative.
class Die
{
public:
   explicit Die(const Faces & faces) noexcept
      : m_faces(faces)
   {}

   const Faces & GetFaces() const noexcept { return m_faces; }

   // One of the stored faces, each slot with probability 1/FACE_COUNT
   int32_t Roll(IEngine & engine) const;

   bool operator==(const Die & other) const = default;

private:
   Faces m_faces;
};

using DiceSet = std::vector<Die>;

// Renders as "2,2,4,4,9,9", picked up by fmt::Format through ADL
std::span<char> WriteAsText(const Die & die, std::span<char> dest);

} // namespace dice

#endif // DICE_DIE_HPP
