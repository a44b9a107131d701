#include "dice/die.hpp"
#include "dice/engine.hpp"

#include "utils/format.hpp"

namespace dice {

int32_t Die::Roll(IEngine & engine) const
{
   return m_faces.at(engine.GenerateIndex(m_faces.size()));
}

std::span<char> WriteAsText(const Die & die, std::span<char> dest)
{
   const Faces & faces = die.GetFaces();
   dest = fmt::Format(dest, "{}", faces[0]);
   for (size_t i = 1; i < faces.size() && !dest.empty(); ++i)
      dest = fmt::Format(dest, ",{}", faces[i]);
   return dest;
}

} // namespace dice
