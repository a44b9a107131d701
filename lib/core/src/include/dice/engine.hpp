#ifndef DICE_ENGINE_HPP
#define DICE_ENGINE_HPP

#include <cstddef>
#include <memory>

namespace dice {

class IEngine
{
public:
   virtual ~IEngine() = default;

   // Uniformly distributed in [0, size)
   virtual size_t GenerateIndex(size_t size) = 0;
};

std::unique_ptr<IEngine> CreateUniformEngine();

} // namespace dice

#endif // DICE_ENGINE_HPP
