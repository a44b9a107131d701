#include "dice/engine.hpp"

#include <random>
#include <stdexcept>

using namespace dice;

namespace {

class UniformEngine : public IEngine
{
public:
   UniformEngine()
      : m_rd()
      , m_generator(m_rd())
   {}
   size_t GenerateIndex(size_t size) override
   {
      if (size == 0)
         throw std::invalid_argument("Cannot pick from an empty range");
      std::uniform_int_distribution<size_t> dist(0, size - 1);
      return dist(m_generator);
   }

private:
   std::random_device m_rd;
   std::mt19937 m_generator;
};

} // namespace

namespace dice {

std::unique_ptr<IEngine> CreateUniformEngine()
{
   return std::make_unique<UniformEngine>();
}

} // namespace dice
