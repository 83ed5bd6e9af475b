#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace o2d
{

// A box with a negative or non finite extent was passed to the engine
class InvalidInputError : public std::runtime_error
{
  public:
    InvalidInputError(std::size_t index, const std::string& reason)
        : std::runtime_error("Invalid AABB at index " + std::to_string(index) + ": " + reason),
          mIndex(index)
    {
    }

    std::size_t index() const
    {
        return mIndex;
    }

  private:
    std::size_t mIndex;
};

// Rejected engine configuration
class ConfigurationError : public std::runtime_error
{
  public:
    explicit ConfigurationError(const std::string& reason) : std::runtime_error("Invalid configuration: " + reason) {}
};

} // namespace o2d
