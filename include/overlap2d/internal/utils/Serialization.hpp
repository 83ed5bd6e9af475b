#pragma once

#ifdef O2D_USE_CEREAL
#include <cereal/cereal.hpp>
#include <cereal/types/array.hpp>
#include <cereal/types/chrono.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>
#endif

#include <bit>
#include <concepts>
#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace o2d
{

class Writer
{
  public:
    Writer(std::ostream& out) : mOut(out) {}

    template <typename T>
        requires std::is_trivially_copyable_v<T>
    Writer& write(const T& v)
    {
        mOut.write(std::bit_cast<const char*>(&v), sizeof(T));
        if (!mOut)
            throw std::runtime_error("Failed to write to output stream");
        return *this;
    }

    Writer& write(const std::string& s)
    {
        write(static_cast<uint64_t>(s.size()));
        mOut.write(s.data(), static_cast<std::streamsize>(s.size()));
        if (!mOut)
            throw std::runtime_error("Failed to write to output stream");
        return *this;
    }

    template <typename T>
    Writer& operator<<(const T& v)
    {
        return write(v);
    }

    template <typename T>
    Writer& operator()(const T& v)
    {
        return write(v);
    }

  private:
    std::ostream& mOut;
};

class Reader
{
  public:
    Reader(std::istream& in) : mIn(in) {}

    template <typename T>
        requires std::is_trivially_copyable_v<T>
    Reader& read(T& v)
    {
        mIn.read(std::bit_cast<char*>(&v), sizeof(T));
        if (!mIn)
            throw std::runtime_error("Unexpected end of input stream");
        return *this;
    }

    Reader& read(std::string& s)
    {
        uint64_t size = 0;
        read(size);
        s.resize(size);
        mIn.read(s.data(), static_cast<std::streamsize>(size));
        if (!mIn)
            throw std::runtime_error("Unexpected end of input stream");
        return *this;
    }

    template <typename T>
    Reader& operator>>(T& v)
    {
        return read(v);
    }

    template <typename T>
    Reader& operator()(T& v)
    {
        return read(v);
    }

  private:
    std::istream& mIn;
};

#ifdef O2D_USE_CEREAL
template <typename T>
concept IsCerealArchive =
    std::derived_from<T, cereal::detail::OutputArchiveBase> || std::derived_from<T, cereal::detail::InputArchiveBase>;
#endif

} // namespace o2d
