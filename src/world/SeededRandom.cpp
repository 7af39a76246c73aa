#include "world/SeededRandom.h"

#include <cmath>

namespace world
{

namespace
{

/// Decodes the UTF-8 sequence at index. A malformed sequence yields its lead byte.
std::uint32_t nextCodePoint(const std::string &text, std::size_t &index)
{
    const auto lead = static_cast<unsigned char>(text[index++]);
    std::size_t extra = 0;
    std::uint32_t codePoint = lead;
    if ((lead & 0xE0u) == 0xC0u)
    {
        extra = 1;
        codePoint = lead & 0x1Fu;
    }
    else if ((lead & 0xF0u) == 0xE0u)
    {
        extra = 2;
        codePoint = lead & 0x0Fu;
    }
    else if ((lead & 0xF8u) == 0xF0u)
    {
        extra = 3;
        codePoint = lead & 0x07u;
    }
    if (extra == 0 || index + extra > text.size())
    {
        return lead;
    }
    for (std::size_t i = 0; i < extra; ++i)
    {
        const auto next = static_cast<unsigned char>(text[index + i]);
        if ((next & 0xC0u) != 0x80u)
        {
            return lead;
        }
        codePoint = (codePoint << 6) | (next & 0x3Fu);
    }
    index += extra;
    return codePoint;
}

} // namespace

// Hashes UTF-16 code units so non-ASCII room codes agree with the web client.
std::uint32_t hashSeed(const std::string &seed)
{
    std::uint32_t h = 0;
    std::size_t index = 0;
    while (index < seed.size())
    {
        const std::uint32_t codePoint = nextCodePoint(seed, index);
        if (codePoint > 0xFFFFu)
        {
            const std::uint32_t offset = codePoint - 0x10000u;
            h = h * 31u + (0xD800u + (offset >> 10));
            h = h * 31u + (0xDC00u + (offset & 0x3FFu));
        }
        else
        {
            h = h * 31u + codePoint;
        }
    }
    const auto signedHash = static_cast<std::int32_t>(h);
    const std::int64_t magnitude = signedHash < 0 ? -static_cast<std::int64_t>(signedHash) : signedHash;
    return static_cast<std::uint32_t>(magnitude);
}

double SeededRandom::random()
{
    ++m_draws;
    m_state += 0x6D2B79F5u;
    std::uint32_t t = m_state;
    t = (t ^ (t >> 15)) * (t | 1u);
    t ^= t + (t ^ (t >> 7)) * (t | 61u);
    return static_cast<double>(t ^ (t >> 14)) / 4294967296.0;
}

int SeededRandom::randomInt(int min, int max)
{
    return static_cast<int>(std::floor(random() * static_cast<double>(max - min))) + min;
}

} // namespace world
