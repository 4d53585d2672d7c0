/**
 * @file serialization.cpp
 * @brief Compact binary field serialization for persisted records
 *
 * (c) 2026 by the Synapse transfer engine authors
 *
 * This file is part of the Synapse transfer engine.
 *
 * The Synapse transfer engine is distributed in the hope that it will be
 * useful, but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 *
 * @copyright Simplified (2-clause) BSD License.
 *
 * You should have received a copy of the license along with this
 * program.
 */

#include "synapse/serialization.h"

#include <algorithm>
#include <cstring>
#include <limits>

namespace synapse {

CacheableWriter::CacheableWriter(std::string& d)
  : dest(d)
{
}

template<typename T>
void CacheableWriter::serializescalar(T field)
{
    dest.append(reinterpret_cast<const char*>(&field), sizeof(field));
}

void CacheableWriter::serializestring(const std::string& field)
{
    auto length = std::min<std::size_t>(field.size(), std::numeric_limits<uint16_t>::max());

    serializescalar(static_cast<uint16_t>(length));

    dest.append(field.data(), length);
}

void CacheableWriter::serializestring_u32(const std::string& field)
{
    serializescalar(static_cast<uint32_t>(field.size()));

    dest.append(field);
}

void CacheableWriter::serializeu8(uint8_t field)
{
    serializescalar(field);
}

void CacheableWriter::serializeu32(uint32_t field)
{
    serializescalar(field);
}

void CacheableWriter::serializeu64(uint64_t field)
{
    serializescalar(field);
}

void CacheableWriter::serializeexpansionflags(bool b1, bool b2, bool b3, bool b4,
                                              bool b5, bool b6, bool b7, bool b8)
{
    const bool flags[kExpansionFlagCount] = {b1, b2, b3, b4, b5, b6, b7, b8};

    for (auto flag : flags)
        dest.push_back(flag ? '\1' : '\0');
}

CacheableReader::CacheableReader(const std::string& d)
  : ptr(d.data())
  , end(d.data() + d.size())
  , fieldnum(0)
{
}

std::size_t CacheableReader::available() const
{
    return static_cast<std::size_t>(end - ptr);
}

template<typename T>
bool CacheableReader::unserializescalar(T& field)
{
    if (available() < sizeof(field))
        return false;

    std::memcpy(&field, ptr, sizeof(field));

    ptr += sizeof(field);
    ++fieldnum;

    return true;
}

template<typename L>
bool CacheableReader::unserializeprefixed(std::string& s)
{
    L length;

    if (available() < sizeof(length))
        return false;

    std::memcpy(&length, ptr, sizeof(length));

    if (available() - sizeof(length) < length)
        return false;

    s.assign(ptr + sizeof(length), length);

    ptr += sizeof(length) + length;
    ++fieldnum;

    return true;
}

bool CacheableReader::unserializestring(std::string& s)
{
    return unserializeprefixed<uint16_t>(s);
}

bool CacheableReader::unserializestring_u32(std::string& s)
{
    return unserializeprefixed<uint32_t>(s);
}

bool CacheableReader::unserializeu8(uint8_t& field)
{
    return unserializescalar(field);
}

bool CacheableReader::unserializeu32(uint32_t& field)
{
    return unserializescalar(field);
}

bool CacheableReader::unserializeu64(uint64_t& field)
{
    return unserializescalar(field);
}

bool CacheableReader::unserializeexpansionflags(unsigned char field[kExpansionFlagCount],
                                                unsigned usedFlagCount)
{
    if (available() < kExpansionFlagCount)
        return false;

    // Written by a build that knows about fields we don't.
    for (auto i = static_cast<std::size_t>(usedFlagCount); i < kExpansionFlagCount; ++i)
    {
        if (ptr[i])
            return false;
    }

    std::memcpy(field, ptr, kExpansionFlagCount);

    ptr += kExpansionFlagCount;
    ++fieldnum;

    return true;
}

} // namespace
