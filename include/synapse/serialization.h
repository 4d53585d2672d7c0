/**
 * @file synapse/serialization.h
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

#ifndef SYNAPSE_SERIALIZATION_H
#define SYNAPSE_SERIALIZATION_H 1

#include <cstddef>
#include <cstdint>
#include <string>

namespace synapse {

// Number of expansion flags terminating a record.
constexpr std::size_t kExpansionFlagCount = 8;

// Appends fields to a byte string in host byte order.
//
// Records are only ever read back on the machine that wrote them.
// Only fixed width types may be added: a record written by a 32 bit
// build must be readable by a 64 bit one.
struct CacheableWriter
{
    explicit CacheableWriter(std::string& d);

    std::string& dest;

    // Strings longer than 64KiB are truncated.
    void serializestring(const std::string& field);

    // For strings that may exceed 64KiB, such as paths.
    void serializestring_u32(const std::string& field);

    void serializeu8(uint8_t field);
    void serializeu32(uint32_t field);
    void serializeu64(uint64_t field);

    // Terminates a record that may be extended later.
    //
    // A newer build that adds fields sets the next flag to say so.
    void serializeexpansionflags(bool b1 = false, bool b2 = false, bool b3 = false, bool b4 = false,
                                 bool b5 = false, bool b6 = false, bool b7 = false, bool b8 = false);

private:
    template<typename T>
    void serializescalar(T field);
};

// Reads fields written by CacheableWriter.
//
// Every method returns false, without consuming anything, when the
// remaining input can't hold the requested field.
struct CacheableReader
{
    explicit CacheableReader(const std::string& d);

    const char* ptr;
    const char* end;

    // How many fields have been read?
    unsigned fieldnum;

    bool unserializestring(std::string& s);
    bool unserializestring_u32(std::string& s);

    bool unserializeu8(uint8_t& field);
    bool unserializeu32(uint32_t& field);
    bool unserializeu64(uint64_t& field);

    // Fails if a flag beyond usedFlagCount is set, meaning the record
    // was written by a newer build.
    bool unserializeexpansionflags(unsigned char field[kExpansionFlagCount], unsigned usedFlagCount);

    bool hasdataleft() const { return end > ptr; }

private:
    // How many bytes remain?
    std::size_t available() const;

    // Read a string prefixed by a length of type L.
    template<typename L>
    bool unserializeprefixed(std::string& s);

    template<typename T>
    bool unserializescalar(T& field);
};

} // namespace

#endif
