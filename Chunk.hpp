#pragma once
#ifndef CHUNK_HPP
#define CHUNK_HPP

#include <ostream>
#include <string>
#include <vector>
#include <stddef.h>
#include <stdint.h>
#include "ChunkType.hpp"

/* PNG chunk record as stored in the file:
    Length:  4 bytes, big endian, size of data only
    Type:    4 bytes
    Data:    length bytes
    CRC:     4 bytes, big endian, over type and data */
class Chunk {
    uint32_t length;
    ChunkType chunkType;
    std::vector<uint8_t> data;
    uint32_t crc;

    Chunk(uint32_t length, const ChunkType& chunkType, std::vector<uint8_t> data, uint32_t crc);
    public:
        static const size_t OVERHEAD = 12; // length + type + crc

        /* Creates chunk and computes its crc.
           Data must fit the 32 bit length field;
           larger payloads throw MalformedInputError */
        Chunk(const ChunkType& chunkType, std::vector<uint8_t> data);

        /* Decodes one chunk from the start of buffer.
           Bytes following the chunk are left untouched.
           Throws MalformedInputError, InvalidFormatError or IntegrityError */
        static Chunk decode(const uint8_t* buffer, size_t size);
        static Chunk decode(const std::vector<uint8_t>& buffer);

        uint32_t getLength() const;
        const ChunkType& getType() const;
        const std::vector<uint8_t>& getData() const;
        uint32_t getCrc() const;

        /*Throws EncodingError if data is not UTF-8*/
        std::string dataAsString() const;

        /*Wire representation, 12 + length bytes*/
        std::vector<uint8_t> asBytes() const;

        bool operator==(const Chunk& other) const;
        bool operator!=(const Chunk& other) const;
};

std::ostream& operator<<(std::ostream& os, const Chunk& chunk);

#endif
