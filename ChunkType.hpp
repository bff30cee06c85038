#pragma once
#ifndef CHUNK_TYPE_HPP
#define CHUNK_TYPE_HPP

#include <array>
#include <ostream>
#include <string>
#include <stdint.h>

/* Four letter chunk type code, e.g. IHDR, IDAT, tEXt.
   Case of each letter carries one property bit:
     byte 0 upper => critical      (lower => ancillary)
     byte 1 upper => public        (lower => private)
     byte 2 upper => reserved bit valid
     byte 3 lower => safe to copy */
class ChunkType {
    std::array<uint8_t, 4> type;
    public:
        /*Throws InvalidFormatError if any byte is not an ASCII letter*/
        explicit ChunkType(const std::array<uint8_t, 4>& bytes);

        /*Throws InvalidFormatError unless text is exactly 4 ASCII letters*/
        static ChunkType fromString(const std::string& text);

        std::array<uint8_t, 4> getBytes() const;

        bool isCritical() const;
        bool isPublic() const;
        bool isReservedBitValid() const;
        bool isSafeToCopy() const;

        /*Constructed types are letters only; validity also needs the reserved bit*/
        bool isValid() const;

        /*Throws EncodingError if the bytes are not UTF-8*/
        std::string toString() const;

        bool operator==(const ChunkType& other) const;
        bool operator!=(const ChunkType& other) const;
};

std::ostream& operator<<(std::ostream& os, const ChunkType& chunkType);

#endif
