#include "utils.hpp"
#include "errors.hpp"
#include <zlib.h>
#include <cstdio> // std::rename, std::remove
#include <fstream>
#include <stdexcept>

uint32_t calculate_crc(const uint8_t* type, const uint8_t* data, size_t length) {
    uLong crc = crc32(0L, Z_NULL, 0);                  // Start CRC
    crc = crc32(crc, reinterpret_cast<const Bytef*>(type), 4);  // Chunk type
    // zlib treats a null buffer as a request for the initial value,
    // and takes at most uInt bytes per call
    const size_t block = 1u << 30;
    while (length > 0) {
        size_t part = length < block ? length : block;
        crc = crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(part)); // Chunk data
        data += part;
        length -= part;
    }
    return static_cast<uint32_t>(crc);
}


uint32_t toChunkLength(size_t size) {
    if (static_cast<unsigned long long>(size) > 0xFFFFFFFFull)
        throw MalformedInputError("invalid length: chunk data of " + std::to_string(size) +
                                  " bytes does not fit 32 bits");
    return static_cast<uint32_t>(size);
}


uint32_t readBigEndian(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           (static_cast<uint32_t>(data[3]));
}


void appendBigEndian(std::vector<uint8_t>& output, uint32_t value) {
    output.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    output.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    output.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    output.push_back(static_cast<uint8_t>(value & 0xFF));
}


bool isValidUtf8(const uint8_t* data, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t lead = data[i];
        size_t extra = 0;
        uint32_t codePoint = 0;
        uint32_t minimum = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = lead & 0x07;
            minimum = 0x10000;
        } else {
            return false; // continuation byte or 0xF8..0xFF as lead
        }

        if (length - i <= extra)
            return false;

        for (size_t k = 1; k <= extra; ++k) {
            uint8_t next = data[i + k];
            if ((next & 0xC0) != 0x80)
                return false;
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        if (codePoint < minimum || codePoint > 0x10FFFF)
            return false;
        if (codePoint >= 0xD800 && codePoint <= 0xDFFF)
            return false;

        i += extra + 1;
    }
    return true;
}


std::vector<uint8_t> readFileBytes(const std::string& path) {
    std::ifstream fs(path.c_str(), std::ios::in | std::ios::binary | std::ios::ate);
    if (!fs)
        throw std::runtime_error("could not open file " + path);

    std::streamoff size = fs.tellg();
    if (size < 0)
        throw std::runtime_error("could not read file " + path);

    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    fs.seekg(0, std::ios::beg);
    if (!bytes.empty())
        fs.read(reinterpret_cast<char*>(&bytes[0]), size);
    if (!fs)
        throw std::runtime_error("could not read file " + path);

    return bytes;
}


void writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes) {
    std::string tempPath = path + ".tmp";
    {
        std::ofstream output(tempPath.c_str(), std::ios::out | std::ios::binary | std::ios::trunc);
        if (!output.is_open())
            throw std::runtime_error("could not open output file " + tempPath);
        if (!bytes.empty())
            output.write(reinterpret_cast<const char*>(&bytes[0]), static_cast<std::streamsize>(bytes.size()));
        output.close();
        if (!output) {
            std::remove(tempPath.c_str());
            throw std::runtime_error("could not write file " + tempPath);
        }
    }

    if (std::rename(tempPath.c_str(), path.c_str()) != 0) {
        std::remove(tempPath.c_str());
        throw std::runtime_error("could not replace file " + path);
    }
}
