#include "Chunk.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <utility> // std::move

namespace {

uint32_t crcOf(const ChunkType& chunkType, const std::vector<uint8_t>& data) {
    std::array<uint8_t, 4> type = chunkType.getBytes();
    return calculate_crc(type.data(), data.empty() ? nullptr : &data[0], data.size());
}

} // namespace

const size_t Chunk::OVERHEAD;

Chunk::Chunk(uint32_t length, const ChunkType& chunkType, std::vector<uint8_t> data, uint32_t crc)
    : length(length), chunkType(chunkType), data(std::move(data)), crc(crc) {
}


Chunk::Chunk(const ChunkType& chunkType, std::vector<uint8_t> data)
    : length(toChunkLength(data.size())), chunkType(chunkType), data(std::move(data)), crc(0) {
    this->crc = crcOf(this->chunkType, this->data);
}


Chunk Chunk::decode(const uint8_t* buffer, size_t size) {
    if (size < OVERHEAD)
        throw MalformedInputError("invalid length: chunk needs at least 12 bytes, got " +
                                  std::to_string(size));

    uint32_t length = readBigEndian(buffer);

    // Type bytes lie within the 12 byte minimum, so they are checked first
    std::array<uint8_t, 4> typeBytes;
    for (size_t i = 0; i < 4; ++i)
        typeBytes[i] = buffer[4 + i];
    ChunkType chunkType(typeBytes);

    // Length field is only trusted as a slicing boundary
    if (size - OVERHEAD < length)
        throw MalformedInputError("invalid length: chunk declares " + std::to_string(length) +
                                  " data bytes but only " + std::to_string(size - OVERHEAD) +
                                  " remain");

    const uint8_t* dataStart = buffer + 8;
    std::vector<uint8_t> data(dataStart, dataStart + length);

    uint32_t crc = readBigEndian(dataStart + length);
    uint32_t expectedCrc = crcOf(chunkType, data);
    if (crc != expectedCrc)
        throw IntegrityError("invalid crc");

    return Chunk(length, chunkType, std::move(data), crc);
}


Chunk Chunk::decode(const std::vector<uint8_t>& buffer) {
    if (buffer.empty())
        return decode(nullptr, 0);
    return decode(&buffer[0], buffer.size());
}


uint32_t Chunk::getLength() const {
    return this->length;
}


const ChunkType& Chunk::getType() const {
    return this->chunkType;
}


const std::vector<uint8_t>& Chunk::getData() const {
    return this->data;
}


uint32_t Chunk::getCrc() const {
    return this->crc;
}


std::string Chunk::dataAsString() const {
    if (!isValidUtf8(this->data.empty() ? nullptr : &this->data[0], this->data.size()))
        throw EncodingError("chunk data is not valid UTF-8");
    return std::string(this->data.begin(), this->data.end());
}


std::vector<uint8_t> Chunk::asBytes() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(OVERHEAD + this->data.size());

    appendBigEndian(bytes, this->length);
    std::array<uint8_t, 4> type = this->chunkType.getBytes();
    bytes.insert(bytes.end(), type.begin(), type.end());
    bytes.insert(bytes.end(), this->data.begin(), this->data.end());
    appendBigEndian(bytes, this->crc);

    return bytes;
}


bool Chunk::operator==(const Chunk& other) const {
    return this->length == other.length &&
           this->chunkType == other.chunkType &&
           this->data == other.data &&
           this->crc == other.crc;
}


bool Chunk::operator!=(const Chunk& other) const {
    return !(*this == other);
}


std::ostream& operator<<(std::ostream& os, const Chunk& chunk) {
    os << "Chunk {" << '\n';
    os << "   Length: " << chunk.getLength() << '\n';
    os << "   Type: " << chunk.getType() << '\n';
    os << "   Data: " << chunk.getData().size() << " bytes" << '\n';
    os << "   Crc: " << chunk.getCrc() << '\n';
    os << "}" << '\n';
    return os;
}
