#include "ChunkType.hpp"
#include "errors.hpp"
#include "utils.hpp"

namespace {

inline bool isUpper(uint8_t c) {
    return c >= 'A' && c <= 'Z';
}

inline bool isLower(uint8_t c) {
    return c >= 'a' && c <= 'z';
}

inline bool isLetter(uint8_t c) {
    return isUpper(c) || isLower(c);
}

} // namespace

ChunkType::ChunkType(const std::array<uint8_t, 4>& bytes) : type(bytes) {
    for (size_t i = 0; i < this->type.size(); ++i) {
        if (!isLetter(this->type[i]))
            throw InvalidFormatError("invalid chunk type: byte " + std::to_string(i) +
                                     " is not an ASCII letter");
    }
}


ChunkType ChunkType::fromString(const std::string& text) {
    if (text.size() != 4)
        throw InvalidFormatError("invalid chunk type \"" + text + "\": expected 4 characters");

    std::array<uint8_t, 4> bytes;
    for (size_t i = 0; i < 4; ++i)
        bytes[i] = static_cast<uint8_t>(text[i]);
    return ChunkType(bytes);
}


std::array<uint8_t, 4> ChunkType::getBytes() const {
    return this->type;
}


bool ChunkType::isCritical() const {
    return isUpper(this->type[0]);
}


bool ChunkType::isPublic() const {
    return isUpper(this->type[1]);
}


bool ChunkType::isReservedBitValid() const {
    return isUpper(this->type[2]);
}


bool ChunkType::isSafeToCopy() const {
    return isLower(this->type[3]);
}


bool ChunkType::isValid() const {
    return isReservedBitValid();
}


std::string ChunkType::toString() const {
    if (!isValidUtf8(this->type.data(), this->type.size()))
        throw EncodingError("chunk type is not valid UTF-8");
    return std::string(this->type.begin(), this->type.end());
}


bool ChunkType::operator==(const ChunkType& other) const {
    return this->type == other.type;
}


bool ChunkType::operator!=(const ChunkType& other) const {
    return !(*this == other);
}


std::ostream& operator<<(std::ostream& os, const ChunkType& chunkType) {
    return os << chunkType.toString();
}
