#include "Image.hpp"
#include "errors.hpp"
#include <algorithm>
#include <utility> // std::move

const std::array<uint8_t, 8> Image::SIGNATURE = {{137, 80, 78, 71, 13, 10, 26, 10}};

Image::Image() {
}


Image::Image(std::vector<Chunk> chunks) : chunks(std::move(chunks)) {
}


Image Image::decode(const uint8_t* buffer, size_t size) {
    if (size < SIGNATURE.size() || !std::equal(SIGNATURE.begin(), SIGNATURE.end(), buffer))
        throw InvalidFormatError("invalid header");

    Image image;
    size_t offset = SIGNATURE.size();
    while (offset < size) {
        Chunk chunk = Chunk::decode(buffer + offset, size - offset);
        offset += Chunk::OVERHEAD + chunk.getLength();
        image.chunks.push_back(std::move(chunk));
    }
    return image;
}


Image Image::decode(const std::vector<uint8_t>& buffer) {
    if (buffer.empty())
        return decode(nullptr, 0);
    return decode(&buffer[0], buffer.size());
}


void Image::addChunk(Chunk chunk) {
    this->chunks.push_back(std::move(chunk));
}


Chunk Image::removeChunk(const std::string& type) {
    ChunkType chunkType = ChunkType::fromString(type);

    for (std::vector<Chunk>::iterator it = this->chunks.begin(); it != this->chunks.end(); ++it) {
        if (it->getType() == chunkType) {
            Chunk removed = std::move(*it);
            this->chunks.erase(it);
            return removed;
        }
    }
    throw NotFoundError("no such chunk");
}


const Chunk* Image::findChunk(const std::string& type) const {
    ChunkType chunkType = ChunkType::fromString(type);

    for (const auto& chunk : this->chunks) {
        if (chunk.getType() == chunkType)
            return &chunk;
    }
    return nullptr;
}


const std::vector<Chunk>& Image::getChunks() const {
    return this->chunks;
}


std::vector<uint8_t> Image::asBytes() const {
    size_t total = SIGNATURE.size();
    for (const auto& chunk : this->chunks)
        total += Chunk::OVERHEAD + chunk.getLength();

    std::vector<uint8_t> bytes;
    bytes.reserve(total);
    bytes.insert(bytes.end(), SIGNATURE.begin(), SIGNATURE.end());
    for (const auto& chunk : this->chunks) {
        std::vector<uint8_t> chunkBytes = chunk.asBytes();
        bytes.insert(bytes.end(), chunkBytes.begin(), chunkBytes.end());
    }
    return bytes;
}


std::ostream& operator<<(std::ostream& os, const Image& image) {
    os << "Image {" << '\n';
    os << "   Chunks: " << image.getChunks().size() << '\n';
    for (const auto& chunk : image.getChunks())
        os << chunk;
    os << "}" << '\n';
    return os;
}
