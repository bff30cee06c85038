#pragma once
#ifndef IMAGE_HPP
#define IMAGE_HPP

#include <array>
#include <ostream>
#include <string>
#include <vector>
#include <stddef.h>
#include <stdint.h>
#include "Chunk.hpp"

/* PNG file: 8 byte signature followed by chunks, in file order.
   No ordering rules (IHDR first, IEND last, ...) are enforced
   when chunks are added or removed. */
class Image {
    std::vector<Chunk> chunks;
    public:
        static const std::array<uint8_t, 8> SIGNATURE;

        Image();
        explicit Image(std::vector<Chunk> chunks);

        /* Decodes the whole buffer; every byte after the signature must
           belong to a chunk. Throws InvalidFormatError ("invalid header")
           and any error of Chunk::decode */
        static Image decode(const uint8_t* buffer, size_t size);
        static Image decode(const std::vector<uint8_t>& buffer);

        void addChunk(Chunk chunk);

        /*Removes and returns the first chunk of given type; throws NotFoundError*/
        Chunk removeChunk(const std::string& type);

        /*First chunk of given type, nullptr if there is none*/
        const Chunk* findChunk(const std::string& type) const;

        /*Invalidated by addChunk and removeChunk*/
        const std::vector<Chunk>& getChunks() const;

        std::vector<uint8_t> asBytes() const;
};

std::ostream& operator<<(std::ostream& os, const Image& image);

#endif
