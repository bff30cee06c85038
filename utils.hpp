#pragma once
#ifndef UTILS_HPP
#define UTILS_HPP

#include <stdint.h> // uint8_t, uint32_t
#include <stddef.h> // size_t
#include <string>
#include <vector>

/*Calculates crc of chunk (CRC-32/ISO-HDLC over type and data)*/
uint32_t calculate_crc(const uint8_t* type, const uint8_t* data, size_t length);

/*Checks that size fits the 32 bit chunk length field; throws MalformedInputError*/
uint32_t toChunkLength(size_t size);

/*Reads big endian value from the first 4 bytes of data*/
uint32_t readBigEndian(const uint8_t* data);

/*Appends value to output as 4 big endian bytes*/
void appendBigEndian(std::vector<uint8_t>& output, uint32_t value);

/* Checks that bytes form well formed UTF-8:
   no overlong forms, no surrogates (U+D800..U+DFFF),
   nothing above U+10FFFF, no truncated sequences */
bool isValidUtf8(const uint8_t* data, size_t length);

/*Reads whole file into memory; throws std::runtime_error on failure*/
std::vector<uint8_t> readFileBytes(const std::string& path);

/* Replaces file content with bytes.
   Writes "<path>.tmp" first and renames it over path,
   so readers never see a half written image */
void writeFileBytes(const std::string& path, const std::vector<uint8_t>& bytes);

#endif
