#pragma once
#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/*Base of every error raised while decoding or editing a PNG*/
class PngError : public std::runtime_error {
    public:
        explicit PngError(const std::string& message) : std::runtime_error(message) {}
};

/*Bad chunk type code, bad signature or bad type text length*/
class InvalidFormatError : public PngError {
    public:
        explicit InvalidFormatError(const std::string& message) : PngError(message) {}
};

/*Buffer too short for the structure it declares*/
class MalformedInputError : public PngError {
    public:
        explicit MalformedInputError(const std::string& message) : PngError(message) {}
};

/*Stored crc differs from the computed one*/
class IntegrityError : public PngError {
    public:
        explicit IntegrityError(const std::string& message) : PngError(message) {}
};

/*Bytes are not valid UTF-8 text*/
class EncodingError : public PngError {
    public:
        explicit EncodingError(const std::string& message) : PngError(message) {}
};

class NotFoundError : public PngError {
    public:
        explicit NotFoundError(const std::string& message) : PngError(message) {}
};

#endif
