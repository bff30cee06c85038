#include <array>
#include <sstream>
#include <string>
#include "minitest.hpp"
#include "../ChunkType.hpp"
#include "../errors.hpp"

static std::array<uint8_t, 4> bytesOf(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
    std::array<uint8_t, 4> bytes = {{a, b, c, d}};
    return bytes;
}

static void fromBytes() {
    ChunkType type(bytesOf(82, 117, 83, 116));
    check(type.getBytes() == bytesOf(82, 117, 83, 116), "type.getBytes() == bytesOf(82, 117, 83, 116)");
}

static void fromString() {
    check(ChunkType::fromString("RuSt") == ChunkType(bytesOf(82, 117, 83, 116)), "ChunkType::fromString(\"RuSt\") == ChunkType(bytesOf(82, 117, 83, 116))");
    check(ChunkType::fromString("RuSt") != ChunkType::fromString("RUSt"), "ChunkType::fromString(\"RuSt\") != ChunkType::fromString(\"RUSt\")");
}

static void critical() {
    check(ChunkType::fromString("RuSt").isCritical(), "ChunkType::fromString(\"RuSt\").isCritical()");
    check(!ChunkType::fromString("ruSt").isCritical(), "!ChunkType::fromString(\"ruSt\").isCritical()");
}

static void isPublic() {
    check(ChunkType::fromString("RUSt").isPublic(), "ChunkType::fromString(\"RUSt\").isPublic()");
    check(!ChunkType::fromString("RuSt").isPublic(), "!ChunkType::fromString(\"RuSt\").isPublic()");
}

static void reservedBit() {
    check(ChunkType::fromString("RuSt").isReservedBitValid(), "ChunkType::fromString(\"RuSt\").isReservedBitValid()");
    check(!ChunkType::fromString("Rust").isReservedBitValid(), "!ChunkType::fromString(\"Rust\").isReservedBitValid()");
}

static void safeToCopy() {
    check(ChunkType::fromString("RuSt").isSafeToCopy(), "ChunkType::fromString(\"RuSt\").isSafeToCopy()");
    check(!ChunkType::fromString("RuST").isSafeToCopy(), "!ChunkType::fromString(\"RuST\").isSafeToCopy()");
}

static void validity() {
    check(ChunkType::fromString("RuSt").isValid(), "ChunkType::fromString(\"RuSt\").isValid()");

    // Constructible but invalid: lowercase third letter
    ChunkType lower = ChunkType::fromString("Rust");
    check(!lower.isValid(), "!lower.isValid()");
    checkEqual(lower.toString(), std::string("Rust"), "lower.toString() == std::string(\"Rust\")");
}

static void standardTypes() {
    ChunkType ihdr = ChunkType::fromString("IHDR");
    check(ihdr.isCritical() && ihdr.isPublic() && ihdr.isValid() && !ihdr.isSafeToCopy(), "ihdr.isCritical() && ihdr.isPublic() && ihdr.isValid() && !ihdr.isSafeToCopy()");

    ChunkType text = ChunkType::fromString("tEXt");
    check(!text.isCritical() && text.isPublic() && text.isValid() && text.isSafeToCopy(), "!text.isCritical() && text.isPublic() && text.isValid() && text.isSafeToCopy()");
}

static void rejectsNonLetters() {
    checkThrows<InvalidFormatError>([&] { ChunkType::fromString("Ru1t"); }, "ChunkType::fromString(\"Ru1t\")");
    checkThrows<InvalidFormatError>([&] { ChunkType::fromString("Ru t"); }, "ChunkType::fromString(\"Ru t\")");
    checkThrows<InvalidFormatError>([&] { ChunkType::fromString("Ru@t"); }, "ChunkType::fromString(\"Ru@t\")");
    checkThrows<InvalidFormatError>([&] { ChunkType::fromString("Ru[t"); }, "ChunkType::fromString(\"Ru[t\")");
    checkThrows<InvalidFormatError>([&] { ChunkType(bytesOf(82, 117, 0, 116)); }, "ChunkType(bytesOf(82, 117, 0, 116))");
    checkThrows<InvalidFormatError>([&] { ChunkType(bytesOf(0xC3, 0xA9, 83, 116)); }, "ChunkType(bytesOf(0xC3, 0xA9, 83, 116))");
}

static void rejectsWrongLength() {
    checkThrows<InvalidFormatError>([&] { ChunkType::fromString(""); }, "ChunkType::fromString(\"\")");
    checkThrows<InvalidFormatError>([&] { ChunkType::fromString("Rus"); }, "ChunkType::fromString(\"Rus\")");
    checkThrows<InvalidFormatError>([&] { ChunkType::fromString("RuStX"); }, "ChunkType::fromString(\"RuStX\")");
}

static void lettersAtEveryPosition() {
    const std::string letters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    for (size_t i = 0; i < letters.size(); ++i) {
        std::string text = "RuSt";
        text[i % 4] = letters[i];
        checkEqual(ChunkType::fromString(text).toString(), text, "ChunkType::fromString(text).toString() == text");
    }
}

static void rendering() {
    std::ostringstream os;
    os << ChunkType::fromString("RuSt");
    checkEqual(os.str(), std::string("RuSt"), "os.str() == std::string(\"RuSt\")");
}

int main() {
    run("fromBytes", fromBytes);
    run("fromString", fromString);
    run("critical", critical);
    run("isPublic", isPublic);
    run("reservedBit", reservedBit);
    run("safeToCopy", safeToCopy);
    run("validity", validity);
    run("standardTypes", standardTypes);
    run("rejectsNonLetters", rejectsNonLetters);
    run("rejectsWrongLength", rejectsWrongLength);
    run("lettersAtEveryPosition", lettersAtEveryPosition);
    run("rendering", rendering);
    return finish();
}
