#include "commands.hpp"
#include "Image.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <exception>

namespace {

void printUsage(std::ostream& err) {
    err << "Put a secret message into a PNG file\n"
        << "\n"
        << "Usage:\n"
        << "  pngstash encode <PATH> <CHUNK_TYPE> <MESSAGE> [OUTPUT]\n"
        << "  pngstash decode <PATH> <CHUNK_TYPE>\n"
        << "  pngstash remove <PATH> <CHUNK_TYPE>\n"
        << "  pngstash print <PATH>\n";
}

Image loadImage(const std::string& path) {
    return Image::decode(readFileBytes(path));
}

} // namespace

void encodeCommand(const std::string& path, const std::string& type, const std::string& message,
                   const std::string& output, std::ostream& out) {
    Image image = loadImage(path);

    ChunkType chunkType = ChunkType::fromString(type);
    image.addChunk(Chunk(chunkType, std::vector<uint8_t>(message.begin(), message.end())));

    const std::string& destination = output.empty() ? path : output;
    writeFileBytes(destination, image.asBytes());
    out << "Encoded " << message.size() << " bytes into " << chunkType << " chunk of " << destination << '\n';
}


void decodeCommand(const std::string& path, const std::string& type, std::ostream& out) {
    Image image = loadImage(path);

    const Chunk* chunk = image.findChunk(type);
    if (chunk == nullptr)
        throw NotFoundError("no message found");

    out << "Message: " << chunk->dataAsString() << '\n';
}


void removeCommand(const std::string& path, const std::string& type, std::ostream& out) {
    Image image = loadImage(path);

    Chunk removed = image.removeChunk(type);
    writeFileBytes(path, image.asBytes());

    out << "Removed:\n" << removed;
}


void printCommand(const std::string& path, std::ostream& out) {
    Image image = loadImage(path);

    size_t count = 0;
    for (const auto& chunk : image.getChunks()) {
        if (chunk.getType().isPublic())
            continue;
        out << chunk;
        ++count;
    }
    out << "Private chunks: " << count << '\n';
}


int runCommand(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        printUsage(err);
        return 2;
    }

    const std::string& command = args[0];
    try {
        if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
            encodeCommand(args[1], args[2], args[3], args.size() == 5 ? args[4] : std::string(), out);
        } else if (command == "decode" && args.size() == 3) {
            decodeCommand(args[1], args[2], out);
        } else if (command == "remove" && args.size() == 3) {
            removeCommand(args[1], args[2], out);
        } else if (command == "print" && args.size() == 2) {
            printCommand(args[1], out);
        } else {
            printUsage(err);
            return 2;
        }
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
