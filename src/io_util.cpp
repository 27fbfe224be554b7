#include "io_util.h"

#include "utf8.h"

#include <cstdio>
#include <stdexcept>

namespace typedcsv {

static void strip_bom(std::string& data) {
    if (has_utf8_bom(data)) {
        data.erase(0, UTF8_BOM_LENGTH);
    }
}

std::string read_text_file(const std::string& filename) {
    std::FILE* fp = std::fopen(filename.c_str(), "rb");
    if (fp == nullptr) {
        throw std::runtime_error("could not load file: " + filename);
    }

    std::fseek(fp, 0, SEEK_END);
    long len = std::ftell(fp);
    if (len < 0) {
        std::fclose(fp);
        throw std::runtime_error("could not read the data");
    }
    std::rewind(fp);

    std::string data(static_cast<size_t>(len), '\0');
    size_t readb = len > 0 ? std::fread(&data[0], 1, data.size(), fp) : 0;
    std::fclose(fp);
    if (readb != data.size()) {
        throw std::runtime_error("could not read the data");
    }

    strip_bom(data);
    return data;
}

std::string read_text_stdin() {
    // Read stdin in chunks since we don't know the size upfront
    const size_t chunk_size = 64 * 1024;
    std::string data;
    char buffer[chunk_size];
    while (true) {
        size_t bytes_read = std::fread(buffer, 1, chunk_size, stdin);
        data.append(buffer, bytes_read);
        if (bytes_read < chunk_size) {
            if (std::ferror(stdin)) {
                throw std::runtime_error("could not read from stdin");
            }
            break;
        }
    }

    strip_bom(data);
    return data;
}

std::string file_stem(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        name.erase(dot);
    }
    return name;
}

} // namespace typedcsv
