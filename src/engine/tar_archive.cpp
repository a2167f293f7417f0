#include "engine/tar_archive.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <stdexcept>

namespace kivybot::engine {
namespace {

constexpr std::size_t kBlock = 512;

void WriteOctal(char* field, std::size_t width, std::uint64_t value) {
    // width - 1 digits followed by NUL
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1),
                  static_cast<unsigned long long>(value));
}

std::uint64_t ReadNumber(const char* field, std::size_t width) {
    if (static_cast<unsigned char>(field[0]) & 0x80) {
        // base-256, used by GNU tar for large sizes
        std::uint64_t value = static_cast<unsigned char>(field[0]) & 0x7f;
        for (std::size_t i = 1; i < width; ++i) {
            value = (value << 8) | static_cast<unsigned char>(field[i]);
        }
        return value;
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        const char c = field[i];
        if (c == '\0' || c == ' ') {
            if (value != 0) {
                break;
            }
            continue;
        }
        if (c < '0' || c > '7') {
            throw std::runtime_error("tar: malformed numeric field");
        }
        value = value * 8 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

std::string ReadString(const char* field, std::size_t width) {
    return std::string(field, strnlen(field, width));
}

std::size_t Padded(std::size_t size) {
    return (size + kBlock - 1) / kBlock * kBlock;
}

std::string NormalizeName(std::string name) {
    while (name.rfind("./", 0) == 0) {
        name.erase(0, 2);
    }
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    return name;
}

std::optional<std::string> PaxPath(const std::string& records) {
    std::size_t pos = 0;
    std::optional<std::string> path;
    while (pos < records.size()) {
        const auto space = records.find(' ', pos);
        if (space == std::string::npos) {
            break;
        }
        std::size_t length = 0;
        try {
            length = static_cast<std::size_t>(std::stoul(records.substr(pos, space - pos)));
        } catch (const std::exception&) {
            break;
        }
        if (length == 0 || pos + length > records.size()) {
            break;
        }
        const auto record = records.substr(space + 1, length - (space - pos) - 2);
        if (record.rfind("path=", 0) == 0) {
            path = record.substr(5);
        }
        pos += length;
    }
    return path;
}

}  // namespace

void TarArchive::AddFile(const std::string& name, const std::string& data, unsigned mode) {
    if (name.empty() || name.size() >= 100) {
        throw std::invalid_argument("tar: member name must be 1..99 bytes: " + name);
    }
    char header[kBlock];
    std::memset(header, 0, sizeof(header));
    std::memcpy(header, name.data(), name.size());
    WriteOctal(header + 100, 8, mode);
    WriteOctal(header + 108, 8, 0);
    WriteOctal(header + 116, 8, 0);
    WriteOctal(header + 124, 12, data.size());
    WriteOctal(header + 136, 12, static_cast<std::uint64_t>(std::time(nullptr)));
    header[156] = '0';
    std::memcpy(header + 257, "ustar", 6);
    std::memcpy(header + 263, "00", 2);

    std::memset(header + 148, ' ', 8);
    unsigned checksum = 0;
    for (unsigned char c : header) {
        checksum += c;
    }
    std::snprintf(header + 148, 8, "%06o", checksum);
    header[155] = ' ';

    buffer_.append(header, kBlock);
    buffer_.append(data);
    buffer_.append(Padded(data.size()) - data.size(), '\0');
}

std::string TarArchive::Finish() const {
    std::string out = buffer_;
    out.append(2 * kBlock, '\0');
    return out;
}

std::vector<TarEntry> TarArchive::Parse(const std::string& tar) {
    std::vector<TarEntry> entries;
    std::optional<std::string> long_name;
    std::size_t pos = 0;
    while (pos + kBlock <= tar.size()) {
        const char* header = tar.data() + pos;
        if (header[0] == '\0') {
            break;
        }
        const auto size = static_cast<std::size_t>(ReadNumber(header + 124, 12));
        const char type = header[156] == '\0' ? '0' : header[156];
        const auto data_start = pos + kBlock;
        if (data_start + size > tar.size()) {
            throw std::runtime_error("tar: truncated member");
        }
        std::string data = tar.substr(data_start, size);
        pos = data_start + Padded(size);

        if (type == 'L') {
            long_name = std::string(data.c_str());
            continue;
        }
        if (type == 'x') {
            long_name = PaxPath(data);
            continue;
        }
        if (type == 'g') {
            continue;
        }

        std::string name;
        if (long_name) {
            name = *long_name;
            long_name.reset();
        } else {
            name = ReadString(header, 100);
            const auto prefix = ReadString(header + 345, 155);
            if (!prefix.empty()) {
                name = prefix + "/" + name;
            }
        }
        entries.push_back(TarEntry{NormalizeName(name), std::move(data), type});
    }
    return entries;
}

std::optional<std::string> TarArchive::ExtractFile(const std::string& tar, const std::string& name) {
    const auto wanted = NormalizeName(name);
    for (auto& entry : Parse(tar)) {
        if ((entry.type == '0' || entry.type == '7') && entry.name == wanted) {
            return std::move(entry.data);
        }
    }
    return std::nullopt;
}

}  // namespace kivybot::engine
