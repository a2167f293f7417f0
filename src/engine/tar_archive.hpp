#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kivybot::engine {

struct TarEntry {
    std::string name;
    std::string data;
    char type = '0';
};

// Minimal ustar support for the engine archive endpoints: regular files only on
// write, regular files plus GNU long-name and PAX path records on read.
class TarArchive {
public:
    void AddFile(const std::string& name, const std::string& data, unsigned mode = 0644);
    std::string Finish() const;

    static std::vector<TarEntry> Parse(const std::string& tar);
    // Regular file whose name (ignoring a leading "./") equals `name`.
    static std::optional<std::string> ExtractFile(const std::string& tar, const std::string& name);

private:
    std::string buffer_;
};

}  // namespace kivybot::engine
