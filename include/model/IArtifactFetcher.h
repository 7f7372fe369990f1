#pragma once

#include <filesystem>
#include <string>

namespace stockcast {
namespace model {

// Remote resolution of placeholder artifacts.
class IArtifactFetcher {
public:
    virtual ~IArtifactFetcher() = default;

    // Writes the remote bytes for file_name to destination.
    // Throws std::runtime_error on transport or HTTP failure.
    virtual void fetch(const std::string& file_name, const std::filesystem::path& destination) = 0;
};

} // namespace model
} // namespace stockcast
