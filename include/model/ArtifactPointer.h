#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace stockcast {
namespace model {

// Git LFS pointer file that stands in for a real artifact.
//   version https://git-lfs.github.com/spec/v1
//   oid sha256:<64 hex>
//   size <bytes>
struct ArtifactPointer {
    static constexpr const char* SIGNATURE = "version https://git-lfs";
    static constexpr std::size_t INSPECT_BYTES = 100;

    std::string sha256;          // lower-case hex, empty if not recorded
    std::optional<std::uint64_t> size;

    // 앞 100바이트에 시그니처가 있으면 placeholder
    static bool isPlaceholder(const std::filesystem::path& location);

    // Parses a pointer file; std::nullopt if the file is not a placeholder.
    static std::optional<ArtifactPointer> read(const std::filesystem::path& location);

    // Hex SHA-256 of the file contents. Throws std::runtime_error if unreadable.
    static std::string sha256Of(const std::filesystem::path& location);
};

} // namespace model
} // namespace stockcast
