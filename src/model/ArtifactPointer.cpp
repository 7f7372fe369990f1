#include "model/ArtifactPointer.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace stockcast {
namespace model {

namespace {
std::string readLeading(const std::filesystem::path& location, std::size_t bytes) {
    std::ifstream in(location, std::ios::binary);
    if (!in.is_open()) {
        return "";
    }
    std::string buffer(bytes, '\0');
    in.read(&buffer[0], static_cast<std::streamsize>(bytes));
    buffer.resize(static_cast<std::size_t>(in.gcount()));
    return buffer;
}

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
} // namespace

bool ArtifactPointer::isPlaceholder(const std::filesystem::path& location) {
    return readLeading(location, INSPECT_BYTES).find(SIGNATURE) != std::string::npos;
}

std::optional<ArtifactPointer> ArtifactPointer::read(const std::filesystem::path& location) {
    if (!isPlaceholder(location)) {
        return std::nullopt;
    }

    std::ifstream in(location);
    ArtifactPointer pointer;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.rfind("oid sha256:", 0) == 0) {
            std::string oid = trim(line.substr(11));
            std::transform(oid.begin(), oid.end(), oid.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            pointer.sha256 = oid;
        } else if (line.rfind("size ", 0) == 0) {
            try {
                pointer.size = std::stoull(trim(line.substr(5)));
            } catch (const std::exception&) {
                // size는 참고용, 깨져 있으면 검사하지 않음
                pointer.size.reset();
            }
        }
    }
    return pointer;
}

std::string ArtifactPointer::sha256Of(const std::filesystem::path& location) {
    std::ifstream in(location, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("cannot open " + location.string() + " for hashing");
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("failed to initialize SHA-256 digest");
    }

    char chunk[8192];
    while (in.read(chunk, sizeof(chunk)) || in.gcount() > 0) {
        if (EVP_DigestUpdate(ctx.get(), chunk, static_cast<std::size_t>(in.gcount())) != 1) {
            throw std::runtime_error("SHA-256 update failed");
        }
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 finalize failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

} // namespace model
} // namespace stockcast
