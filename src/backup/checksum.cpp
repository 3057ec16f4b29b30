#include "backup/checksum.hpp"
#include <openssl/evp.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <vector>

namespace litesync::checksum {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string to_hex(const unsigned char* data, unsigned int len) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex += hex_chars[(data[i] >> 4) & 0x0F];
        hex += hex_chars[data[i] & 0x0F];
    }
    return hex;
}

} // anonymous namespace

Result<std::string> sha256_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::error(ErrorCategory::BACKUP_FAILED,
            std::format("Cannot read {}", path));
    }

    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Result<std::string>::error(ErrorCategory::BACKUP_FAILED, "SHA-256 init failed");
    }

    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(got)) != 1) {
            return Result<std::string>::error(ErrorCategory::BACKUP_FAILED, "SHA-256 update failed");
        }
    }
    if (in.bad()) {
        return Result<std::string>::error(ErrorCategory::BACKUP_FAILED,
            std::format("Read error on {}", path));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return Result<std::string>::error(ErrorCategory::BACKUP_FAILED, "SHA-256 final failed");
    }
    return Result<std::string>::ok(to_hex(hash, hash_len));
}

std::string sidecar_path(const std::string& artifact_path) {
    return artifact_path + ".sha256";
}

Result<void> write_sidecar(const std::string& artifact_path, const std::string& hex) {
    const auto path = sidecar_path(artifact_path);
    std::ofstream out(path, std::ios::trunc);
    out << hex << "  " << std::filesystem::path(artifact_path).filename().string() << '\n';
    out.close();
    if (!out) {
        return Result<void>::error(ErrorCategory::BACKUP_FAILED,
            std::format("Cannot write checksum file {}", path));
    }
    return Result<void>::ok();
}

Result<std::string> read_sidecar(const std::string& artifact_path) {
    const auto path = sidecar_path(artifact_path);
    std::ifstream in(path);
    std::string hex;
    if (!in || !(in >> hex) || hex.size() != 64) {
        return Result<std::string>::error(ErrorCategory::BACKUP_FAILED,
            std::format("Missing or malformed checksum file {}", path));
    }
    return Result<std::string>::ok(std::move(hex));
}

} // namespace litesync::checksum
