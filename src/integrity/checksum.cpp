/**
 * @file checksum.cpp
 * @brief SHA-256 digest computation using OpenSSL EVP
 */

#include <migrator/integrity/checksum.hpp>

#include <migrator/catalog/migration_catalog.hpp>
#include <migrator/compat/format.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>

namespace migrator::integrity {

namespace {

constexpr const char* module_name = "checksum";

auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

}  // namespace

auto sha256_hex(std::string_view content) -> Result<std::string> {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return make_error<std::string>(
            error_codes::checksum_error,
            compat::format("Failed to create digest context: {}",
                           get_openssl_error()),
            module_name);
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), content.data(), content.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return make_error<std::string>(
            error_codes::checksum_error,
            compat::format("SHA-256 computation failed: {}", get_openssl_error()),
            module_name);
    }

    std::string result;
    result.reserve(hash_len * 2);

    static const char hex_chars[] = "0123456789abcdef";
    for (unsigned int i = 0; i < hash_len; ++i) {
        result += hex_chars[(hash[i] >> 4) & 0x0F];
        result += hex_chars[hash[i] & 0x0F];
    }

    return result;
}

auto file_checksum(const std::filesystem::path& path) -> Result<std::string> {
    auto content = catalog::migration_catalog::read_script(path);
    if (content.is_err()) {
        return make_error<std::string>(content.error().code,
                                       content.error().message, module_name);
    }
    return sha256_hex(content.value());
}

}  // namespace migrator::integrity
