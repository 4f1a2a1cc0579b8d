/*
 * md5.cpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-5

Description: Streaming MD5 digests backed by OpenSSL EVP

**************************************************/

#include "md5.hpp"

#include <array>
#include <format>
#include <fstream>
#include <utility>
#include <vector>

#include <openssl/evp.h>

#include <spdlog/spdlog.h>

#include "offload/error/exception.hpp"

namespace offload::algorithm {

// RAII wrapper for managing OpenSSL contexts
struct Md5Context::ContextImpl {
    EVP_MD_CTX* ctx{nullptr};
    bool initialized{false};

    ContextImpl() noexcept : ctx(EVP_MD_CTX_new()) {
        if (ctx) {
            initialized = EVP_DigestInit_ex(ctx, EVP_md5(), nullptr) == 1;
        }
    }

    ~ContextImpl() noexcept {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    ContextImpl(const ContextImpl&) = delete;
    ContextImpl& operator=(const ContextImpl&) = delete;
};

Md5Context::Md5Context() noexcept
    : impl_(std::make_unique<ContextImpl>()) {}

Md5Context::~Md5Context() noexcept = default;

Md5Context::Md5Context(Md5Context&&) noexcept = default;
Md5Context& Md5Context::operator=(Md5Context&&) noexcept = default;

bool Md5Context::update(const void* data, size_t length) noexcept {
    if (!impl_ || !impl_->initialized || (data == nullptr && length != 0)) {
        return false;
    }
    return EVP_DigestUpdate(impl_->ctx, data, length) == 1;
}

bool Md5Context::update(std::string_view data) noexcept {
    return update(data.data(), data.size());
}

bool Md5Context::update(std::span<const std::byte> data) noexcept {
    return update(data.data(), data.size_bytes());
}

auto Md5Context::finalize() noexcept -> std::optional<std::string> {
    if (!impl_ || !impl_->initialized) {
        return std::nullopt;
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(impl_->ctx, digest.data(), &digestLen) != 1) {
        return std::nullopt;
    }
    impl_->initialized = false;

    try {
        std::string hex;
        hex.reserve(static_cast<size_t>(digestLen) * 2);
        for (unsigned int i = 0; i < digestLen; ++i) {
            hex += std::format("{:02x}", digest[i]);
        }
        return hex;
    } catch (const std::exception& e) {
        spdlog::error("MD5: failed to encode digest: {}", e.what());
        return std::nullopt;
    }
}

auto md5Hex(std::string_view data) -> std::string {
    Md5Context context;
    if (!context.update(data)) {
        THROW_RUNTIME_ERROR("MD5 update failed");
    }
    auto digest = context.finalize();
    if (!digest) {
        THROW_RUNTIME_ERROR("MD5 finalization failed");
    }
    return *digest;
}

auto md5File(const std::filesystem::path& path, size_t chunkSize)
    -> std::string {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        THROW_FILE_NOT_FOUND("Cannot open file for hashing: ", path.string());
    }

    Md5Context context;
    std::vector<char> buffer(chunkSize == 0 ? 1 : chunkSize);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = file.gcount();
        if (got > 0 && !context.update(buffer.data(), static_cast<size_t>(got))) {
            THROW_RUNTIME_ERROR("MD5 update failed for ", path.string());
        }
    }
    if (file.bad()) {
        THROW_IO_ERROR("Read error while hashing ", path.string());
    }

    auto digest = context.finalize();
    if (!digest) {
        THROW_RUNTIME_ERROR("MD5 finalization failed for ", path.string());
    }
    spdlog::debug("MD5 {} = {}", path.string(), *digest);
    return *digest;
}

}  // namespace offload::algorithm
