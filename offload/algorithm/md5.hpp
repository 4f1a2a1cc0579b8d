/*
 * md5.hpp
 *
 * Copyright (C) 2026 offload contributors
 */

/*************************************************

Date: 2026-9-5

Description: Streaming MD5 digests backed by OpenSSL EVP

**************************************************/

#ifndef OFFLOAD_ALGORITHM_MD5_HPP
#define OFFLOAD_ALGORITHM_MD5_HPP

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace offload::algorithm {

/**
 * @brief Incremental MD5 context.
 *
 * MD5 is used for corruption detection after a copy, not for security.
 */
class Md5Context {
public:
    Md5Context() noexcept;
    ~Md5Context() noexcept;

    Md5Context(const Md5Context&) = delete;
    Md5Context& operator=(const Md5Context&) = delete;
    Md5Context(Md5Context&&) noexcept;
    Md5Context& operator=(Md5Context&&) noexcept;

    /**
     * @brief Feeds more data into the digest.
     * @return False if the context failed to initialise or update.
     */
    bool update(const void* data, size_t length) noexcept;
    bool update(std::string_view data) noexcept;
    bool update(std::span<const std::byte> data) noexcept;

    /**
     * @brief Finishes the digest.
     * @return Lowercase hex digest, or std::nullopt on failure.
     */
    [[nodiscard]] auto finalize() noexcept -> std::optional<std::string>;

private:
    struct ContextImpl;
    std::unique_ptr<ContextImpl> impl_;
};

/**
 * @brief MD5 of an in-memory string, as lowercase hex.
 * @throws offload::error::RuntimeError if OpenSSL fails.
 */
[[nodiscard]] auto md5Hex(std::string_view data) -> std::string;

/**
 * @brief MD5 of a whole file, read in @p chunkSize pieces.
 * @throws offload::error::FileNotFound if the file cannot be opened.
 * @throws offload::error::IOError on read errors.
 */
[[nodiscard]] auto md5File(const std::filesystem::path& path,
                           size_t chunkSize = 4 * 1024 * 1024) -> std::string;

}  // namespace offload::algorithm

#endif  // OFFLOAD_ALGORITHM_MD5_HPP
