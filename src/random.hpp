// SPDX-License-Identifier: MIT

// src/random.hpp
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <openssl/rand.h>

namespace stage_pipe {

/// Fill `out` with random bytes from a thread-local engine seeded from
/// std::random_device and the clock.
template<std::size_t N>
void RandomFill(std::array<std::uint8_t, N>& out) {
    static thread_local std::mt19937_64 rng{
        std::random_device{}() ^
        static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count())};
    std::uniform_int_distribution<std::uint32_t> dist(0, 0xFFFFFFFF);

    for (std::size_t i = 0; i < N; i += 4) {
        std::uint32_t rnd = dist(rng);
        for (std::size_t j = 0; j < 4 && i + j < N; ++j) {
            out[i + j] = static_cast<std::uint8_t>((rnd >> (8 * j)) & 0xFF);
        }
    }
}

template<std::size_t N>
std::string ToHex(const std::array<std::uint8_t, N>& bytes) {
    return fmt::format("{:02x}", fmt::join(bytes, ""));
}

/// N random bytes rendered as 2*N lowercase hex digits. Not suitable for
/// secrets: the engine state can be recovered from its output.
template<std::size_t N>
std::string RandomHex() {
    std::array<std::uint8_t, N> bytes{};
    RandomFill(bytes);
    return ToHex(bytes);
}

/// N bytes from the OpenSSL CSPRNG as 2*N lowercase hex digits, for values
/// that must not be guessable (session ids).
/// @return std::nullopt if the generator could not be seeded.
template<std::size_t N>
std::optional<std::string> SecureRandomHex() {
    std::array<std::uint8_t, N> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(N)) != 1) return std::nullopt;
    return ToHex(bytes);
}

}  // namespace stage_pipe
