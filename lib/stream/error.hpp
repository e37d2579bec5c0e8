// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "lib/stream/error_source.hpp"

namespace stage_pipe {

/// Error codes for all pipeline operations.
enum class ErrorCode {
    // Middleware
    MiddlewareWrapped,     ///< Foreign stage or body error, original kept in Error::source

    // Body
    BodyStream,            ///< Canonical body failed while producing bytes

    // Session
    SessionStore,          ///< Session store rejected a load, save or delete
    InvalidSessionData,    ///< Session record could not be decoded

    // Configuration
    ConfigParse,           ///< Configuration document is not valid
    ConfigIo,              ///< Configuration file could not be read

    // Generic
    Internal,              ///< Invariant violated inside the pipeline
};

/// Canonical error flowing out of every pipeline.
///
/// `message` is the full display text. For ErrorCode::MiddlewareWrapped it
/// embeds the cause's message; the cause itself stays reachable through
/// `source` together with its own chain.
struct Error {
    ErrorCode code;            ///< Classified error code
    std::string message;       ///< Human-readable description
    ErrorSource source = {};   ///< Cause, empty when the error is original
};

/// Return a short category string for an error code (e.g. "middleware", "session").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::MiddlewareWrapped:
            return "middleware";
        case ErrorCode::BodyStream:
            return "body";
        case ErrorCode::SessionStore:
        case ErrorCode::InvalidSessionData:
            return "session";
        case ErrorCode::ConfigParse:
        case ErrorCode::ConfigIo:
            return "config";
        case ErrorCode::Internal:
            return "internal";
    }
    return "unknown";
}

/// Canonical errors may appear inside foreign source chains.
template<>
struct ErrorTraits<Error> {
    static std::string Message(const Error& e) { return e.message; }
    static ErrorSource Source(const Error& e) { return e.source; }
};

/// Display text followed by every cause, one per line.
inline std::string DescribeChain(const Error& error) {
    std::string out = error.message;
    for (ErrorSource link = error.source; link; link = link.Next()) {
        out += "\n  caused by: ";
        out += link.Message();
    }
    return out;
}

/// Normalize any foreign error into the canonical Error.
///
/// A canonical Error is returned unchanged, so crossing the boundary twice
/// never nests two MiddlewareWrapped layers.
template<typename E>
    requires ForeignError<std::remove_cvref_t<E>>
Error WrapError(E&& error) {
    using Decayed = std::remove_cvref_t<E>;
    if constexpr (std::same_as<Decayed, Error>) {
        return std::forward<E>(error);
    } else {
        std::string text = fmt::format("error while executing middleware: {}",
                                       ErrorTraits<Decayed>::Message(error));
        return Error{ErrorCode::MiddlewareWrapped, std::move(text),
                     ErrorSource(std::forward<E>(error))};
    }
}

}  // namespace stage_pipe

template<>
struct fmt::formatter<stage_pipe::Error> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const stage_pipe::Error& e, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(e.message, ctx);
    }
};
