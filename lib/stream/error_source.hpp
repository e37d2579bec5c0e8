// SPDX-License-Identifier: MIT

// lib/stream/error_source.hpp
#pragma once

#include <concepts>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace stage_pipe {

class ErrorSource;

/// Access to a foreign error's diagnostic information.
///
/// Supported out of the box:
/// - types with `what()` (std::exception and friends)
/// - types with `message()` (std::error_code, most status types)
/// Either kind may also expose `ErrorSource source() const` to continue the
/// chain. Specialize ErrorTraits for anything else.
template<typename E>
struct ErrorTraits;

/// A type that can be boxed into an ErrorSource.
template<typename E>
concept ForeignError = std::move_constructible<E> && requires(const E& e) {
    { ErrorTraits<E>::Message(e) } -> std::convertible_to<std::string>;
    { ErrorTraits<E>::Source(e) } -> std::same_as<ErrorSource>;
};

/// One link of an error source chain.
///
/// Owns a type-erased foreign error. Copies share the stored value, so an
/// Error can be copied freely without losing the original cause.
/// The stored value is immutable.
class ErrorSource {
public:
    ErrorSource() = default;

    template<typename E>
        requires (!std::same_as<std::remove_cvref_t<E>, ErrorSource>) &&
                 ForeignError<std::remove_cvref_t<E>>
    explicit ErrorSource(E&& error)
        : impl_(std::make_shared<Model<std::remove_cvref_t<E>>>(std::forward<E>(error))) {}

    explicit operator bool() const { return impl_ != nullptr; }

    /// Display text of this link, empty for an empty source.
    std::string Message() const { return impl_ ? impl_->Message() : std::string(); }

    /// The next link in the chain, empty at the end.
    ErrorSource Next() const { return impl_ ? impl_->Next() : ErrorSource(); }

    /// Stored value when this link holds an E, nullptr otherwise.
    template<typename E>
    const E* As() const {
        auto* model = dynamic_cast<const Model<E>*>(impl_.get());
        return model ? &model->value : nullptr;
    }

    /// First link (this one included) holding an E, empty when none does.
    template<typename E>
    ErrorSource Find() const {
        for (ErrorSource link = *this; link; link = link.Next()) {
            if (link.As<E>()) return link;
        }
        return {};
    }

    /// Number of links reachable from here, this one included.
    std::size_t Depth() const {
        std::size_t depth = 0;
        for (ErrorSource link = *this; link; link = link.Next()) ++depth;
        return depth;
    }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual std::string Message() const = 0;
        virtual ErrorSource Next() const = 0;
    };

    template<typename E>
    struct Model final : Concept {
        template<typename U>
        explicit Model(U&& v) : value(std::forward<U>(v)) {}

        std::string Message() const override { return ErrorTraits<E>::Message(value); }
        ErrorSource Next() const override { return ErrorTraits<E>::Source(value); }

        E value;
    };

    std::shared_ptr<const Concept> impl_;
};

namespace detail {

template<typename E>
concept HasWhat = requires(const E& e) {
    { e.what() } -> std::convertible_to<std::string_view>;
};

template<typename E>
concept HasMessage = requires(const E& e) {
    { e.message() } -> std::convertible_to<std::string>;
};

template<typename E>
ErrorSource SourceOf(const E& e) {
    if constexpr (requires { { e.source() } -> std::convertible_to<ErrorSource>; }) {
        return e.source();
    } else {
        return {};
    }
}

}  // namespace detail

template<typename E>
    requires detail::HasWhat<E>
struct ErrorTraits<E> {
    static std::string Message(const E& e) { return std::string(std::string_view(e.what())); }
    static ErrorSource Source(const E& e) { return detail::SourceOf(e); }
};

template<typename E>
    requires (!detail::HasWhat<E>) && detail::HasMessage<E>
struct ErrorTraits<E> {
    static std::string Message(const E& e) { return std::string(e.message()); }
    static ErrorSource Source(const E& e) { return detail::SourceOf(e); }
};

}  // namespace stage_pipe
