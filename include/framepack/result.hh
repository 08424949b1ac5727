/**
 * @file result.hh
 * @brief Tagged success/error values returned by the public API
 */

#pragma once

#include <string>
#include <utility>
#include <variant>
#include <framepack/exceptions.hh>

namespace framepack {

    /**
     * @struct error_info
     * @brief What went wrong: a machine-readable kind and a diagnostic text
     */
    struct error_info {
        error_kind kind = error_kind::io_error;
        std::string message;
    };

    /**
     * @class result
     * @brief Either a value of type T or an error_info
     *
     * Reads that can legitimately find nothing (end of pack) use
     * result<std::optional<...>>, so a clean end is a successful result
     * and never confused with corruption.
     */
    template<typename T>
    class result {
    public:
        static result success(T value) {
            return result(std::in_place_index<0>, std::move(value));
        }

        static result failure(error_kind kind, std::string message) {
            return result(std::in_place_index<1>, error_info{kind, std::move(message)});
        }

        static result failure(error_info error) {
            return result(std::in_place_index<1>, std::move(error));
        }

        [[nodiscard]] bool ok() const noexcept { return m_state.index() == 0; }
        explicit operator bool() const noexcept { return ok(); }

        // Accessing the value of a failed result throws std::bad_variant_access
        [[nodiscard]] const T& value() const& { return std::get<0>(m_state); }
        [[nodiscard]] T& value() & { return std::get<0>(m_state); }
        [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_state)); }

        [[nodiscard]] const error_info& error() const { return std::get<1>(m_state); }
        [[nodiscard]] error_kind kind() const { return error().kind; }
        [[nodiscard]] const std::string& message() const { return error().message; }

    private:
        template<std::size_t I, typename U>
        result(std::in_place_index_t<I> tag, U&& v) : m_state(tag, std::forward<U>(v)) {}

        std::variant<T, error_info> m_state;
    };

    template<>
    class result<void> {
    public:
        static result success() { return result(); }

        static result failure(error_kind kind, std::string message) {
            return result(error_info{kind, std::move(message)});
        }

        static result failure(error_info error) {
            return result(std::move(error));
        }

        [[nodiscard]] bool ok() const noexcept { return !m_failed; }
        explicit operator bool() const noexcept { return ok(); }

        [[nodiscard]] const error_info& error() const { return m_error; }
        [[nodiscard]] error_kind kind() const { return m_error.kind; }
        [[nodiscard]] const std::string& message() const { return m_error.message; }

    private:
        result() = default;
        explicit result(error_info error) : m_error(std::move(error)), m_failed(true) {}

        error_info m_error;
        bool m_failed = false;
    };

    /**
     * @brief Convert a caught pack_error into an error_info
     */
    inline error_info to_error_info(const pack_error& e) {
        return error_info{e.kind(), e.what()};
    }

} // namespace framepack
