/// @file
/// @brief Field-level reader and writer shared by the JA3 and JA3S codecs.

#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <casket/log/log_manager.hpp>

#include <tlsfp/ja3/error_code.hpp>
#include <tlsfp/utils/to_number.hpp>

namespace tlsfp::ja3::detail
{

inline constexpr char kFieldDelimiter = ',';
inline constexpr char kValueDelimiter = '-';

/// @brief Splits @p text into exactly @p N comma-separated fields.
///
/// Missing trailing fields are empty. Commas after the (N-1)-th one stay in the last field.
template <std::size_t N>
std::array<std::string_view, N> SplitFields(std::string_view text)
{
    static_assert(N > 0);
    std::array<std::string_view, N> fields{};

    for (std::size_t i = 0; i + 1 < N; ++i)
    {
        auto pos = text.find(kFieldDelimiter);
        if (pos == std::string_view::npos)
        {
            fields[i] = text;
            return fields;
        }
        fields[i] = text.substr(0, pos);
        text.remove_prefix(pos + 1);
    }

    fields[N - 1] = text;
    return fields;
}

/// @brief Sequential reader of the fields of a fingerprint string.
///
/// Each read() consumes the next field and decodes it into codes of the given
/// integer width. After the first failure all further reads are ignored.
template <std::size_t N>
class FieldReader final
{
public:
    explicit FieldReader(std::string_view text)
        : fields_(SplitFields<N>(text))
        , index_(0)
        , failed_(false)
    {
    }

    template <typename Int, typename Code>
    void read(std::vector<Code>& codes)
    {
        if (failed_ || index_ >= N)
        {
            return;
        }

        codes.clear();

        std::string_view field = fields_[index_];
        if (!field.empty())
        {
            for (;;)
            {
                auto pos = field.find(kValueDelimiter);
                auto token = field.substr(0, pos);

                Int value{};
                std::error_code ec;
                utils::to_number(token, value, ec);
                if (ec)
                {
                    casket::debug("Fingerprint field {}: bad token '{}' ({})", index_, token, ec.message());
                    codes.clear();
                    failedToken_ = token;
                    failed_ = true;
                    return;
                }

                codes.emplace_back(value);

                if (pos == std::string_view::npos)
                {
                    break;
                }
                field.remove_prefix(pos + 1);
            }
        }

        ++index_;
    }

    bool failed() const noexcept
    {
        return failed_;
    }

    /// @brief Index of the field that failed to decode.
    std::size_t failedField() const noexcept
    {
        return index_;
    }

    std::string_view failedToken() const noexcept
    {
        return failedToken_;
    }

    std::error_code error() const
    {
        return failed_ ? make_error_code(Errc::MalformedText) : std::error_code{};
    }

private:
    std::array<std::string_view, N> fields_;
    std::size_t index_;
    bool failed_;
    std::string_view failedToken_;
};

/// @brief Sequential writer of fingerprint fields.
class FieldWriter final
{
public:
    FieldWriter()
        : count_(0)
    {
    }

    template <typename Code>
    void write(const std::vector<Code>& codes)
    {
        if (count_++ > 0)
        {
            result_.push_back(kFieldDelimiter);
        }

        for (std::size_t i = 0; i < codes.size(); ++i)
        {
            if (i > 0)
            {
                result_.push_back(kValueDelimiter);
            }
            result_.append(std::to_string(static_cast<unsigned>(codes[i].code())));
        }
    }

    std::string release()
    {
        return std::move(result_);
    }

private:
    std::string result_;
    std::size_t count_;
};

} // namespace tlsfp::ja3::detail
