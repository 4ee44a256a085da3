#pragma once
#include <RILL/Primitives.hpp>
#include <RILL/Exceptions/Exception.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace RILL::Math
{
    /// @brief Arbitrary precision signed integer used for JSON integers outside the Int64 range.
    ///
    /// @details
    /// Magnitude is stored little-endian in base 10^9 limbs so that decimal text converts
    /// in both directions without a division pass. Zero is always non-negative.
    class BigInt
    {
    public:
        // Default constructor (zero)
        BigInt() : m_digits {0}, m_negative(false)
        {}

        explicit BigInt(UInt64 value)
            : m_negative(false)
        {
            SetMagnitude(value);
        }

        // Construct from signed 64-bit
        explicit BigInt(Int64 value)
        {
            m_negative = (value < 0);
            // avoid overflow for INT64_MIN
            const UInt64 absval = value < 0 ? static_cast<UInt64>(-(value + 1)) + 1 : static_cast<UInt64>(value);
            SetMagnitude(absval);
            if (IsZero())
                m_negative = false;
        }

        /// @brief Parses an optionally '-' prefixed run of decimal digits.
        /// @throws Exceptions::Exception when @p text is empty or contains a non-digit.
        explicit BigInt(std::string_view text)
        {
            m_negative = !text.empty() && text.front() == '-';
            if (m_negative)
                text.remove_prefix(1);
            if (text.empty())
                throw Exceptions::Exception("BigInt: empty digit sequence");

            m_digits.clear();
            m_digits.reserve(text.size() / BASE_DIGITS + 1);
            for (Int64 i = static_cast<Int64>(text.size()); i > 0; i -= BASE_DIGITS)
            {
                UInt32 block = 0;
                for (Int64 j = std::max<Int64>(0, i - BASE_DIGITS); j < i; ++j)
                {
                    const char c = text[static_cast<UIntSize>(j)];
                    if (c < '0' || c > '9')
                        throw Exceptions::Exception("BigInt: invalid digit in '" + std::string(text) + "'");
                    block = block * 10 + static_cast<UInt32>(c - '0');
                }
                m_digits.push_back(block);
            }
            Trim();
            // Normalize zero: always non-negative
            if (IsZero())
                m_negative = false;
        }

        [[nodiscard]] bool IsZero() const noexcept { return m_digits.size() == 1 && m_digits[0] == 0; }
        [[nodiscard]] bool IsNegative() const noexcept { return m_negative; }

        // Unary minus
        BigInt operator-() const
        {
            BigInt result = *this;
            if (!result.IsZero())
                result.m_negative = !m_negative;
            return result;
        }

        // Comparison operators
        bool operator==(const BigInt& other) const
        {
            return m_negative == other.m_negative && m_digits == other.m_digits;
        }

        bool operator!=(const BigInt& other) const
        {
            return !(*this == other);
        }

        bool operator<(const BigInt& other) const
        {
            if (m_negative != other.m_negative)
                return m_negative;
            if (m_negative)
                return AbsLess(other, *this);
            return AbsLess(*this, other);
        }

        bool operator>(const BigInt& other) const { return other < *this; }
        bool operator<=(const BigInt& other) const { return !(other < *this); }
        bool operator>=(const BigInt& other) const { return !(*this < other); }

        /// @brief Decimal representation, '-' prefixed when negative.
        [[nodiscard]] std::string ToString() const
        {
            std::ostringstream os;
            os << *this;
            return os.str();
        }

        /// @brief Nearest double; +/-infinity when the magnitude exceeds the double range.
        [[nodiscard]] F64 ToDouble() const
        {
            const std::string text   = ToString();
            F64               value  = 0.0;
            const auto        result = std::from_chars(text.data(), text.data() + text.size(), value);
            if (result.ec == std::errc::result_out_of_range)
                return m_negative ? -std::numeric_limits<F64>::infinity() : std::numeric_limits<F64>::infinity();
            return value;
        }

        // Output operator
        friend std::ostream& operator<<(std::ostream& os, const BigInt& bi)
        {
            if (bi.m_negative)
                os << '-';
            auto it = bi.m_digits.rbegin();
            os << *it;
            ++it;
            const char fill = os.fill();
            for (; it != bi.m_digits.rend(); ++it)
                os << std::setw(BASE_DIGITS) << std::setfill('0') << *it;
            os.fill(fill);
            return os;
        }

    private:
        std::vector<UInt32> m_digits;
        bool m_negative;

        static constexpr UInt32 BASE        = 1000000000;// 10^9
        static constexpr UInt32 BASE_DIGITS = 9;         // Number of decimal digits per element

        void SetMagnitude(UInt64 value)
        {
            m_digits.clear();
            if (value == 0)
            {
                m_digits.push_back(0);
                return;
            }
            while (value > 0)
            {
                m_digits.push_back(static_cast<UInt32>(value % BASE));
                value /= BASE;
            }
        }

        static bool AbsLess(const BigInt& a, const BigInt& b)
        {
            if (a.m_digits.size() != b.m_digits.size())
                return a.m_digits.size() < b.m_digits.size();
            for (Int64 i = static_cast<Int64>(a.m_digits.size()) - 1; i >= 0; --i)
            {
                if (a.m_digits[i] != b.m_digits[i])
                    return a.m_digits[i] < b.m_digits[i];
            }
            return false;
        }

        void Trim()
        {
            while (m_digits.size() > 1 && m_digits.back() == 0)
                m_digits.pop_back();
        }
    };
}// namespace RILL::Math
