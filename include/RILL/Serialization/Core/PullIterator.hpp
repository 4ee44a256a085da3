#pragma once

#include <cstddef>
#include <iterator>

namespace RILL::Serialization
{
    /// @brief Input iterator over a pull source exposing `HasNext`, `Peek` and `Advance`.
    ///
    /// Compares equal to `std::default_sentinel` once the source is exhausted, so pull sources
    /// can be used in range-for loops.
    template <typename Source>
    class PullIterator
    {
    public:
        using iterator_concept = std::input_iterator_tag;
        using value_type       = typename Source::ValueType;
        using difference_type  = std::ptrdiff_t;
        using reference        = const value_type&;

        PullIterator() noexcept = default;
        explicit PullIterator(Source& source) noexcept
            : m_source(&source)
        {
        }

        reference operator*() const { return m_source->Peek(); }

        PullIterator& operator++()
        {
            m_source->Advance();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const PullIterator& it, std::default_sentinel_t)
        {
            return it.m_source == nullptr || !it.m_source->HasNext();
        }

    private:
        Source* m_source {nullptr};
    };
}// namespace RILL::Serialization
