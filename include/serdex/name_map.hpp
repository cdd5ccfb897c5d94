#pragma once

/// @file name_map.hpp
/// @author Aleksandr Loshkarev
/// @brief Immutable name -> value tables with incremental lookup.
///
/// A FixedNameMap is sorted once, at compile time when declared constexpr,
/// and owned by whoever declares it (typically an enum's EnumTraits). A
/// NameMap is a non-owning view over such a table. NameLookup resolves a
/// name that arrives piece by piece (one decoded character at a time from
/// the deserializer) without ever storing the name itself.
///
/// @example
/// @code
///   static constexpr serdex::FixedNameMap<size_t, 3> kColors{{{
///       {"red", 0}, {"green", 1}, {"blue", 2}}}};
///   auto lookup = kColors.unfix().lookup();
///   lookup.write_str("gre");
///   lookup.write_char(U'e');
///   lookup.write_str("n");
///   assert(*lookup.result() == 1);
/// @endcode

#include "detail/utf8.hpp"

#include <array>
#include <cstddef>
#include <string_view>

namespace serdex {

/// @brief One (name, value) association.
template <typename T>
struct NameEntry {
    std::string_view name;
    T value;
};

namespace detail {

/// @brief Three-way byte comparison usable in constant expressions.
constexpr int compare_names(std::string_view left, std::string_view right) noexcept {
    size_t i = 0;
    for (;; ++i) {
        if (i >= left.size()) return i >= right.size() ? 0 : -1;
        if (i >= right.size()) return 1;
        auto l = static_cast<unsigned char>(left[i]);
        auto r = static_cast<unsigned char>(right[i]);
        if (l < r) return -1;
        if (l > r) return 1;
    }
}

/// @brief Up to @p len bytes of @p name starting at @p start.
constexpr std::string_view truncate_name(std::string_view name, size_t start, size_t len) noexcept {
    if (start >= name.size()) return {};
    return name.substr(start, len);
}

template <typename T, size_t N>
constexpr void swap_entries(std::array<NameEntry<T>, N>& entries, size_t i, size_t j) {
    NameEntry<T> tmp = entries[i];
    entries[i] = entries[j];
    entries[j] = tmp;
}

/// @brief In-place three-way quicksort of entries[lo, hi), recursing on
/// the smaller partition. Entries equal to the pivot end up in
/// [lt, gt) and are not visited again.
template <typename T, size_t N>
constexpr void sort_entries(std::array<NameEntry<T>, N>& entries, size_t lo, size_t hi) {
    while (lo + 1 < hi) {
        std::string_view pivot = entries[lo + (hi - lo) / 2].name;
        size_t lt = lo;
        size_t i = lo;
        size_t gt = hi;
        while (i < gt) {
            int c = compare_names(entries[i].name, pivot);
            if (c < 0) {
                swap_entries(entries, lt++, i++);
            } else if (c > 0) {
                swap_entries(entries, i, --gt);
            } else {
                ++i;
            }
        }
        if (lt - lo < hi - gt) {
            sort_entries(entries, lo, lt);
            lo = gt;
        } else {
            sort_entries(entries, gt, hi);
            hi = lt;
        }
    }
}

} // namespace detail

template <typename T>
class NameLookup;

// =====================================================================
// NameMap: view over a sorted table
// =====================================================================

template <typename T>
class NameMap {
public:
    constexpr NameMap() noexcept = default;
    constexpr NameMap(const NameEntry<T>* entries, size_t size) noexcept
        : entries_(entries), size_(size) {}

    /// @brief Begins an incremental lookup into this table.
    [[nodiscard]] constexpr NameLookup<T> lookup() const noexcept {
        return NameLookup<T>(entries_, size_);
    }

    /// @brief Value for @p name, or nullptr if there is no such entry.
    [[nodiscard]] const T* get(std::string_view name) const noexcept {
        auto l = lookup();
        l.write_str(name);
        return l.result();
    }

    [[nodiscard]] constexpr size_t size() const noexcept { return size_; }

    /// @brief Entries in sorted order.
    [[nodiscard]] constexpr const NameEntry<T>* begin() const noexcept { return entries_; }
    [[nodiscard]] constexpr const NameEntry<T>* end() const noexcept { return entries_ + size_; }

private:
    const NameEntry<T>* entries_ = nullptr;
    size_t size_ = 0;
};

// =====================================================================
// FixedNameMap: owning, sorted at construction
// =====================================================================

template <typename T, size_t N>
class FixedNameMap {
public:
    constexpr explicit FixedNameMap(std::array<NameEntry<T>, N> entries)
        : entries_(entries) {
        detail::sort_entries(entries_, 0, N);
    }

    /// @brief Non-owning view of this table.
    [[nodiscard]] constexpr NameMap<T> unfix() const noexcept {
        return NameMap<T>(entries_.data(), N);
    }

    constexpr operator NameMap<T>() const noexcept { return unfix(); }

private:
    std::array<NameEntry<T>, N> entries_;
};

// =====================================================================
// NameLookup: incremental cursor
// =====================================================================

/// @brief Narrows a range of candidates as bytes of the lookup string
/// arrive. Candidates always form a contiguous range of the sorted table.
template <typename T>
class NameLookup {
public:
    constexpr NameLookup(const NameEntry<T>* cands, size_t count) noexcept
        : cands_(cands), count_(count) {}

    /// @brief Adds one character to the lookup string.
    void write_char(char32_t ch) noexcept {
        char buf[4];
        unsigned len = detail::utf8::encode(static_cast<uint32_t>(ch), buf);
        write_bytes(std::string_view(buf, len));
    }

    void write_str(std::string_view str) noexcept {
        write_bytes(str);
    }

    /// @brief Extends the lookup string with UTF-8 bytes.
    void write_bytes(std::string_view data) noexcept {
        size_t lo = 0;
        size_t hi = count_;
        while (lo < hi) {
            size_t mid = lo + (hi - lo) / 2;
            int c = compare_at(mid, data);
            if (c < 0) {
                lo = mid + 1;
            } else if (c > 0) {
                hi = mid;
            } else {
                // Widen [mid, mid + 1) to every candidate that matches.
                size_t lo_hi = mid;
                size_t hi_lo = mid + 1;
                while (lo < lo_hi) {
                    size_t m = lo + (lo_hi - lo) / 2;
                    if (compare_at(m, data) < 0) lo = m + 1;
                    else lo_hi = m;
                }
                while (hi_lo < hi) {
                    size_t m = hi_lo + (hi - hi_lo) / 2;
                    if (compare_at(m, data) > 0) hi = m;
                    else hi_lo = m + 1;
                }
                break;
            }
        }
        cands_ += lo;
        count_ = hi - lo;
        input_len_ += data.size();
    }

    /// @brief The value for the written string, or nullptr if it is not
    /// (exactly) one of the names.
    [[nodiscard]] const T* result() const noexcept {
        if (count_ == 0) return nullptr;
        if (cands_[0].name.size() != input_len_) return nullptr;
        return &cands_[0].value;
    }

private:
    int compare_at(size_t index, std::string_view data) const noexcept {
        return detail::compare_names(
            detail::truncate_name(cands_[index].name, input_len_, data.size()), data);
    }

    const NameEntry<T>* cands_;
    size_t count_;
    size_t input_len_ = 0;
};

} // namespace serdex
