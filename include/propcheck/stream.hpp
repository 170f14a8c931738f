/**
 * @file stream.hpp
 * @brief Finite lazily pulled sequences used for shrink candidates
 * @brief 用于收缩候选值的有限惰性序列
 *
 * A Stream produces its elements one at a time on demand. Shrink-search usually
 * stops after the first few candidates, so combinators build their candidate
 * sequences out of Streams and never materialize them up front.
 *
 * Stream 按需逐个产生元素。收缩搜索通常在前几个候选值后就停止，
 * 因此组合子用 Stream 构建候选序列，而不是预先生成全部元素。
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace propcheck {

/**
 * @brief Finite lazy sequence of T
 * @brief T 的有限惰性序列
 *
 * Single pass: once Next() returns std::nullopt the stream stays exhausted.
 * Copies share the underlying source.
 *
 * 单次遍历：Next() 返回 std::nullopt 后流保持耗尽状态。副本共享底层数据源。
 */
template <typename T>
class Stream {
public:
    using value_type = T;
    using Pull = std::function<std::optional<T>()>;

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        Iterator() = default;
        explicit Iterator(Stream* stream) : m_stream(stream) { Advance(); }

        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }

        Iterator& operator++() {
            Advance();
            return *this;
        }

        bool operator==(const Iterator& other) const {
            return m_current.has_value() == other.m_current.has_value();
        }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        void Advance() { m_current = m_stream ? m_stream->Next() : std::nullopt; }

        Stream* m_stream = nullptr;
        std::optional<T> m_current;
    };

    /// Empty stream / 空流
    Stream() = default;

    explicit Stream(Pull pull) : m_pull(std::move(pull)) {}

    /**
     * @brief Pull the next element, or std::nullopt when exhausted
     * @brief 取出下一个元素，耗尽时返回 std::nullopt
     */
    std::optional<T> Next() {
        if (!m_pull) {
            return std::nullopt;
        }
        std::optional<T> value = m_pull();
        if (!value) {
            m_pull = nullptr;
        }
        return value;
    }

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

    /**
     * @brief Drain up to @p limit elements into a vector
     * @brief 最多取出 @p limit 个元素到 vector
     */
    std::vector<T> ToVector(size_t limit = std::numeric_limits<size_t>::max()) {
        std::vector<T> result;
        while (result.size() < limit) {
            std::optional<T> value = Next();
            if (!value) {
                break;
            }
            result.push_back(std::move(*value));
        }
        return result;
    }

    // =========================================================================
    // Construction / 构造
    // =========================================================================

    static Stream Empty() { return Stream(); }

    static Stream Just(T value) {
        auto pending = std::make_shared<std::optional<T>>(std::move(value));
        return Stream([pending]() -> std::optional<T> {
            std::optional<T> result = std::move(*pending);
            pending->reset();
            return result;
        });
    }

    static Stream Of(std::vector<T> values) {
        struct State {
            std::vector<T> values;
            size_t index = 0;
        };
        auto state = std::make_shared<State>(State{std::move(values), 0});
        return Stream([state]() -> std::optional<T> {
            if (state->index >= state->values.size()) {
                return std::nullopt;
            }
            return state->values[state->index++];
        });
    }

    /**
     * @brief All elements of @p first, then all elements of @p second
     * @brief 先 @p first 的所有元素，再 @p second 的所有元素
     */
    static Stream Concat(Stream first, Stream second) {
        struct State {
            Stream first;
            Stream second;
        };
        auto state = std::make_shared<State>(State{std::move(first), std::move(second)});
        return Stream([state]() -> std::optional<T> {
            if (std::optional<T> value = state->first.Next()) {
                return value;
            }
            return state->second.Next();
        });
    }

    /**
     * @brief Concatenation of f(u) for every u of @p outer, built lazily
     * @brief 对 @p outer 的每个 u 惰性拼接 f(u)
     */
    template <typename U, typename F>
    static Stream FlatMap(Stream<U> outer, F f) {
        struct State {
            Stream<U> outer;
            Stream inner;
            F f;
        };
        auto state = std::make_shared<State>(State{std::move(outer), Stream(), std::move(f)});
        return Stream([state]() -> std::optional<T> {
            while (true) {
                if (std::optional<T> value = state->inner.Next()) {
                    return value;
                }
                std::optional<U> next = state->outer.Next();
                if (!next) {
                    return std::nullopt;
                }
                state->inner = state->f(std::move(*next));
            }
        });
    }

    // =========================================================================
    // Transformation / 变换
    // =========================================================================

    template <typename F>
    Stream<std::invoke_result_t<F, T>> Map(F f) && {
        using U = std::invoke_result_t<F, T>;
        auto source = std::make_shared<Stream>(std::move(*this));
        return Stream<U>([source, f = std::move(f)]() -> std::optional<U> {
            std::optional<T> value = source->Next();
            if (!value) {
                return std::nullopt;
            }
            return f(std::move(*value));
        });
    }

    template <typename P>
    Stream Filter(P predicate) && {
        auto source = std::make_shared<Stream>(std::move(*this));
        return Stream([source, predicate = std::move(predicate)]() -> std::optional<T> {
            while (std::optional<T> value = source->Next()) {
                if (predicate(*value)) {
                    return value;
                }
            }
            return std::nullopt;
        });
    }

private:
    Pull m_pull;
};

/**
 * @brief Indices begin, begin + 1, ..., end - 1
 * @brief 下标 begin, begin + 1, ..., end - 1
 */
inline Stream<size_t> IndexStream(size_t begin, size_t end) {
    auto next = std::make_shared<size_t>(begin);
    return Stream<size_t>([next, end]() -> std::optional<size_t> {
        if (*next >= end) {
            return std::nullopt;
        }
        return (*next)++;
    });
}

}  // namespace propcheck
