/**
 * @file arbitrary.hpp
 * @brief Generator/shrinker abstraction and its basic combinators
 * @brief 生成/收缩抽象及其基础组合子
 *
 * An Arbitrary<T> knows how to draw a random T at a given size and how to offer
 * simpler candidates for a failing T. Arbitraries are immutable once built and
 * are shared through ArbitraryPtr, so one object may back many runs.
 *
 * Arbitrary<T> 知道如何在给定规模下随机生成 T，以及如何为失败的 T 提供更简单的候选值。
 * Arbitrary 构建后不可变，通过 ArbitraryPtr 共享，可以被多次运行复用。
 *
 * @section usage Basic Usage / 基本用法
 * @code
 * auto even = propcheck::Filter(propcheck::Int32(), [](int32_t x) { return x % 2 == 0; });
 * propcheck::SampleOptions options;
 * options.count = 10;
 * options.seed = 42;
 * auto values = propcheck::Sample(even, options);
 * @endcode
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "propcheck/common.hpp"
#include "propcheck/random.hpp"
#include "propcheck/stream.hpp"

namespace propcheck {

// ==============================================================================
// Arbitrary Base Class / Arbitrary 基类
// ==============================================================================

/**
 * @brief Generator/shrinker for values of type T
 * @brief T 类型值的生成器/收缩器
 */
template <typename T>
class Arbitrary {
public:
    using ValueType = T;

    virtual ~Arbitrary() = default;

    /**
     * @brief Draw a value; @p size biases magnitude or length
     * @brief 生成一个值；@p size 影响数值大小或长度
     */
    virtual T Generate(Random& random, int32_t size) const = 0;

    /**
     * @brief Finite, deterministic sequence of simpler candidates
     * @brief 有限且确定的更简单候选值序列
     *
     * Never uses randomness. Built-in arbitraries never offer @p value itself.
     * 不使用随机数。内置 Arbitrary 不会给出 @p value 本身。
     */
    virtual Stream<T> Shrink(const T& value) const = 0;
};

template <typename T>
using ArbitraryPtr = std::shared_ptr<const Arbitrary<T>>;

// ==============================================================================
// Function Arbitrary / 函数 Arbitrary
// ==============================================================================

/**
 * @brief Arbitrary assembled from a generate function and a shrink function
 * @brief 由生成函数和收缩函数组成的 Arbitrary
 */
template <typename T>
class FunctionArbitrary final : public Arbitrary<T> {
public:
    using GenerateFn = std::function<T(Random&, int32_t)>;
    using ShrinkFn = std::function<Stream<T>(const T&)>;

    FunctionArbitrary(GenerateFn generate, ShrinkFn shrink)
        : m_generate(std::move(generate)), m_shrink(std::move(shrink)) {}

    T Generate(Random& random, int32_t size) const override { return m_generate(random, size); }

    Stream<T> Shrink(const T& value) const override {
        return m_shrink ? m_shrink(value) : Stream<T>::Empty();
    }

private:
    GenerateFn m_generate;
    ShrinkFn m_shrink;
};

template <typename T>
ArbitraryPtr<T> Create(typename FunctionArbitrary<T>::GenerateFn generate,
                       typename FunctionArbitrary<T>::ShrinkFn shrink = nullptr) {
    return std::make_shared<FunctionArbitrary<T>>(std::move(generate), std::move(shrink));
}

// ==============================================================================
// Constant / 常量
// ==============================================================================

template <typename T>
class ConstantArbitrary final : public Arbitrary<T> {
public:
    explicit ConstantArbitrary(T value) : m_value(std::move(value)) {}

    T Generate(Random&, int32_t) const override { return m_value; }
    Stream<T> Shrink(const T&) const override { return Stream<T>::Empty(); }

private:
    T m_value;
};

/**
 * @brief Always produces @p value and never shrinks
 * @brief 总是产生 @p value 且不收缩
 */
template <typename T>
ArbitraryPtr<std::decay_t<T>> Constant(T&& value) {
    return std::make_shared<ConstantArbitrary<std::decay_t<T>>>(std::forward<T>(value));
}

// ==============================================================================
// Elements / 元素集合
// ==============================================================================

/**
 * @brief Uniform pick from a fixed list; shrinks toward the first element
 * @brief 从固定列表均匀选取；向第一个元素收缩
 */
template <typename T>
class ElementsArbitrary final : public Arbitrary<T> {
public:
    explicit ElementsArbitrary(std::vector<T> values) : m_values(std::move(values)) {
        if (m_values.empty()) {
            throw UsageError(ErrorCode::InvalidArgument, "Elements requires at least one value");
        }
    }

    T Generate(Random& random, int32_t) const override {
        const auto index = static_cast<size_t>(random.Next() * static_cast<double>(m_values.size()));
        return m_values[index];
    }

    Stream<T> Shrink(const T& value) const override {
        for (size_t i = 0; i < m_values.size(); ++i) {
            if (m_values[i] == value) {
                std::vector<T> earlier(m_values.rbegin() + static_cast<std::ptrdiff_t>(m_values.size() - i),
                                       m_values.rend());
                return Stream<T>::Of(std::move(earlier));
            }
        }
        return Stream<T>::Empty();
    }

private:
    std::vector<T> m_values;
};

template <typename T>
ArbitraryPtr<T> Elements(std::vector<T> values) {
    return std::make_shared<ElementsArbitrary<T>>(std::move(values));
}

template <typename T>
ArbitraryPtr<T> Elements(std::initializer_list<T> values) {
    return Elements(std::vector<T>(values));
}

// ==============================================================================
// Map / 映射
// ==============================================================================

/**
 * @brief Arbitrary<U> obtained through a conversion pair
 * @brief 通过一对转换函数得到的 Arbitrary<U>
 *
 * @p from must be a left inverse of @p to on generated values; this is not checked.
 * @p from 必须是 @p to 在生成值上的左逆；不做检查。
 */
template <typename T, typename U>
class MapArbitrary final : public Arbitrary<U> {
public:
    MapArbitrary(ArbitraryPtr<T> inner, std::function<U(const T&)> to, std::function<T(const U&)> from)
        : m_inner(std::move(inner)), m_to(std::move(to)), m_from(std::move(from)) {}

    U Generate(Random& random, int32_t size) const override {
        return m_to(m_inner->Generate(random, size));
    }

    Stream<U> Shrink(const U& value) const override {
        return m_inner->Shrink(m_from(value)).Map([to = m_to](T x) { return to(x); });
    }

private:
    ArbitraryPtr<T> m_inner;
    std::function<U(const T&)> m_to;
    std::function<T(const U&)> m_from;
};

template <typename T, typename To, typename From>
auto Map(ArbitraryPtr<T> inner, To to, From from)
    -> ArbitraryPtr<std::decay_t<std::invoke_result_t<To, const T&>>> {
    using U = std::decay_t<std::invoke_result_t<To, const T&>>;
    return std::make_shared<MapArbitrary<T, U>>(std::move(inner), std::move(to), std::move(from));
}

// ==============================================================================
// Filter / 过滤
// ==============================================================================

/**
 * @brief Keeps only values satisfying a predicate
 * @brief 只保留满足谓词的值
 *
 * Generation redraws until the predicate holds, without any attempt limit: an
 * always-false predicate never returns.
 * 生成时不断重抽直到谓词成立，没有次数上限：恒假谓词永不返回。
 */
template <typename T>
class FilterArbitrary final : public Arbitrary<T> {
public:
    FilterArbitrary(ArbitraryPtr<T> inner, std::function<bool(const T&)> predicate)
        : m_inner(std::move(inner)), m_predicate(std::move(predicate)) {}

    T Generate(Random& random, int32_t size) const override {
        while (true) {
            T value = m_inner->Generate(random, size);
            if (m_predicate(value)) {
                return value;
            }
        }
    }

    Stream<T> Shrink(const T& value) const override {
        return m_inner->Shrink(value).Filter([predicate = m_predicate](const T& x) { return predicate(x); });
    }

private:
    ArbitraryPtr<T> m_inner;
    std::function<bool(const T&)> m_predicate;
};

template <typename T, typename P>
ArbitraryPtr<T> Filter(ArbitraryPtr<T> inner, P predicate) {
    return std::make_shared<FilterArbitrary<T>>(std::move(inner), std::move(predicate));
}

// ==============================================================================
// Forward Declaration / 前向声明
// ==============================================================================

/**
 * @brief Indirection cell for recursive arbitraries
 * @brief 用于递归 Arbitrary 的间接引用单元
 *
 * Hand out Handle() where the definition refers back to itself, then call
 * Define() exactly once. The cell owns its definition and the handles only
 * observe the cell, so a recursive definition does not keep itself alive.
 * Using the cell before Define() throws UsageError(NotInitialized).
 *
 * 在定义需要引用自身的地方使用 Handle()，然后只调用一次 Define()。
 * 单元拥有其定义，句柄只观察单元，因此递归定义不会让自身永远存活。
 * 在 Define() 之前使用会抛出 UsageError(NotInitialized)。
 *
 * @note Passing the cell itself (rather than Handle()) into its own definition
 *       forms a shared_ptr cycle.
 */
template <typename T>
class ForwardArbitrary final : public Arbitrary<T>, public std::enable_shared_from_this<ForwardArbitrary<T>> {
public:
    void Define(ArbitraryPtr<T> definition) {
        if (!definition) {
            throw UsageError(ErrorCode::InvalidArgument, "forward definition must not be null");
        }
        if (m_definition) {
            throw UsageError(ErrorCode::AlreadyInitialized, "forward definition already assigned");
        }
        m_definition = std::move(definition);
    }

    bool IsDefined() const noexcept { return m_definition != nullptr; }

    /**
     * @brief Non-owning reference to this cell for use inside its definition
     * @brief 指向本单元的非拥有引用，用于其自身定义中
     *
     * The cell must be owned by a shared_ptr (see Forward()). A handle used after
     * the cell is destroyed throws UsageError(NotInitialized).
     */
    ArbitraryPtr<T> Handle() const;

    T Generate(Random& random, int32_t size) const override { return Definition().Generate(random, size); }
    Stream<T> Shrink(const T& value) const override { return Definition().Shrink(value); }

private:
    const Arbitrary<T>& Definition() const {
        if (!m_definition) {
            throw UsageError(ErrorCode::NotInitialized, "forward definition not assigned");
        }
        return *m_definition;
    }

    ArbitraryPtr<T> m_definition;
};

/**
 * @brief Arbitrary that forwards to a ForwardArbitrary it does not own
 * @brief 转发到一个不拥有的 ForwardArbitrary 的 Arbitrary
 */
template <typename T>
class ForwardHandle final : public Arbitrary<T> {
public:
    explicit ForwardHandle(std::weak_ptr<const ForwardArbitrary<T>> cell) : m_cell(std::move(cell)) {}

    T Generate(Random& random, int32_t size) const override { return Cell()->Generate(random, size); }
    Stream<T> Shrink(const T& value) const override { return Cell()->Shrink(value); }

private:
    std::shared_ptr<const ForwardArbitrary<T>> Cell() const {
        auto cell = m_cell.lock();
        if (!cell) {
            throw UsageError(ErrorCode::NotInitialized, "forward cell already released");
        }
        return cell;
    }

    std::weak_ptr<const ForwardArbitrary<T>> m_cell;
};

template <typename T>
ArbitraryPtr<T> ForwardArbitrary<T>::Handle() const {
    return std::make_shared<ForwardHandle<T>>(this->weak_from_this());
}

template <typename T>
std::shared_ptr<ForwardArbitrary<T>> Forward() {
    return std::make_shared<ForwardArbitrary<T>>();
}

// ==============================================================================
// Sample / 采样
// ==============================================================================

/**
 * @brief Options for Sample()
 * @brief Sample() 的选项
 */
struct SampleOptions {
    int32_t count = 100;         ///< Number of values / 值的数量
    int32_t initialSize = 0;     ///< Size of the first draw / 第一次生成的规模
    int32_t delta = 2;           ///< Size increment per draw / 每次生成的规模增量
    std::optional<uint32_t> seed;  ///< Defaults to SeedOfNow() / 默认为 SeedOfNow()
};

/**
 * @brief Draw a batch of values without running any predicate
 * @brief 不运行谓词，直接生成一批值
 */
template <typename T>
std::vector<T> Sample(const Arbitrary<T>& arbitrary, const SampleOptions& options = {}) {
    if (options.count < 0) {
        throw UsageError(ErrorCode::InvalidArgument, "sample count must not be negative");
    }
    Random random(options.seed ? *options.seed : SeedOfNow());
    std::vector<T> values;
    values.reserve(static_cast<size_t>(options.count));
    int32_t size = options.initialSize;
    for (int32_t i = 0; i < options.count; ++i, size += options.delta) {
        values.push_back(arbitrary.Generate(random, size));
    }
    return values;
}

template <typename T>
std::vector<T> Sample(const ArbitraryPtr<T>& arbitrary, const SampleOptions& options = {}) {
    return Sample(*arbitrary, options);
}

}  // namespace propcheck
