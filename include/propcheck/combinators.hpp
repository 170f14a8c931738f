/**
 * @file combinators.hpp
 * @brief Structural combinators: arrays, strings, records, tuples and sums
 * @brief 结构组合子：数组、字符串、记录、元组和和类型
 *
 * Every combinator references the arbitraries it is built from and never
 * modifies them. Every shrink sequence here is finite by construction.
 *
 * 每个组合子只引用构成它的 Arbitrary，从不修改它们。这里的每个收缩序列在构造上都是有限的。
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "propcheck/arbitrary.hpp"
#include "propcheck/primitives.hpp"

namespace propcheck {

// ==============================================================================
// Array / 数组
// ==============================================================================

/**
 * @brief Vectors of independent elements with a minimum length
 * @brief 具有最小长度的独立元素 vector
 *
 * Shrinking offers prefixes of half, quarter, ... the length (never shorter than
 * the minimum), each followed by that prefix with one element replaced by one of
 * its own shrinks:
 *
 * 收缩依次给出长度的一半、四分之一……的前缀（不短于最小长度），
 * 每个前缀之后是把其中一个元素替换为该元素收缩值的前缀：
 *
 * @code
 * [1, 2, 3, 4] => [1, 2], [0, 2], [1, 1], [1, 0], [1], [0], []
 * @endcode
 */
template <typename T>
class ArrayArbitrary final : public Arbitrary<std::vector<T>> {
public:
    ArrayArbitrary(ArbitraryPtr<T> element, size_t minLength)
        : m_element(std::move(element)), m_minLength(minLength) {}

    std::vector<T> Generate(Random& random, int32_t size) const override {
        const auto drawn = static_cast<size_t>(random.Range(0, static_cast<double>(size)));
        const size_t count = std::max(m_minLength, drawn);

        std::vector<T> values;
        values.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            values.push_back(m_element->Generate(random, size));
        }
        return values;
    }

    Stream<std::vector<T>> Shrink(const std::vector<T>& values) const override {
        if (values.empty() || values.size() <= m_minLength) {
            return Stream<std::vector<T>>::Empty();
        }

        auto source = std::make_shared<const std::vector<T>>(values);
        auto element = m_element;
        return Stream<std::vector<T>>::FlatMap(
            PrefixLengths(values.size() / 2),
            [source, element](size_t length) {
                auto prefix = std::make_shared<const std::vector<T>>(source->begin(),
                                                                     source->begin() + length);
                return Stream<std::vector<T>>::Concat(
                    Stream<std::vector<T>>::Just(*prefix),
                    Stream<std::vector<T>>::FlatMap(IndexStream(0, length), [prefix, element](size_t index) {
                        return element->Shrink((*prefix)[index]).Map([prefix, index](T replacement) {
                            std::vector<T> candidate = *prefix;
                            candidate[index] = std::move(replacement);
                            return candidate;
                        });
                    }));
            });
    }

    size_t MinLength() const noexcept { return m_minLength; }

private:
    /// first, first / 2, ... while >= minLength, ending after 0
    Stream<size_t> PrefixLengths(size_t first) const {
        struct State {
            size_t next;
            size_t minLength;
            bool done;
        };
        auto state = std::make_shared<State>(State{first, m_minLength, first < m_minLength});
        return Stream<size_t>([state]() -> std::optional<size_t> {
            if (state->done) {
                return std::nullopt;
            }
            const size_t current = state->next;
            state->next = current / 2;
            state->done = current == 0 || state->next < state->minLength;
            return current;
        });
    }

    ArbitraryPtr<T> m_element;
    size_t m_minLength;
};

template <typename T>
ArbitraryPtr<std::vector<T>> Array(ArbitraryPtr<T> element, size_t minLength = 0) {
    return std::make_shared<ArrayArbitrary<T>>(std::move(element), minLength);
}

// ==============================================================================
// String / 字符串
// ==============================================================================

/**
 * @brief UTF-8 strings built from CodePoint() arrays
 * @brief 由 CodePoint() 数组构成的 UTF-8 字符串
 */
ArbitraryPtr<std::string> String();

// ==============================================================================
// Record / 记录
// ==============================================================================

/**
 * @brief Arbitrary for a plain struct, one arbitrary per named member
 * @brief 普通结构体的 Arbitrary，每个具名成员对应一个 Arbitrary
 *
 * Fields are generated and shrunk in sorted name order, whatever order they were
 * registered in.
 * 字段按名称排序后生成和收缩，与注册顺序无关。
 *
 * @code
 * struct Point { int32_t x; std::string label; };
 * auto point = propcheck::Record<Point>()
 *                  .Field("x", &Point::x, propcheck::Int32())
 *                  .Field("label", &Point::label, propcheck::String())
 *                  .Build();
 * @endcode
 */
template <typename S>
class RecordArbitrary final : public Arbitrary<S> {
public:
    class FieldBase {
    public:
        virtual ~FieldBase() = default;
        virtual void Generate(Random& random, int32_t size, S& record) const = 0;
        virtual Stream<S> Shrink(const S& record) const = 0;
    };

    template <typename F>
    class Field final : public FieldBase {
    public:
        Field(F S::*member, ArbitraryPtr<F> arbitrary)
            : m_member(member), m_arbitrary(std::move(arbitrary)) {}

        void Generate(Random& random, int32_t size, S& record) const override {
            record.*m_member = m_arbitrary->Generate(random, size);
        }

        Stream<S> Shrink(const S& record) const override {
            auto member = m_member;
            auto base = std::make_shared<const S>(record);
            return m_arbitrary->Shrink(record.*m_member).Map([member, base](F value) {
                S candidate = *base;
                candidate.*member = std::move(value);
                return candidate;
            });
        }

    private:
        F S::*m_member;
        ArbitraryPtr<F> m_arbitrary;
    };

    using FieldMap = std::map<std::string, std::shared_ptr<const FieldBase>>;

    explicit RecordArbitrary(FieldMap fields) : m_fields(std::move(fields)) {}

    S Generate(Random& random, int32_t size) const override {
        S record{};
        for (const auto& [name, field] : m_fields) {
            field->Generate(random, size, record);
        }
        return record;
    }

    Stream<S> Shrink(const S& record) const override {
        std::vector<std::shared_ptr<const FieldBase>> fields;
        fields.reserve(m_fields.size());
        for (const auto& [name, field] : m_fields) {
            fields.push_back(field);
        }
        auto base = std::make_shared<const S>(record);
        return Stream<S>::FlatMap(Stream<std::shared_ptr<const FieldBase>>::Of(std::move(fields)),
                                  [base](const std::shared_ptr<const FieldBase>& field) {
                                      return field->Shrink(*base);
                                  });
    }

    size_t FieldCount() const noexcept { return m_fields.size(); }

private:
    FieldMap m_fields;
};

/**
 * @brief Builder collecting the fields of a RecordArbitrary
 * @brief 收集 RecordArbitrary 字段的构建器
 */
template <typename S>
class Record {
public:
    /**
     * @throws UsageError (DuplicateField) when @p name is already registered
     */
    template <typename F>
    Record& Field(const std::string& name, F S::*member, ArbitraryPtr<F> arbitrary) {
        using FieldType = typename RecordArbitrary<S>::template Field<F>;
        auto inserted = m_fields.emplace(name, std::make_shared<const FieldType>(member, std::move(arbitrary)));
        if (!inserted.second) {
            throw UsageError(ErrorCode::DuplicateField, "record field '" + name + "' registered twice");
        }
        return *this;
    }

    ArbitraryPtr<S> Build() const { return std::make_shared<RecordArbitrary<S>>(m_fields); }

private:
    typename RecordArbitrary<S>::FieldMap m_fields;
};

// ==============================================================================
// Tuple / 元组
// ==============================================================================

template <typename... Ts>
class TupleArbitrary final : public Arbitrary<std::tuple<Ts...>> {
public:
    using TupleType = std::tuple<Ts...>;

    explicit TupleArbitrary(ArbitraryPtr<Ts>... elements) : m_elements(std::move(elements)...) {}

    TupleType Generate(Random& random, int32_t size) const override {
        return GenerateImpl(random, size, std::index_sequence_for<Ts...>{});
    }

    Stream<TupleType> Shrink(const TupleType& value) const override {
        return ShrinkImpl(value, std::index_sequence_for<Ts...>{});
    }

private:
    template <size_t... Is>
    TupleType GenerateImpl(Random& random, int32_t size, std::index_sequence<Is...>) const {
        // Braced initialization evaluates left to right.
        return TupleType{std::get<Is>(m_elements)->Generate(random, size)...};
    }

    template <size_t I>
    Stream<TupleType> ShrinkAt(std::shared_ptr<const TupleType> base) const {
        using Element = std::tuple_element_t<I, TupleType>;
        return std::get<I>(m_elements)->Shrink(std::get<I>(*base)).Map([base](Element replacement) {
            TupleType candidate = *base;
            std::get<I>(candidate) = std::move(replacement);
            return candidate;
        });
    }

    template <size_t... Is>
    Stream<TupleType> ShrinkImpl(const TupleType& value, std::index_sequence<Is...>) const {
        auto base = std::make_shared<const TupleType>(value);
        std::vector<Stream<TupleType>> positions;
        positions.reserve(sizeof...(Ts));
        (positions.push_back(ShrinkAt<Is>(base)), ...);
        return Stream<TupleType>::FlatMap(Stream<Stream<TupleType>>::Of(std::move(positions)),
                                          [](Stream<TupleType> position) { return position; });
    }

    std::tuple<ArbitraryPtr<Ts>...> m_elements;
};

template <typename... Ts>
ArbitraryPtr<std::tuple<Ts...>> Tuple(ArbitraryPtr<Ts>... elements) {
    return std::make_shared<TupleArbitrary<Ts...>>(std::move(elements)...);
}

/**
 * @brief Homogeneous tuple: a fixed-arity vector with one arbitrary per position
 * @brief 同构元组：每个位置对应一个 Arbitrary 的定长 vector
 *
 * A value whose length differs from the arity has no shrinks.
 * 长度与元数不同的值没有收缩候选。
 */
template <typename T>
class TupleOfArbitrary final : public Arbitrary<std::vector<T>> {
public:
    explicit TupleOfArbitrary(std::vector<ArbitraryPtr<T>> elements) : m_elements(std::move(elements)) {
        if (m_elements.empty()) {
            throw UsageError(ErrorCode::InvalidArgument, "TupleOf requires at least one element");
        }
    }

    std::vector<T> Generate(Random& random, int32_t size) const override {
        std::vector<T> values;
        values.reserve(m_elements.size());
        for (const auto& element : m_elements) {
            values.push_back(element->Generate(random, size));
        }
        return values;
    }

    Stream<std::vector<T>> Shrink(const std::vector<T>& values) const override {
        if (values.size() != m_elements.size()) {
            return Stream<std::vector<T>>::Empty();
        }
        auto base = std::make_shared<const std::vector<T>>(values);
        auto elements = m_elements;
        return Stream<std::vector<T>>::FlatMap(IndexStream(0, values.size()), [base, elements](size_t index) {
            return elements[index]->Shrink((*base)[index]).Map([base, index](T replacement) {
                std::vector<T> candidate = *base;
                candidate[index] = std::move(replacement);
                return candidate;
            });
        });
    }

private:
    std::vector<ArbitraryPtr<T>> m_elements;
};

template <typename T>
ArbitraryPtr<std::vector<T>> TupleOf(std::vector<ArbitraryPtr<T>> elements) {
    return std::make_shared<TupleOfArbitrary<T>>(std::move(elements));
}

// ==============================================================================
// Sum / 和类型
// ==============================================================================

/**
 * @brief Tagged union of branches
 * @brief 分支的带标签联合
 *
 * The variant's active index records the branch a value came from, so shrinking
 * always goes back to that branch and keeps the same index on every candidate.
 * variant 的活动下标记录值来自哪个分支，收缩时总是回到该分支，且每个候选值保持相同下标。
 */
template <typename... Ts>
class SumArbitrary final : public Arbitrary<std::variant<Ts...>> {
public:
    using VariantType = std::variant<Ts...>;
    static constexpr size_t kBranchCount = sizeof...(Ts);

    explicit SumArbitrary(ArbitraryPtr<Ts>... branches) : m_branches(std::move(branches)...) {}

    VariantType Generate(Random& random, int32_t size) const override {
        const auto branch = static_cast<size_t>(random.Next() * static_cast<double>(kBranchCount));
        return GenerateImpl(branch, random, size, std::index_sequence_for<Ts...>{});
    }

    Stream<VariantType> Shrink(const VariantType& value) const override {
        return ShrinkImpl(value, std::index_sequence_for<Ts...>{});
    }

private:
    template <size_t I>
    VariantType GenerateBranch(Random& random, int32_t size) const {
        return VariantType(std::in_place_index<I>, std::get<I>(m_branches)->Generate(random, size));
    }

    template <size_t... Is>
    VariantType GenerateImpl(size_t branch, Random& random, int32_t size, std::index_sequence<Is...>) const {
        std::optional<VariantType> result;
        ((branch == Is ? (result.emplace(GenerateBranch<Is>(random, size)), true) : false) || ...);
        return std::move(*result);
    }

    template <size_t I>
    Stream<VariantType> ShrinkBranch(const VariantType& value) const {
        using Branch = std::variant_alternative_t<I, VariantType>;
        return std::get<I>(m_branches)->Shrink(std::get<I>(value)).Map([](Branch candidate) {
            return VariantType(std::in_place_index<I>, std::move(candidate));
        });
    }

    template <size_t... Is>
    Stream<VariantType> ShrinkImpl(const VariantType& value, std::index_sequence<Is...>) const {
        Stream<VariantType> result;
        ((value.index() == Is ? (result = ShrinkBranch<Is>(value), true) : false) || ...);
        return result;
    }

    std::tuple<ArbitraryPtr<Ts>...> m_branches;
};

template <typename... Ts>
ArbitraryPtr<std::variant<Ts...>> Sum(ArbitraryPtr<Ts>... branches) {
    static_assert(sizeof...(Ts) > 0, "Sum requires at least one branch");
    return std::make_shared<SumArbitrary<Ts...>>(std::move(branches)...);
}

// ==============================================================================
// Optional and Nullable / 可选与可空
// ==============================================================================

/**
 * @brief Absent or a value of @p inner, with equal probability
 * @brief 以相同概率产生空值或 @p inner 的值
 *
 * Built on Sum(Constant(monostate), inner): a present value only shrinks to
 * other present values, never to std::nullopt.
 * 基于 Sum(Constant(monostate), inner)：有值时只收缩到其他有值的候选，绝不收缩到 std::nullopt。
 */
template <typename T>
ArbitraryPtr<std::optional<T>> Optional(ArbitraryPtr<T> inner) {
    using Branches = std::variant<std::monostate, T>;
    return Map(
        Sum(Constant(std::monostate{}), std::move(inner)),
        [](const Branches& branch) -> std::optional<T> {
            if (branch.index() == 0) {
                return std::nullopt;
            }
            return std::get<1>(branch);
        },
        [](const std::optional<T>& value) -> Branches {
            if (!value) {
                return Branches(std::in_place_index<0>);
            }
            return Branches(std::in_place_index<1>, *value);
        });
}

/**
 * @brief Null or a shared pointer to a value of @p inner
 * @brief 空指针或指向 @p inner 值的共享指针
 */
template <typename T>
ArbitraryPtr<std::shared_ptr<const T>> Nullable(ArbitraryPtr<T> inner) {
    using Branches = std::variant<std::monostate, T>;
    return Map(
        Sum(Constant(std::monostate{}), std::move(inner)),
        [](const Branches& branch) -> std::shared_ptr<const T> {
            if (branch.index() == 0) {
                return nullptr;
            }
            return std::make_shared<const T>(std::get<1>(branch));
        },
        [](const std::shared_ptr<const T>& value) -> Branches {
            if (!value) {
                return Branches(std::in_place_index<0>);
            }
            return Branches(std::in_place_index<1>, *value);
        });
}

}  // namespace propcheck
