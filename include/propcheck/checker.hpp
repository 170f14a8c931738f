/**
 * @file checker.hpp
 * @brief Checker facade: an arbitrary bundled with its stringifier
 * @brief Checker 门面：Arbitrary 与其字符串化函数的组合
 *
 * Checker<T> is a cheap value type. Every transformation returns a new Checker
 * and leaves the original untouched; the printer is carried along so reports of
 * derived checkers stay readable.
 *
 * Checker<T> 是轻量值类型。每个变换都返回新的 Checker，不修改原对象；
 * 打印函数随之传递，派生 Checker 的报告仍然可读。
 *
 * @section usage Basic Usage / 基本用法
 * @code
 * auto positive = propcheck::FromArbitrary(propcheck::Int32()).Filter([](int32_t x) { return x > 0; });
 * propcheck::Config config;
 * config.reporter = propcheck::ConsoleReporter();
 * positive.Array().Check([](const std::vector<int32_t>& xs) { return xs.size() < 1000; }, config);
 * @endcode
 *
 * @copyright Copyright (c) 2024 propcheck
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "propcheck/arbitrary.hpp"
#include "propcheck/check.hpp"
#include "propcheck/combinators.hpp"
#include "propcheck/show.hpp"

namespace propcheck {

template <typename T>
class Checker {
public:
    using ValueType = T;

    /**
     * @throws UsageError(InvalidArgument) if @p arbitrary is null
     */
    Checker(ArbitraryPtr<T> arbitrary, Show<T> show) : m_arbitrary(std::move(arbitrary)), m_show(std::move(show)) {
        if (!m_arbitrary) {
            throw UsageError(ErrorCode::InvalidArgument, "Checker requires an arbitrary");
        }
        if (!m_show) {
            m_show = [](const T& value) { return Stringify(value); };
        }
    }

    const ArbitraryPtr<T>& GetArbitrary() const noexcept { return m_arbitrary; }
    const Show<T>& GetShow() const noexcept { return m_show; }

    T Generate(Random& random, int32_t size) const { return m_arbitrary->Generate(random, size); }
    Stream<T> Shrink(const T& value) const { return m_arbitrary->Shrink(value); }
    std::string Print(const T& value) const { return m_show(value); }

    template <typename Predicate>
    TestResult<T> Check(Predicate&& predicate, const Config& config = {}) const {
        return propcheck::Check(*m_arbitrary, m_show, std::forward<Predicate>(predicate), config);
    }

    std::vector<T> Sample(const SampleOptions& options = {}) const { return propcheck::Sample(*m_arbitrary, options); }

    Checker<std::vector<T>> Array(size_t minLength = 0) const {
        Show<T> show = m_show;
        return Checker<std::vector<T>>(propcheck::Array(m_arbitrary, minLength),
                                       [show](const std::vector<T>& values) {
                                           std::string result = "[";
                                           for (size_t i = 0; i < values.size(); ++i) {
                                               if (i > 0) {
                                                   result += ", ";
                                               }
                                               result += show(values[i]);
                                           }
                                           return result + "]";
                                       });
    }

    /**
     * @brief Convert through @p to, shrinking through @p from
     * @brief 通过 @p to 转换，通过 @p from 收缩
     *
     * The resulting checker prints with Stringify; use WithPrinter to change it.
     */
    template <typename To, typename From>
    auto Map(To to, From from) const -> Checker<std::decay_t<std::invoke_result_t<To, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<To, const T&>>;
        return Checker<U>(propcheck::Map(m_arbitrary, std::move(to), std::move(from)),
                          [](const U& value) { return Stringify(value); });
    }

    template <typename Predicate>
    Checker Filter(Predicate predicate) const {
        return Checker(propcheck::Filter(m_arbitrary, std::move(predicate)), m_show);
    }

    Checker<std::optional<T>> Optional() const {
        Show<T> show = m_show;
        return Checker<std::optional<T>>(propcheck::Optional(m_arbitrary), [show](const std::optional<T>& value) {
            return value ? show(*value) : std::string("nullopt");
        });
    }

    Checker<std::shared_ptr<const T>> Nullable() const {
        Show<T> show = m_show;
        return Checker<std::shared_ptr<const T>>(propcheck::Nullable(m_arbitrary),
                                                 [show](const std::shared_ptr<const T>& value) {
                                                     return value ? show(*value) : std::string("null");
                                                 });
    }

    /// Same arbitrary, different printer / 相同 Arbitrary，不同打印函数
    Checker WithPrinter(Show<T> show) const { return Checker(m_arbitrary, std::move(show)); }

private:
    ArbitraryPtr<T> m_arbitrary;
    Show<T> m_show;
};

/**
 * @brief Checker printing with Stringify
 * @brief 使用 Stringify 打印的 Checker
 */
template <typename T>
Checker<T> FromArbitrary(ArbitraryPtr<T> arbitrary) {
    return Checker<T>(std::move(arbitrary), [](const T& value) { return Stringify(value); });
}

template <typename T>
Checker<T> FromArbitrary(ArbitraryPtr<T> arbitrary, Show<T> show) {
    return Checker<T>(std::move(arbitrary), std::move(show));
}

}  // namespace propcheck
