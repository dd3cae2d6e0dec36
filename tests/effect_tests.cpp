#include <gtest/gtest.h>
#include <secr/idgen/effect.hpp>
#include <secr/idgen/random.hpp>

#include <boost/uuid/uuid_io.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>

using namespace secr::idgen;

namespace {

    /// a computation that runs each time it is forced
    template<class T>
    struct lazy
    {
        std::function<T()> thunk;
    };

    std::shared_ptr<int> draws = std::make_shared<int>(0);
}

namespace secr { namespace idgen {

    template<>
    struct effect_traits<lazy>
    {
        template<class F>
        static auto delay(F&& f) -> lazy<std::result_of_t<std::decay_t<F>()>>
        {
            auto g = std::decay_t<F>(std::forward<F>(f));
            return { [g] { ++*draws; return g(); } };
        }

        template<class T, class F>
        static auto map(lazy<T> fa, F&& f) -> lazy<std::result_of_t<std::decay_t<F>(T)>>
        {
            auto g = std::decay_t<F>(std::forward<F>(f));
            return { [fa, g] { return g(fa.thunk()); } };
        }

        template<class T>
        static T run(lazy<T> fa)
        {
            return fa.thunk();
        }
    };

}}

TEST(effect_tests, future_is_deferred)
{
    auto fa = random_uuid<std::future>();
    EXPECT_EQ(std::future_status::deferred, fa.wait_for(std::chrono::seconds(0)));
    auto value = effect_traits<std::future>::run(std::move(fa));
    EXPECT_EQ(uuid::version_random_number_based, value.version());
}

TEST(effect_tests, future_map)
{
    auto fa = effect_traits<std::future>::delay([] { return 20; });
    auto fb = effect_traits<std::future>::map(std::move(fa), [](int x) { return x + 1; });
    EXPECT_EQ(std::future_status::deferred, fb.wait_for(std::chrono::seconds(0)));
    EXPECT_EQ(21, fb.get());
}

TEST(effect_tests, other_effects)
{
    *draws = 0;
    auto fa = random_uuid<lazy>();
    EXPECT_EQ(0, *draws);

    auto a = effect_traits<lazy>::run(fa);
    auto b = effect_traits<lazy>::run(fa);
    EXPECT_EQ(2, *draws);
    EXPECT_NE(a, b);
}

TEST(effect_tests, random_values_differ)
{
    EXPECT_NE(generate_random_uuid(), generate_random_uuid());
}
