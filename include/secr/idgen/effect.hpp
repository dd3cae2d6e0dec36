#pragma once

#include <future>
#include <type_traits>
#include <utility>

namespace secr { namespace idgen {

    /// Customization point describing a deferred computation `Effect<T>`.
    ///
    /// A specialization provides:
    ///   delay(f)    an Effect<R> that calls f() when run
    ///   map(fa, f)  an Effect<R> that applies f to the result of fa
    ///   run(fa)     forces fa, returning its result
    template<template<class...> class Effect>
    struct effect_traits;

    template<>
    struct effect_traits<std::future>
    {
        template<class F>
        static auto delay(F&& f)
        -> std::future<std::result_of_t<std::decay_t<F>()>>
        {
            return std::async(std::launch::deferred, std::forward<F>(f));
        }

        template<class T, class F>
        static auto map(std::future<T> fa, F&& f)
        -> std::future<std::result_of_t<std::decay_t<F>(T)>>
        {
            return std::async(std::launch::deferred,
                              [](std::future<T> fa, std::decay_t<F> f) {
                                  return f(fa.get());
                              },
                              std::move(fa),
                              std::forward<F>(f));
        }

        template<class T>
        static T run(std::future<T> fa)
        {
            return fa.get();
        }
    };

}}
