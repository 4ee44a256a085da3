#pragma once

#include <RILL/Defines.hpp>
#include <RILL/Primitives.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <iomanip>
#include <limits>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace RILL
{
    /// \brief  Passed to your benchmarked function so it can bracket
    ///         exactly the code you want measured.
    class BenchmarkContext
    {
    public:
        /// \brief  Begin timing.
        void start()
        {
            m_start = Clock::now();
        }

        /// \brief  End timing and return the elapsed nanoseconds.
        F64 stop()
        {
            m_elapsed = std::chrono::duration<F64, std::nano>(Clock::now() - m_start).count();
            return m_elapsed;
        }

        [[nodiscard]] F64 elapsed() const noexcept { return m_elapsed; }

        /// \brief  Prevents compiler from optimizing away `value`.
        template<typename T>
        RILL_ALWAYS_INLINE void doNotOptimize(T const& value) const
        {
#if defined(__clang__) || defined(__GNUC__)
            asm volatile("" : : "g"(value) : "memory");
#elif defined(_MSC_VER)
            _ReadWriteBarrier();
            (void) value;
#else
            volatile char dummy = *reinterpret_cast<char const volatile*>(&value);
            (void) dummy;
#endif
        }

    private:
        using Clock = std::chrono::steady_clock;

        Clock::time_point m_start {};
        F64 m_elapsed {0.0};
    };

    /// \brief  Configuration parameters for a benchmark run.
    struct BenchmarkConfig
    {
        Int32 iterations       = 1000;
        Int32 warmupIterations = 100;
    };

    /// \brief  Timing statistics of one benchmark, in `DesiredUnit` (a std::chrono duration).
    template<typename DesiredUnit>
    struct BenchmarkResult
    {
        std::string name        = "Unknown Benchmark";
        Int32 numIterations     = 0;
        F64 averageTime         = 0.0;
        F64 minTime             = 0.0;
        F64 maxTime             = 0.0;
        F64 standardDeviation   = 0.0;
    };

    /// \brief  A simple benchmarking engine that runs a user-provided
    ///         void(BenchmarkContext&) functor multiple times and gathers stats.
    class Benchmark
    {
    public:
        template<typename F>
        Benchmark(const BenchmarkConfig& cfg, F&& func, std::string_view benchmarkName)
            : config(cfg), name(benchmarkName), m_callable(std::forward<F>(func))
        {
        }

        /// \brief  Run this benchmark's callable config.iterations times.
        /// \throws std::runtime_error if the user's callable throws.
        template<typename DesiredUnit>
        [[nodiscard]] BenchmarkResult<DesiredUnit> Run()
        {
            BenchmarkResult<DesiredUnit> result;
            result.name          = name;
            result.numIterations = config.iterations;

            for (Int32 i = 0; i < config.warmupIterations; ++i)
            {
                BenchmarkContext ctx;
                m_callable(ctx);
            }

            // Welford's one-pass for mean & variance
            F64 mean    = 0.0;
            F64 M2      = 0.0;
            Int32 count = 0;
            F64 minT    = std::numeric_limits<F64>::infinity();
            F64 maxT    = -std::numeric_limits<F64>::infinity();

            for (Int32 i = 0; i < config.iterations; ++i)
            {
                BenchmarkContext ctx;
                try
                {
                    m_callable(ctx);
                } catch (const std::exception& e)
                {
                    throw std::runtime_error(
                            std::string("Benchmark '") + name +
                            "' threw exception on iteration " +
                            std::to_string(i) + ": " + e.what());
                }

                const F64 elapsed = ctx.elapsed();
                ++count;
                F64 delta = elapsed - mean;
                mean += delta / static_cast<F64>(count);
                M2 += delta * (elapsed - mean);
                minT = std::min(minT, elapsed);
                maxT = std::max(maxT, elapsed);
            }

            const F64 variance = (count > 1 ? (M2 / static_cast<F64>(count)) : 0.0);
            result.averageTime       = FromNanoseconds<DesiredUnit>(mean);
            result.minTime           = FromNanoseconds<DesiredUnit>(minT);
            result.maxTime           = FromNanoseconds<DesiredUnit>(maxT);
            result.standardDeviation = FromNanoseconds<DesiredUnit>(std::sqrt(variance));
            return result;
        }

        /// \brief  Register a void(BenchmarkContext&) callable under defaultConfig.
        template<typename F>
            requires std::is_invocable_r_v<void, F, BenchmarkContext&>
        static void Register(F func, std::string_view benchmarkName)
        {
            Register(BenchmarkConfig {}, std::move(func), benchmarkName);
        }

        /// \brief  Register a callable with custom config.
        template<typename F>
            requires std::is_invocable_r_v<void, F, BenchmarkContext&>
        static void Register(const BenchmarkConfig& cfg, F func, std::string_view benchmarkName)
        {
            auto ptr = std::make_unique<Benchmark>(cfg, std::move(func), benchmarkName);
            std::lock_guard<std::mutex> lock(GetRegistryMutex());
            GetRegistry().push_back(std::move(ptr));
        }

        /// \brief  Runs all registered benchmarks and returns their results.
        template<typename DesiredUnit>
        static std::vector<BenchmarkResult<DesiredUnit>> RunAll()
        {
            std::vector<BenchmarkResult<DesiredUnit>> results;
            std::lock_guard<std::mutex> lock(GetRegistryMutex());
            for (auto const& uptr: GetRegistry())
                results.push_back(uptr->Run<DesiredUnit>());
            return results;
        }

        template<typename DesiredUnit>
        static void PrintSummaryTable(std::ostream& os, const std::vector<BenchmarkResult<DesiredUnit>>& results)
        {
            if (results.empty())
            {
                os << "(no benchmarks to display)\n";
                return;
            }

            const auto format = [](F64 value) {
                std::ostringstream tmp;
                tmp << std::fixed << std::setprecision(4) << value;
                return tmp.str();
            };

            std::size_t wName = std::string_view("Benchmark Name").size();
            for (auto const& r: results)
                wName = std::max(wName, r.name.size());
            constexpr int wValue = 12;

            const auto drawBorder = [&]() {
                os << '+' << std::string(wName + 2, '-');
                for (int i = 0; i < 4; ++i)
                    os << '+' << std::string(wValue + 2, '-');
                os << "+\n";
            };

            drawBorder();
            os << "| " << std::left << std::setw(int(wName)) << "Benchmark Name" << " "
               << "| " << std::right << std::setw(wValue) << "Avg" << " "
               << "| " << std::setw(wValue) << "Min" << " "
               << "| " << std::setw(wValue) << "Max" << " "
               << "| " << std::setw(wValue) << "StdDev" << " |\n";
            drawBorder();
            for (auto const& r: results)
            {
                os << "| " << std::left << std::setw(int(wName)) << r.name << " "
                   << "| " << std::right << std::setw(wValue) << format(r.averageTime) << " "
                   << "| " << std::setw(wValue) << format(r.minTime) << " "
                   << "| " << std::setw(wValue) << format(r.maxTime) << " "
                   << "| " << std::setw(wValue) << format(r.standardDeviation) << " |\n";
            }
            drawBorder();
        }

    private:
        BenchmarkConfig config;
        std::string name;
        std::function<void(BenchmarkContext&)> m_callable;

        template<typename DesiredUnit>
        static F64 FromNanoseconds(F64 nanoseconds)
        {
            return std::chrono::duration_cast<std::chrono::duration<F64, typename DesiredUnit::period>>(
                           std::chrono::duration<F64, std::nano>(nanoseconds))
                    .count();
        }

        static std::vector<std::unique_ptr<Benchmark>>& GetRegistry()
        {
            static std::vector<std::unique_ptr<Benchmark>> registry;
            return registry;
        }

        static std::mutex& GetRegistryMutex()
        {
            static std::mutex registryMutex;
            return registryMutex;
        }
    };
}// namespace RILL
