//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/PackageRunner.cpp
// Purpose: Run benchmark sessions over a package and report the results.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

#include "bench/PackageRunner.hpp"

#include "bench/Isolation.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <iostream>

namespace hat::bench
{

using support::ErrorKind;
using support::Expected;

namespace
{

/// @brief Shortest text that reads back as @p value.
std::string formatDouble(double value)
{
    std::array<char, 32> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc())
        return std::to_string(value);
    return std::string(buffer.data(), end);
}

/// @brief Value stored in the package for @p result.
double persistedMean(const TimingResult &result)
{
    return result.summary ? result.summary->meanOfMeans : result.meanDuration;
}

} // namespace

NativeResolver resolverFor(const invoke::NativeLibrary &library)
{
    return [&library](const schema::FunctionSpec &fn) { return library.resolve(fn); };
}

bool isHelperFunction(std::string_view name)
{
    return name.find("Initialize") != std::string_view::npos ||
           name.find("_debug_check_allclose") != std::string_view::npos;
}

Expected<PackageRunReport> benchmarkPackage(schema::Package &package,
                                            const NativeResolver &resolve,
                                            const PackageRunOptions &options,
                                            const SessionHooks &hooks)
{
    if (auto ok = validateOptions(options.benchmark); !ok)
        return ok.takeError();

    std::vector<std::string> names = options.functions;
    if (names.empty())
    {
        for (const auto &fn : package.functions())
            names.push_back(fn.name);
    }
    for (const auto &name : names)
    {
        if (!package.find(name))
            return support::makeError(
                ErrorKind::UnknownFunction, "package has no function '" + name + "'", name);
    }

    std::ostream &trace = hooks.trace ? *hooks.trace : std::cerr;
    PackageRunReport report;
    auto fail = [&](support::Diag diag)
    {
        if (hooks.diags)
            hooks.diags->report(diag);
        report.failures.push_back(std::move(diag));
    };

    for (const auto &name : names)
    {
        if (isHelperFunction(name))
        {
            report.skipped.push_back(name);
            continue;
        }
        if (options.benchmark.verbose)
            trace << "[bench] benchmarking function: " << name << '\n';

        // Copy: storing auxiliary metadata below may touch the package.
        const schema::FunctionSpec fn = *package.find(name);
        auto native = resolve(fn);
        if (!native)
        {
            fail(native.takeError());
            continue;
        }

        auto result = options.isolate ? runIsolated(fn, native.value(), options.benchmark, hooks)
                                      : runBenchmark(fn, native.value(), options.benchmark, hooks);
        if (!result)
        {
            auto diag = result.takeError();
            if (diag.function.empty())
                diag.function = name;
            fail(std::move(diag));
            continue;
        }

        const TimingResult &timing = result.value();
        if (timing.iterations == 0)
        {
            fail(support::makeError(ErrorKind::IncompleteRun,
                                    "no measured calls: " + timing.incompleteReason,
                                    name));
            continue;
        }

        // Only a complete session yields the function's mean.
        if (options.storeInPackage && !timing.complete)
        {
            if (hooks.diags)
                hooks.diags->report(support::makeWarning(
                    ErrorKind::IncompleteRun,
                    "partial result not stored: " + timing.incompleteReason,
                    name));
        }
        else if (options.storeInPackage)
        {
            auto stored = package.setAuxiliary(
                name, std::string(schema::kMeanDurationKey), formatDouble(persistedMean(timing)));
            if (!stored)
                fail(stored.takeError());
        }
        report.results.push_back(std::move(result.value()));
    }
    return report;
}

Expected<void> writeCsv(const std::vector<TimingResult> &results, std::ostream &os)
{
    os << "function_name,mean,median_of_means,mean_of_small_means,robust_mean,min_of_means\n";
    for (const auto &r : results)
    {
        BatchSummary s;
        if (r.summary)
            s = *r.summary;
        else
            s.meanOfMeans = s.medianOfMeans = s.meanOfSmallMeans = s.minOfMeans = r.meanDuration;

        os << r.functionName << ',' << formatDouble(s.meanOfMeans) << ','
           << formatDouble(s.medianOfMeans) << ',' << formatDouble(s.meanOfSmallMeans) << ','
           << (s.robustMean ? formatDouble(*s.robustMean) : std::string("-1")) << ','
           << formatDouble(s.minOfMeans) << '\n';
    }
    os.flush();
    if (!os)
        return support::makeError(ErrorKind::IOError, "failed to write CSV report");
    return {};
}

Expected<void> writeCsvFile(const std::vector<TimingResult> &results, const std::string &path)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out)
        return support::makeError(ErrorKind::IOError, "cannot open '" + path + "' for writing");
    return writeCsv(results, out);
}

} // namespace hat::bench
