//===----------------------------------------------------------------------===//
//
// Part of the Hatrun project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/bench/Isolation.cpp
// Purpose: Run a benchmark session in a child process and rebuild its result.
// Key invariants: Records are single lines of tab-separated fields; text
//                 fields never contain tabs or newlines.
// Links: docs/codemap.md#bench
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Fork-based session isolation.
/// @details Record layout, one per line:
///          - `setup <replicas> <footprint> <warmup>`
///          - `batch <iterations> <totalSeconds> <batchMean>`
///          - `diag <severity> <kind> <function> <parameter> <message>`
///          - `error <severity> <kind> <function> <parameter> <message>`
///          - `done <iterations> <totalSeconds> <variance> <min> <max>
///            <complete> <reason>`
///          Doubles are printed with enough digits to round-trip.

#include "bench/Isolation.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace hat::bench
{

using support::ErrorKind;
using support::Expected;

namespace
{

/// @brief Replace separators so @p text fits in one record field.
std::string field(std::string text)
{
    for (char &ch : text)
    {
        if (ch == '\t' || ch == '\n' || ch == '\r')
            ch = ' ';
    }
    return text;
}

std::vector<std::string> splitFields(std::string_view line)
{
    std::vector<std::string> fields;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t tab = line.find('\t', start);
        if (tab == std::string_view::npos)
        {
            fields.emplace_back(line.substr(start));
            return fields;
        }
        fields.emplace_back(line.substr(start, tab - start));
        start = tab + 1;
    }
}

/// @brief Write all of @p data to @p fd, retrying on EINTR and short writes.
bool writeAll(int fd, std::string_view data)
{
    while (!data.empty())
    {
        const ssize_t n = ::write(fd, data.data(), data.size());
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

/// @brief Line writer used by the child.
class RecordWriter
{
  public:
    explicit RecordWriter(int fd) : fd_(fd) {}

    template <class... Fields> void emit(std::string_view tag, const Fields &...fields)
    {
        std::ostringstream os;
        os.precision(std::numeric_limits<double>::max_digits10);
        os << tag;
        ((os << '\t' << fields), ...);
        os << '\n';
        // A lost record only degrades the partial result the parent rebuilds.
        ok_ = writeAll(fd_, os.str()) && ok_;
    }

    void diag(std::string_view tag, const support::Diag &d)
    {
        emit(tag,
             static_cast<int>(d.severity),
             static_cast<int>(d.kind),
             field(d.function),
             field(d.parameter),
             field(d.message));
    }

    [[nodiscard]] bool ok() const noexcept
    {
        return ok_;
    }

  private:
    int fd_;
    bool ok_ = true;
};

/// @brief Child side: run the session and report through @p fd.
[[noreturn]] void runChild(int fd,
                           const schema::FunctionSpec &fn,
                           const invoke::NativeFunction &native,
                           const BenchmarkOptions &options,
                           std::ostream *trace)
{
    RecordWriter out(fd);
    support::DiagnosticEngine diags;
    std::size_t forwarded = 0;
    auto forward = [&]()
    {
        const auto &all = diags.diagnostics();
        for (; forwarded < all.size(); ++forwarded)
            out.diag("diag", all[forwarded]);
    };

    SessionHooks hooks;
    hooks.diags = &diags;
    hooks.trace = trace;
    hooks.onSetup = [&](const TimingResult &r)
    {
        forward();
        out.emit("setup", r.replicaCount, r.footprintBytes, r.warmupIterations);
    };
    hooks.onBatch = [&](const TimingResult &r)
    { out.emit("batch", r.iterations, r.totalSeconds, r.batchMeans.back()); };

    auto result = runBenchmark(fn, native, options, hooks);
    forward();
    if (!result)
    {
        out.diag("error", result.error());
        ::close(fd);
        ::_exit(out.ok() ? 0 : 1);
    }

    const TimingResult &r = result.value();
    out.emit("done",
             r.iterations,
             r.totalSeconds,
             r.variance,
             r.min,
             r.max,
             r.complete ? 1 : 0,
             field(r.incompleteReason));
    ::close(fd);
    ::_exit(out.ok() ? 0 : 1);
}

support::Diag diagFrom(const std::vector<std::string> &f)
{
    support::Diag d{static_cast<support::Severity>(std::atoi(f[1].c_str())),
                    static_cast<ErrorKind>(std::atoi(f[2].c_str())),
                    f[5],
                    f[3],
                    f[4]};
    return d;
}

/// @brief Parent-side state rebuilt from child records.
struct ChildReport
{
    TimingResult result;
    bool done = false;
    std::optional<support::Diag> error;
};

void applyRecord(ChildReport &report, std::string_view line, const SessionHooks &hooks)
{
    const auto f = splitFields(line);
    const std::string &tag = f.front();
    TimingResult &r = report.result;

    if (tag == "setup" && f.size() == 4)
    {
        r.replicaCount = std::strtoull(f[1].c_str(), nullptr, 10);
        r.footprintBytes = std::strtoull(f[2].c_str(), nullptr, 10);
        r.warmupIterations = std::strtoull(f[3].c_str(), nullptr, 10);
        if (hooks.onSetup)
            hooks.onSetup(r);
    }
    else if (tag == "batch" && f.size() == 4)
    {
        r.iterations = std::strtoull(f[1].c_str(), nullptr, 10);
        r.totalSeconds = std::strtod(f[2].c_str(), nullptr);
        r.batchMeans.push_back(std::strtod(f[3].c_str(), nullptr));
        if (hooks.onBatch)
            hooks.onBatch(r);
    }
    else if (tag == "diag" && f.size() == 6)
    {
        if (hooks.diags)
            hooks.diags->report(diagFrom(f));
    }
    else if (tag == "error" && f.size() == 6)
    {
        report.error = diagFrom(f);
    }
    else if (tag == "done" && f.size() == 8)
    {
        r.iterations = std::strtoull(f[1].c_str(), nullptr, 10);
        r.totalSeconds = std::strtod(f[2].c_str(), nullptr);
        r.variance = std::strtod(f[3].c_str(), nullptr);
        r.min = std::strtod(f[4].c_str(), nullptr);
        r.max = std::strtod(f[5].c_str(), nullptr);
        r.complete = f[6] == "1";
        r.incompleteReason = f[7];
        report.done = true;
    }
}

std::string describeStatus(int status)
{
    if (WIFSIGNALED(status))
    {
        const int sig = WTERMSIG(status);
        const char *name = ::strsignal(sig);
        return "child terminated by signal " + std::to_string(sig) +
               (name ? " (" + std::string(name) + ")" : std::string());
    }
    if (WIFEXITED(status))
        return "child exited with status " + std::to_string(WEXITSTATUS(status));
    return "child stopped unexpectedly";
}

} // namespace

Expected<TimingResult> runIsolated(const schema::FunctionSpec &fn,
                                   const invoke::NativeFunction &native,
                                   const BenchmarkOptions &options,
                                   const SessionHooks &hooks)
{
    if (auto ok = validateOptions(options); !ok)
        return ok.takeError();

    int fds[2];
    if (::pipe(fds) != 0)
        return support::makeError(ErrorKind::IsolationFailed,
                                  std::string("cannot create pipe: ") + std::strerror(errno),
                                  fn.name);

    std::cout.flush();
    std::cerr.flush();
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        const int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return support::makeError(ErrorKind::IsolationFailed,
                                  std::string("cannot fork: ") + std::strerror(err),
                                  fn.name);
    }
    if (pid == 0)
    {
        ::close(fds[0]);
        runChild(fds[1], fn, native, options, hooks.trace);
    }

    ::close(fds[1]);
    ChildReport report;
    report.result.functionName = fn.name;

    std::string pending;
    char buffer[4096];
    while (true)
    {
        const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
            break;
        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos)
        {
            applyRecord(report, std::string_view(pending).substr(0, newline), hooks);
            pending.erase(0, newline + 1);
        }
    }
    ::close(fds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
            return support::makeError(ErrorKind::IsolationFailed,
                                      std::string("cannot wait for child: ") +
                                          std::strerror(errno),
                                      fn.name);
    }

    if (report.error)
        return std::move(*report.error);

    TimingResult &result = report.result;
    const bool cleanExit = WIFEXITED(status) && WEXITSTATUS(status) == 0;
    if (!report.done || !cleanExit)
    {
        result.complete = false;
        result.incompleteReason = describeStatus(status);
        if (!report.done)
            result.incompleteReason += " after " + std::to_string(result.iterations) + " calls";
    }
    finalizeFromBatches(result);
    return result;
}

} // namespace hat::bench
