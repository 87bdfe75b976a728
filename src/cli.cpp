#include "cli.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "counter.hpp"
#include "util.hpp"

static bool flag(const char *name) {
    auto v = ::getenv(name);
    return v && *v;
}

static bool parse_int(const char *text, int &out) {
    try {
        size_t end = 0;
        auto v = std::stoi(text, &end);
        if (text[end])
            return false;
        out = v;
        return true;
    } catch (const std::logic_error &) {
        return false;
    }
}

static bool parse_int64(const char *text, int64_t &out) {
    try {
        size_t end = 0;
        auto v = std::stoll(text, &end);
        if (text[end])
            return false;
        out = v;
        return true;
    } catch (const std::logic_error &) {
        return false;
    }
}

static int usage(std::ostream &err, const char *self, const char *why) {
    fmt::print(err, "{}\nusage: {} [size=3] [min_length=4]\n"
            "env: VERBOSE REPORT=<n> LIMIT=<n> NAIVE RAW LENGTHS\n", why, self);
    return 2;
}

int run(int argc, const char *const argv[], std::ostream &out, std::ostream &err) {
    auto size = 3;
    auto min_length = 4;
    if (argc > 3)
        return usage(err, argv[0], "too many arguments");
    if (argc > 1 && !parse_int(argv[1], size))
        return usage(err, argv[0], "bad size");
    if (argc > 2 && !parse_int(argv[2], min_length))
        return usage(err, argv[0], "bad min_length");
    try {
        validate_size(size);
    } catch (const std::logic_error &e) {
        return usage(err, argv[0], e.what());
    }

    CountOptions opts;
    opts.reduce = !flag("RAW");
    if (flag("REPORT")) {
        auto report = 0;
        if (!parse_int(::getenv("REPORT"), report) || report < 0)
            return usage(err, argv[0], "bad REPORT");
        opts.report = report;
    }
    if (flag("LIMIT")) {
        int64_t limit;
        if (!parse_int64(::getenv("LIMIT"), limit) || limit < 0)
            return usage(err, argv[0], "bad LIMIT");
        opts.limit = limit;
    }

    try {
        auto t1 = std::chrono::steady_clock::now();
        int64_t res;
        if (flag("NAIVE")) {
            res = count_naive(size, min_length);
        } else {
            Counter counter{ opts };
            res = count_valid_patterns(counter, size, min_length);
            if (flag("VERBOSE"))
                fmt::print(err, "cached {} states ({}B), {} points, {} sight lines\n",
                        counter.states(), display(counter.bytes()),
                        counter.context().points.size(), counter.context().sight.size());
        }
        auto t2 = std::chrono::steady_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
        fmt::print(out, "{} ({} ms)\n", res, ms);

        if (flag("LENGTHS")) {
            auto exact = count_by_length(size, opts);
            auto w = 1ull;
            for (auto k = 1u; k < exact.size(); k++)
                w = std::max(w, count_digits(exact[k]));
            for (auto k = 1u; k < exact.size(); k++)
                fmt::print(out, "{:>2} {:>{}}\n", k, exact[k], w);
        }
    } catch (const std::overflow_error &e) {
        fmt::print(err, "{}\n", e.what());
        return 1;
    }
    return 0;
}
