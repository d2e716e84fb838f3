#ifndef KMEANIX_BENCH_UTILS_HPP
#define KMEANIX_BENCH_UTILS_HPP

#include <chrono>
#include <cstdio>
#include <fstream>
#include <string>

#include <sys/resource.h>

namespace kmeanix::bench {

// Wall-clock stopwatch in milliseconds.
class Stopwatch {
public:
    Stopwatch() : start_(std::chrono::steady_clock::now()) {}
    void reset() { start_ = std::chrono::steady_clock::now(); }
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(
                   std::chrono::steady_clock::now() - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// Peak resident set size in MB (VmHWM on Linux, ru_maxrss elsewhere).
inline double peak_rss_mb() {
#ifdef __linux__
    std::ifstream f("/proc/self/status");
    std::string line;
    while (std::getline(f, line)) {
        long kb = 0;
        if (std::sscanf(line.c_str(), "VmHWM: %ld kB", &kb) == 1)
            return static_cast<double>(kb) / 1024.0;
    }
    return 0.0;
#else
    struct rusage ru;
    getrusage(RUSAGE_SELF, &ru);
    return static_cast<double>(ru.ru_maxrss) / 1024.0;
#endif
}

}  // namespace kmeanix::bench

#endif  // KMEANIX_BENCH_UTILS_HPP
