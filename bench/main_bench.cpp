#include "bench_utils.hpp"

#include "kmeanix/kmeanix.hpp"

#include <omp.h>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <thread>
#include <vector>

using namespace kmeanix;

namespace {

constexpr unsigned kDataSeed = 42;
constexpr size_t kNumGaussians = 50;

// Unbuffered progress log to stderr so output appears immediately
// even when stdout is piped or redirected.
void log_progress(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    std::fprintf(stderr, "[BENCH] ");
    std::vfprintf(stderr, fmt, args);
    std::fprintf(stderr, "\n");
    va_end(args);
}

struct Variant {
    size_t batch_samples;
    Metric metric;
};

struct RunResult {
    double train_ms;
    double predict_ms;
    double inertia;
    size_t iters;
    size_t empty_clusters;
    double scratch_mb;
    double rss_mb;
};

RunResult run_one(const Variant& v, const std::vector<float>& data, size_t n,
                  size_t dim, size_t k) {
    KMeansParams p;
    p.n_clusters = k;
    p.max_iter = 50;
    p.seed = 7;
    p.batch_samples = v.batch_samples;
    p.metric = v.metric;

    MatrixView<float> x(data.data(), n, dim);
    KMeans km(p);

    RunResult r{};
    bench::Stopwatch t;
    FitResult<float> fit = km.fit(x);
    r.train_ms = t.elapsed_ms();

    t.reset();
    Assignment<float> pred = km.predict(x);
    r.predict_ms = t.elapsed_ms();

    std::vector<size_t> sizes(k);
    compute_cluster_sizes(pred.labels.data(), n, k, sizes.data());

    DistanceEngine<float> engine(v.metric, v.batch_samples);
    r.inertia = static_cast<double>(fit.inertia);
    r.iters = fit.n_iter;
    r.empty_clusters = count_empty_clusters(sizes.data(), k);
    r.scratch_mb = static_cast<double>(engine.scratch_bytes(n, k)) / (1024.0 * 1024.0);
    r.rss_mb = bench::peak_rss_mb();
    return r;
}

void print_table_header() {
    std::printf("%-14s | %9s | %10s | %10s | %12s | %5s | %5s | %10s | %8s\n",
        "Metric", "Batch", "Train(ms)", "Pred(ms)", "Inertia",
        "Iters", "Empty", "Scratch(MB)", "RSS(MB)");
    std::printf("%s\n", std::string(106, '-').c_str());
    std::fflush(stdout);
}

}  // namespace

int main(int argc, char** argv) {
    size_t n = 200000;
    size_t dim = 64;
    size_t k = 100;
    const char* csv_path = nullptr;

    std::vector<const char*> positional;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--csv") == 0 && i + 1 < argc)
            csv_path = argv[++i];
        else
            positional.push_back(argv[i]);
    }
    if (positional.size() >= 1) n = std::strtoul(positional[0], nullptr, 10);
    if (positional.size() >= 2) dim = std::strtoul(positional[1], nullptr, 10);
    if (positional.size() >= 3) k = std::strtoul(positional[2], nullptr, 10);
    if (n == 0 || dim == 0 || k == 0) {
        std::fprintf(stderr, "usage: %s [n] [dim] [k] [--csv path]\n", argv[0]);
        return 2;
    }

    int nthreads = static_cast<int>(std::thread::hardware_concurrency());
    if (nthreads <= 0) nthreads = 1;
    omp_set_num_threads(nthreads);

    log_progress("Config: N=%zu D=%zu K=%zu threads=%d", n, dim, k, nthreads);
    bench::Stopwatch gen;
    auto data = generate_gaussian_mixture(n, dim, kNumGaussians, kDataSeed);
    log_progress("Generated %.1f MB in %.1fs",
                 static_cast<double>(data.size() * sizeof(float)) / (1024.0 * 1024.0),
                 gen.elapsed_ms() / 1000.0);

    FILE* csv = nullptr;
    if (csv_path) {
        csv = std::fopen(csv_path, "w");
        if (!csv)
            std::fprintf(stderr, "WARNING: could not open %s\n", csv_path);
        else
            std::fprintf(csv, "metric,batch_samples,train_ms,predict_ms,inertia,"
                              "iterations,empty_clusters,scratch_mb,peak_rss_mb\n");
    }

    std::vector<Variant> variants;
    for (size_t bs : {size_t{1024}, size_t{8192}, kDefaultBatchSamples, n}) {
        variants.push_back({bs, Metric::L2Expanded});
        variants.push_back({bs, Metric::L2Unexpanded});
    }

    print_table_header();
    for (const Variant& v : variants) {
        log_progress("Running %s batch=%zu...", to_string(v.metric), v.batch_samples);
        RunResult r;
        try {
            r = run_one(v, data, n, dim, k);
        } catch (const ResourceError& e) {
            std::fprintf(stderr, "%s batch=%zu: %s\n", to_string(v.metric),
                         v.batch_samples, e.what());
            continue;
        }

        std::printf("%-14s | %9zu | %10.1f | %10.1f | %12.4e | %5zu | %5zu | %10.2f | %8.1f\n",
                    to_string(v.metric), v.batch_samples, r.train_ms, r.predict_ms,
                    r.inertia, r.iters, r.empty_clusters, r.scratch_mb, r.rss_mb);
        std::fflush(stdout);

        if (csv)
            std::fprintf(csv, "%s,%zu,%.3f,%.3f,%.6e,%zu,%zu,%.3f,%.1f\n",
                         to_string(v.metric), v.batch_samples, r.train_ms, r.predict_ms,
                         r.inertia, r.iters, r.empty_clusters, r.scratch_mb, r.rss_mb);
    }

    if (csv) {
        std::fclose(csv);
        std::printf("\nResults written to %s\n", csv_path);
    }
    return 0;
}
