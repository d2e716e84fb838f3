#include "kmeanix/assign.hpp"
#include "kmeanix/errors.hpp"
#include "kmeanix/scratch.hpp"

#include <new>
#include <string>

namespace kmeanix {

namespace {

template <typename T>
void check_width(MatrixView<T> x, MatrixView<T> centroids, const char* op) {
    if (x.cols != centroids.cols)
        throw DimensionMismatch(std::string(op) + ": data has " + std::to_string(x.cols) +
                                " features, model was fitted with " +
                                std::to_string(centroids.cols));
}

}  // namespace

template <typename T>
Assignment<T> assign_labels(const DistanceEngine<T>& engine, MatrixView<T> x,
                            MatrixView<T> centroids, const T* weights) {
    check_width(x, centroids, "predict");

    Assignment<T> out;
    allocate_scratch(out.labels, x.rows, "label buffer");
    engine.for_each_nearest(x, centroids, [&](Batch b, const int* l, const T* d) {
        for (size_t i = 0; i < b.size; ++i) {
            const size_t gi = b.offset + i;
            out.labels[gi] = l[i];
            out.inertia += (weights ? weights[gi] : T(1)) * d[i];
        }
    });
    return out;
}

template <typename T>
Matrix<T> transform_distances(const DistanceEngine<T>& engine, MatrixView<T> x,
                              MatrixView<T> centroids) {
    check_width(x, centroids, "transform");

    Matrix<T> out;
    try {
        out = Matrix<T>(x.rows, centroids.rows);
    } catch (const std::bad_alloc&) {
        throw ResourceError("cannot allocate " + std::to_string(x.rows) + " x " +
                            std::to_string(centroids.rows) + " distance matrix");
    }
    engine.pairwise(x, centroids, out.data(), true);
    return out;
}

template Assignment<float> assign_labels<float>(const DistanceEngine<float>&, MatrixView<float>,
                                                MatrixView<float>, const float*);
template Assignment<double> assign_labels<double>(const DistanceEngine<double>&, MatrixView<double>,
                                                  MatrixView<double>, const double*);
template Matrix<float> transform_distances<float>(const DistanceEngine<float>&, MatrixView<float>,
                                                  MatrixView<float>);
template Matrix<double> transform_distances<double>(const DistanceEngine<double>&, MatrixView<double>,
                                                    MatrixView<double>);

}  // namespace kmeanix
