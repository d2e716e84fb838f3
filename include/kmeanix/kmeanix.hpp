#ifndef KMEANIX_KMEANIX_HPP
#define KMEANIX_KMEANIX_HPP

#include "kmeanix/assign.hpp"
#include "kmeanix/batching.hpp"
#include "kmeanix/common.hpp"
#include "kmeanix/data_generator.hpp"
#include "kmeanix/distance.hpp"
#include "kmeanix/errors.hpp"
#include "kmeanix/init.hpp"
#include "kmeanix/kmeans.hpp"
#include "kmeanix/lloyd.hpp"
#include "kmeanix/logging.hpp"
#include "kmeanix/matrix.hpp"
#include "kmeanix/metrics.hpp"
#include "kmeanix/params.hpp"

#endif  // KMEANIX_KMEANIX_HPP
