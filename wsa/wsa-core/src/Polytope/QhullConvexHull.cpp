#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

extern "C"
{
#include <libqhull_r/geom_r.h>
#include <libqhull_r/libqhull_r.h>
}

#include "wsa-core/src/Polytope/QhullConvexHull.hpp"

namespace wsa_core
{

namespace
{

void freeQhull(qhT* qh)
{
  int curlong{};
  int totlong{};
  qh_freeqhull(qh, !qh_ALL);
  qh_memfreeshort(qh, &curlong, &totlong);
}

}  // namespace

HullResult QhullConvexHull::compute(const Eigen::MatrixXd& points) const
{
  const auto numPoints = points.rows();
  const auto dimension = points.cols();

  if (numPoints == 0 || dimension == 0)
  {
    throw std::runtime_error("Cannot create convex hull from empty point set");
  }

  if (numPoints < dimension + 1)
  {
    std::ostringstream oss;
    oss << "Cannot create " << dimension << "D convex hull from fewer than "
        << dimension + 1 << " points";
    throw std::runtime_error(oss.str());
  }

  if (dimension == 1)
  {
    return computeInterval(points);
  }

  // Convert points to Qhull format (flat row-major array of doubles)
  std::vector<coordT> qhullPoints;
  qhullPoints.reserve(static_cast<size_t>(numPoints * dimension));
  for (Eigen::Index i = 0; i < numPoints; ++i)
  {
    for (Eigen::Index j = 0; j < dimension; ++j)
    {
      qhullPoints.push_back(points(i, j));
    }
  }

  // Initialize thread-local Qhull state
  qhT qhQh;
  qhT* qh = &qhQh;

  QHULL_LIB_CHECK
  qh_zero(qh, stderr);

  // "qhull" = required command prefix
  // "Qt" = triangulated output (every facet is a simplex)
  // "Qx" = exact pre-merges, as convhulln does for 5D and up
  // "Pp" = suppress precision warnings
  std::string options = dimension >= 5 ? "qhull Qt Qx Pp" : "qhull Qt Pp";

  const int exitcode =
    qh_new_qhull(qh,
                 static_cast<int>(dimension),
                 static_cast<int>(numPoints),
                 qhullPoints.data(),
                 False,           // ismalloc (we manage memory)
                 options.data(),  // options (non-const for qhull's parsing)
                 nullptr,         // outfile
                 stderr);         // errfile

  if (exitcode != 0)
  {
    freeQhull(qh);

    std::ostringstream oss;
    oss << "Qhull failed with exit code " << exitcode;
    throw std::runtime_error(oss.str());
  }

  HullResult result;
  try
  {
    // Calculate volume (area in 2D)
    qh_getarea(qh, qh->facet_list);
    result.volume = qh->totvol;

    result.facetIndices =
      extractFacetIndices(qh, static_cast<int>(dimension));
  }
  catch (const std::exception& e)
  {
    freeQhull(qh);

    std::ostringstream oss;
    oss << "Failed to compute convex hull: " << e.what();
    throw std::runtime_error(oss.str());
  }

  freeQhull(qh);
  return result;
}

HullResult QhullConvexHull::computeInterval(const Eigen::MatrixXd& points)
{
  Eigen::Index minIndex{};
  Eigen::Index maxIndex{};
  const double minValue = points.col(0).minCoeff(&minIndex);
  const double maxValue = points.col(0).maxCoeff(&maxIndex);

  if (!(maxValue > minValue))
  {
    throw std::runtime_error(
      "Cannot create 1D convex hull from coincident points");
  }

  HullResult result;
  result.facetIndices.resize(2, 1);
  result.facetIndices(0, 0) = static_cast<int>(minIndex);
  result.facetIndices(1, 0) = static_cast<int>(maxIndex);
  result.volume = maxValue - minValue;
  return result;
}

Eigen::MatrixXi QhullConvexHull::extractFacetIndices(qhT* qh, int dimension)
{
  std::vector<int> indices;
  indices.reserve(static_cast<size_t>(qh->num_facets * dimension));

  facetT* facet;

  FORALLfacets
  {
    if (facet->upperdelaunay)
    {
      continue;
    }

    vertexT *vertex, **vertexp;
    int vertexCount = 0;

    FOREACHvertex_(facet->vertices)
    {
      vertexCount++;
    }

    // Qt option should triangulate, but check anyway
    if (vertexCount != dimension)
    {
      continue;
    }

    FOREACHvertex_(facet->vertices)
    {
      indices.push_back(qh_pointid(qh, vertex->point));
    }
  }

  const auto numFacets =
    static_cast<Eigen::Index>(indices.size()) / dimension;
  Eigen::MatrixXi facetIndices(numFacets, dimension);
  for (Eigen::Index f = 0; f < numFacets; ++f)
  {
    for (int j = 0; j < dimension; ++j)
    {
      facetIndices(f, j) = indices[static_cast<size_t>(f * dimension + j)];
    }
  }
  return facetIndices;
}

}  // namespace wsa_core
