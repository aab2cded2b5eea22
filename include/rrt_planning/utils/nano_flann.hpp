// Copyright 2025 Soheil E.nia

#pragma once

#include "rrt_planning/utils/spatial_index.hpp"
#include <nanoflann.hpp>


// Incremental k-d tree. The dynamic adaptor keeps a logarithmic forest of static trees so insertion is
// O(log n) amortized and we never rebuild the whole index after each extension.
class NanoFlann : public SpatialIndex {
 public:
    // Dataset adaptor nanoflann reads the coordinates through
    struct PointCloud {
        std::vector<Eigen::VectorXd> points;

        inline size_t kdtree_get_point_count() const { return points.size(); }
        inline double kdtree_get_pt(const size_t idx, const size_t dim) const {
            return points[idx][static_cast<Eigen::Index>(dim)];
        }
        template <class BBOX>
        bool kdtree_get_bbox(BBOX& /* bb */) const { return false; }
    };

    using NFKDTree = nanoflann::KDTreeSingleIndexDynamicAdaptor<
        nanoflann::L2_Simple_Adaptor<double, PointCloud, double, size_t>, PointCloud, -1, size_t>;

    explicit NanoFlann(int dimension);

    // The tree keeps a reference to cloud_, so the object must stay where it was built
    NanoFlann(const NanoFlann&) = delete;
    NanoFlann& operator=(const NanoFlann&) = delete;

    void addPoint(const Eigen::VectorXd& value) override;
    size_t nearest(const Eigen::VectorXd& query) const override;
    std::vector<size_t> knnSearch(const Eigen::VectorXd& query, int k) const override;
    std::vector<size_t> radiusSearch(const Eigen::VectorXd& query, double radius) const override;

    size_t size() const override;
    void clear() override;
    int getDimension() const override;

 private:
    void checkQuery(const Eigen::VectorXd& query) const;

    int dimension_;
    PointCloud cloud_;
    std::unique_ptr<NFKDTree> kdtree_;
};
