/**
 * @file periodic_boundary.hpp
 * @brief Periodic identification of the unit square boundary
 */

#ifndef HOMCELL_SOLVER_PERIODIC_BOUNDARY_HPP
#define HOMCELL_SOLVER_PERIODIC_BOUNDARY_HPP

#include <Eigen/Dense>

namespace solver {
    /**
     * @class periodic_boundary
     * @brief Master/slave predicates for the periodic unit square
     *
     * Master points lie on the left (x = 0) or bottom (y = 0) edge. The two
     * corners (0,1) and (1,0) are never masters; together with (1,1) they are
     * slaves of (0,0), so all four corners end up sharing one DOF.
     */
    class periodic_boundary {
        public:
            explicit periodic_boundary(double tolerance = 1e-10) : tolerance_(tolerance) {}

            /**
             * @brief True iff the point is a master point
             *
             * @param x Point of the unit square
             * @param on_boundary Whether the caller found the point on the mesh boundary
             */
            bool classify(const Eigen::Vector2d& x, bool on_boundary) const;

            /**
             * @brief Image of a slave point on the master edges
             *
             * (1,1) -> (0,0); (1,y) -> (0,y); otherwise (x,y) -> (x,y-1).
             * Only meaningful for points on the right or top edge.
             */
            Eigen::Vector2d map(const Eigen::Vector2d& x) const;

            double tolerance() const { return tolerance_; }

        private:
            double tolerance_;
    };
}

#endif
