#include "solver/periodic_boundary.hpp"

#include "utils/operations.hpp"

namespace solver {
    bool periodic_boundary::classify(const Eigen::Vector2d& x, bool on_boundary) const {
        using utils::operations;

        bool left_or_bottom = operations::near(x(0), 0.0, tolerance_) || operations::near(x(1), 0.0, tolerance_);
        bool top_left = operations::near(x(0), 0.0, tolerance_) && operations::near(x(1), 1.0, tolerance_);
        bool bottom_right = operations::near(x(0), 1.0, tolerance_) && operations::near(x(1), 0.0, tolerance_);

        return left_or_bottom && !(top_left || bottom_right) && on_boundary;
    }

    Eigen::Vector2d periodic_boundary::map(const Eigen::Vector2d& x) const {
        using utils::operations;

        Eigen::Vector2d y;

        // top right corner goes to the bottom left corner
        if (operations::near(x(0), 1.0, tolerance_) && operations::near(x(1), 1.0, tolerance_)) {
            y(0) = x(0) - 1.0;
            y(1) = x(1) - 1.0;
        }
        // right edge goes to the left edge
        else if (operations::near(x(0), 1.0, tolerance_)) {
            y(0) = x(0) - 1.0;
            y(1) = x(1);
        }
        // top edge goes to the bottom edge
        else {
            y(0) = x(0);
            y(1) = x(1) - 1.0;
        }

        return y;
    }
}
