#include "utils/operations.hpp"

#include <algorithm>

namespace utils {
    double operations::calcArea(const Eigen::MatrixXd& coords){

        double area = 0.0;
        int rows = coords.rows();

        double x1, x2, y1, y2;

        for(int i=0; i<rows-1; i++){
            x1 = coords(i,0) - coords(0,0);
            x2 = coords(i+1,0) - coords(0,0);
            y1 = coords(i,1) - coords(0,1);
            y2 = coords(i+1,1) - coords(0,1);
            area += + x1 * y2 - x2 * y1;
        }

        area = area/2.0;

        return area;
    }

    Eigen::Vector2d operations::calcCentroid(const Eigen::MatrixXd& coords){
        Eigen::Vector2d centroid;
        // extended coordinate vector (last row consists of the first coordinate)
        Eigen::MatrixXd extCoords(coords.rows()+1, coords.cols());
        
        extCoords << coords, coords.row(0);
        double cx=0.0, cy=0.0;
        double area = calcArea(coords);
        for(int i=0; i<coords.rows();i++){
            cx += (extCoords(i,0)+extCoords(i+1,0))*(extCoords(i,0)*extCoords(i+1,1)-extCoords(i+1,0)*extCoords(i,1));
            cy += (extCoords(i,1)+extCoords(i+1,1))*(extCoords(i,0)*extCoords(i+1,1)-extCoords(i+1,0)*extCoords(i,1));
        }
        cx = 1.0/(6.0*area)*cx;
        cy = 1.0/(6.0*area)*cy;
        
        centroid(0) = cx;
        centroid(1) = cy;

        return centroid;
    }

    Eigen::Matrix<double, 3, 2> operations::compute_p1_gradients(
        const Eigen::Matrix<double, 3, 2>& vertices,
        double signed_area
    ){
        Eigen::Matrix<double, 3, 2> gradients;
        double inv = 1.0 / (2.0 * signed_area);

        for (int i = 0; i < 3; ++i) {
            int j = (i + 1) % 3;
            int k = (i + 2) % 3;
            // grad(phi_i) = (y_j - y_k, x_k - x_j) / 2A
            gradients(i, 0) = (vertices(j, 1) - vertices(k, 1)) * inv;
            gradients(i, 1) = (vertices(k, 0) - vertices(j, 0)) * inv;
        }

        return gradients;
    }

    bool operations::setup_triangle(
        const Eigen::Matrix<double, 3, 2>& vertices,
        ElementData& element_data
    ){
        double signed_area = calcArea(vertices);

        // relative to the squared element size so that refinement does not trip the check
        double h2 = std::max({
            (vertices.row(1) - vertices.row(0)).squaredNorm(),
            (vertices.row(2) - vertices.row(1)).squaredNorm(),
            (vertices.row(0) - vertices.row(2)).squaredNorm()
        });

        if (!std::isfinite(signed_area) || std::abs(signed_area) <= 1e-12 * h2) {
            return false;
        }

        element_data.area = std::abs(signed_area);
        element_data.gradients = compute_p1_gradients(vertices, signed_area);

        return true;
    }
}
