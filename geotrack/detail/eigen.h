#pragma once

#include <Eigen/Core>

namespace geotrack {

using Eigen::Vector3d;
using Eigen::Matrix3d;
using RowMatrix3d = Eigen::Matrix<double,3,3,Eigen::RowMajor>;

}
