/**
 * @file Algebra.h
 * @brief Boolean combination and placement of shapes as expressions.
 *
 * combine() and place() carry the semantics; the operators below are thin
 * sugar over them. The builder scopes combine through the same functions,
 * so a builder program and its algebra expression give the same topology.
 */
#ifndef SCOPECAD_APP_ALGEBRA_ALGEBRA_H
#define SCOPECAD_APP_ALGEBRA_ALGEBRA_H

#include "../../core/geom/Location.h"
#include "../../kernel/ops/Booleans.h"
#include "../../kernel/topology/Shape.h"

#include <cstdint>
#include <vector>

namespace scopecad::app::algebra {

using core::geom::Axis;
using core::geom::Location;
using core::geom::Vec3d;
using kernel::ops::BooleanOp;
using kernel::ops::KernelOptions;
using kernel::topology::Shape;

/**
 * @brief Kernel options used when an algebra call is given none
 *
 * The options of the most recently installed live ScopedKernelOptions of
 * this thread, or KernelOptions{} when there is none. A BuildSession
 * installs its configuration while it has open scopes, so the operators
 * written inside a builder block use the same options as the builder.
 */
KernelOptions activeKernelOptions();

class ScopedKernelOptions {
public:
    explicit ScopedKernelOptions(const KernelOptions& options);
    ~ScopedKernelOptions();

    ScopedKernelOptions(const ScopedKernelOptions&) = delete;
    ScopedKernelOptions& operator=(const ScopedKernelOptions&) = delete;

private:
    uint64_t token_;
};

/**
 * @brief Boolean of target with all tools at once
 *
 * Empty tools are skipped. An empty target is the identity for Fuse
 * (the tools are fused among themselves); an empty target under Cut or
 * Common, or an empty Common result, throws core::GeometricOperationError.
 * Operands of different dimension throw core::AlgebraShapeMismatchError.
 */
Shape combine(const Shape& target, const std::vector<Shape>& tools, BooleanOp op,
              const KernelOptions& options = activeKernelOptions());
Shape combine(const Shape& a, const Shape& b, BooleanOp op,
              const KernelOptions& options = activeKernelOptions());

/// Throws core::AlgebraShapeMismatchError when both dimensions are known and differ
void requireSameDimension(const char* operation, const Shape& a, const Shape& b);

/// location * shape.location(); geometry is shared, not rewritten
Shape place(const Location& location, const Shape& shape);
std::vector<Shape> place(const Location& location, const std::vector<Shape>& shapes);
std::vector<Shape> place(const std::vector<Location>& locations, const Shape& shape);

/// Compound of shapes without booleans; a single shape is returned as is
Shape compound(const std::vector<Shape>& shapes);

// Explicit transforms rewrite the kernel geometry and are slow; prefer place()
Shape bakedTransform(const Shape& shape, const Location& location,
                     const KernelOptions& options = activeKernelOptions());
Shape translate(const Shape& shape, const Vec3d& offset);
Shape rotate(const Shape& shape, const Axis& axis, double angleDegrees);

} // namespace scopecad::app::algebra

// Declared beside Shape so argument-dependent lookup finds them
namespace scopecad::kernel::topology {

Shape operator+(const Shape& a, const Shape& b);
Shape operator-(const Shape& a, const Shape& b);
Shape operator&(const Shape& a, const Shape& b);
Shape& operator+=(Shape& a, const Shape& b);
Shape& operator-=(Shape& a, const Shape& b);
Shape& operator&=(Shape& a, const Shape& b);

Shape operator*(const Location& location, const Shape& shape);

/// One placed copy per location, packed in a compound
Shape operator*(const std::vector<Location>& locations, const Shape& shape);
std::vector<Shape> operator*(const Location& location, const std::vector<Shape>& shapes);

} // namespace scopecad::kernel::topology

#endif // SCOPECAD_APP_ALGEBRA_ALGEBRA_H
