#pragma once
#include <array>
#include <cstddef>
#include <optional>

#include "dg/core/variable.hpp"

namespace dg {

// (height, width)
using Pair = std::array<std::size_t, 2>;

std::size_t get_conv_outsize(std::size_t size, std::size_t k, std::size_t s, std::size_t p);
std::size_t get_deconv_outsize(std::size_t size, std::size_t k, std::size_t s, std::size_t p);

namespace detail {

// img [N,C,H,W] -> col [N,C,KH,KW,OH,OW]; padding reads as 0.
Tensor im2col_array(const Tensor& img, Pair kernel, Pair stride, Pair pad);
// Inverse scatter of im2col_array; overlapping windows accumulate and
// padded positions are dropped.
Tensor col2im_array(const Tensor& col, const Shape& img_shape, Pair kernel, Pair stride, Pair pad);

} // namespace detail

// to_matrix=true yields [N*OH*OW, C*KH*KW]; otherwise [N,C,KH,KW,OH,OW].
Variable im2col(const Variable& x, Pair kernel, Pair stride = {1, 1}, Pair pad = {0, 0},
                bool to_matrix = true);
Variable col2im(const Variable& col, const Shape& img_shape, Pair kernel,
                Pair stride = {1, 1}, Pair pad = {0, 0}, bool to_matrix = true);

// x [N,C,H,W], W [OC,C,KH,KW], b [OC] or undefined.
Variable conv2d(const Variable& x, const Variable& W, const Variable& b = Variable(),
                Pair stride = {1, 1}, Pair pad = {0, 0});

// Transposed convolution. x [N,C,H,W], W [C,OC,KH,KW], b [OC] or undefined.
// Output spatial size defaults to get_deconv_outsize.
Variable deconv2d(const Variable& x, const Variable& W, const Variable& b = Variable(),
                  Pair stride = {1, 1}, Pair pad = {0, 0},
                  std::optional<Pair> outsize = std::nullopt);

// Weight gradient of conv2d: contracts gy [N,OC,OH,OW] with the columns of
// x [N,C,H,W] into [OC,C,KH,KW].
Variable conv2d_grad_w(const Variable& x, const Variable& gy, Pair kernel, Pair stride, Pair pad);

// Max pooling. Records the winning window position per output.
Variable pooling(const Variable& x, Pair kernel, Pair stride = {1, 1}, Pair pad = {0, 0});

// Scatter of gy [N,C,OH,OW] to the recorded winners of a pooling call.
// `indexes` holds flat kh*KW+kw positions shaped like gy.
Variable pooling2d_grad(const Variable& gy, const Tensor& indexes, const Shape& in_shape,
                        Pair kernel, Pair stride, Pair pad);

// Gathers x at the recorded winners without recomputing argmax.
Variable pooling2d_with_indexes(const Variable& x, const Tensor& indexes,
                                Pair kernel, Pair stride, Pair pad);

} // namespace dg
