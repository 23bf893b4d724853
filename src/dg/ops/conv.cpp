#include "dg/ops/conv.hpp"
#include "dg/core/function.hpp"
#include "dg/core/log.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/ops/reduce.hpp"
#include "dg/parallel/parallel_for.hpp"

#include <stdexcept>
#include <string>

namespace dg {
using detail::numel;
using detail::shape_str;

std::size_t get_conv_outsize(std::size_t size, std::size_t k, std::size_t s, std::size_t p) {
  if (s == 0) throw std::invalid_argument("conv: stride must be positive");
  if (size + 2 * p < k)
    throw std::invalid_argument("conv: kernel " + std::to_string(k) + " larger than padded input " +
                                std::to_string(size + 2 * p));
  return (size + 2 * p - k) / s + 1;
}

std::size_t get_deconv_outsize(std::size_t size, std::size_t k, std::size_t s, std::size_t p) {
  if (size == 0) throw std::invalid_argument("deconv: empty input");
  const std::size_t full = s * (size - 1) + k;
  if (full < 2 * p) throw std::invalid_argument("deconv: padding exceeds output size");
  return full - 2 * p;
}

namespace {

// Planes of one (n, c) pair are independent; parallelize over them.
constexpr std::size_t PLANE_GRAIN = 4;

struct Geometry {
  std::size_t N, C, H, W, KH, KW, SH, SW, PH, PW, OH, OW;
};

Geometry geometry(const Shape& img, Pair k, Pair s, Pair p) {
  if (img.size() != 4)
    throw std::invalid_argument("conv: expected [N,C,H,W] input, got " + shape_str(img));
  if (k[0] == 0 || k[1] == 0) throw std::invalid_argument("conv: kernel must be positive");
  Geometry g{img[0], img[1], img[2], img[3], k[0], k[1], s[0], s[1], p[0], p[1], 0, 0};
  g.OH = get_conv_outsize(g.H, g.KH, g.SH, g.PH);
  g.OW = get_conv_outsize(g.W, g.KW, g.SW, g.PW);
  return g;
}

// Source pixel of window (oh, ow) at kernel offset (kh, kw), or -1 when it
// falls into the padding.
inline long long pixel(const Geometry& g, std::size_t oh, std::size_t ow,
                       std::size_t kh, std::size_t kw) {
  const long long ih = (long long)(oh * g.SH + kh) - (long long)g.PH;
  const long long iw = (long long)(ow * g.SW + kw) - (long long)g.PW;
  if (ih < 0 || iw < 0 || ih >= (long long)g.H || iw >= (long long)g.W) return -1;
  return ih * (long long)g.W + iw;
}

} // namespace

namespace detail {

Tensor im2col_array(const Tensor& img, Pair kernel, Pair stride, Pair pad) {
  const Geometry g = geometry(img.shape(), kernel, stride, pad);
  const std::size_t win = g.KH * g.KW * g.OH * g.OW;
  const std::size_t plane = g.H * g.W;
  std::vector<double> col(g.N * g.C * win);
  const double* in = img.data().data();
  parallel::parallel_for(g.N * g.C, PLANE_GRAIN, [&](std::size_t p0, std::size_t p1) {
    for (std::size_t nc = p0; nc < p1; ++nc) {
      const double* src = in + nc * plane;
      double* dst = col.data() + nc * win;
      for (std::size_t kh = 0; kh < g.KH; ++kh)
        for (std::size_t kw = 0; kw < g.KW; ++kw)
          for (std::size_t oh = 0; oh < g.OH; ++oh)
            for (std::size_t ow = 0; ow < g.OW; ++ow) {
              const long long at = pixel(g, oh, ow, kh, kw);
              *dst++ = at < 0 ? 0.0 : src[at];
            }
    }
  });
  return Tensor(std::move(col), {g.N, g.C, g.KH, g.KW, g.OH, g.OW});
}

Tensor col2im_array(const Tensor& col, const Shape& img_shape, Pair kernel, Pair stride, Pair pad) {
  const Geometry g = geometry(img_shape, kernel, stride, pad);
  const Shape expect{g.N, g.C, g.KH, g.KW, g.OH, g.OW};
  if (col.shape() != expect)
    throw std::invalid_argument("col2im: columns " + shape_str(col.shape()) + " do not match " +
                                shape_str(expect) + " for image " + shape_str(img_shape));
  const std::size_t win = g.KH * g.KW * g.OH * g.OW;
  const std::size_t plane = g.H * g.W;
  std::vector<double> img(g.N * g.C * plane, 0.0);
  const double* in = col.data().data();
  parallel::parallel_for(g.N * g.C, PLANE_GRAIN, [&](std::size_t p0, std::size_t p1) {
    for (std::size_t nc = p0; nc < p1; ++nc) {
      const double* src = in + nc * win;
      double* dst = img.data() + nc * plane;
      for (std::size_t kh = 0; kh < g.KH; ++kh)
        for (std::size_t kw = 0; kw < g.KW; ++kw)
          for (std::size_t oh = 0; oh < g.OH; ++oh)
            for (std::size_t ow = 0; ow < g.OW; ++ow) {
              const long long at = pixel(g, oh, ow, kh, kw);
              const double v = *src++;
              if (at >= 0) dst[at] += v;
            }
    }
  });
  return Tensor(std::move(img), img_shape);
}

} // namespace detail

namespace {

// [N,C,KH,KW,OH,OW] -> [N*OH*OW, C*KH*KW]
Tensor col_matrix(const Tensor& col) {
  const auto& s = col.shape();
  return col.transpose({0, 4, 5, 1, 2, 3}).reshape({s[0] * s[4] * s[5], s[1] * s[2] * s[3]});
}

class Im2col final : public Function {
public:
  Im2col(Pair k, Pair s, Pair p, bool to_matrix) : k_(k), s_(s), p_(p), to_matrix_(to_matrix) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    x_shape_ = xs[0].shape();
    const Tensor col = detail::im2col_array(xs[0], k_, s_, p_);
    return {to_matrix_ ? col_matrix(col) : col};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {col2im(gys[0], x_shape_, k_, s_, p_, to_matrix_)};
  }
  const char* name() const override { return "Im2col"; }
private:
  Pair k_, s_, p_;
  bool to_matrix_;
  Shape x_shape_;
};

class Col2im final : public Function {
public:
  Col2im(Shape img_shape, Pair k, Pair s, Pair p, bool to_matrix)
    : img_shape_(std::move(img_shape)), k_(k), s_(s), p_(p), to_matrix_(to_matrix) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    Tensor col = xs[0];
    if (to_matrix_) {
      const Geometry g = geometry(img_shape_, k_, s_, p_);
      col = col.reshape({g.N, g.OH, g.OW, g.C, g.KH, g.KW}).transpose({0, 3, 4, 5, 1, 2});
    }
    return {detail::col2im_array(col, img_shape_, k_, s_, p_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {im2col(gys[0], k_, s_, p_, to_matrix_)};
  }
  const char* name() const override { return "Col2im"; }
private:
  Shape img_shape_;
  Pair k_, s_, p_;
  bool to_matrix_;
};

class Conv2d final : public Function {
public:
  Conv2d(Pair s, Pair p) : s_(s), p_(p) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    DG_BENCH("conv2d.forward");
    const Tensor& x = xs[0];
    const Tensor& W = xs[1];
    if (W.ndim() != 4 || x.ndim() != 4 || W.shape()[1] != x.shape()[1])
      throw std::invalid_argument("conv2d: weight " + shape_str(W.shape()) +
                                  " does not match input " + shape_str(x.shape()));
    const std::size_t OC = W.shape()[0];
    const Pair k{W.shape()[2], W.shape()[3]};
    const Geometry g = geometry(x.shape(), k, s_, p_);
    const Tensor col = col_matrix(detail::im2col_array(x, k, s_, p_));
    Tensor y = matmul(col, W.reshape({OC, g.C * g.KH * g.KW}).transpose());
    if (xs.size() == 3) y = y + xs[2];
    return {y.reshape({g.N, g.OH, g.OW, OC}).transpose({0, 3, 1, 2})};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable x = input(0), W = input(1);
    const Variable& gy = gys[0];
    const Pair k{W.shape()[2], W.shape()[3]};
    std::vector<Variable> gxs{
      deconv2d(gy, W, Variable(), s_, p_, Pair{x.shape()[2], x.shape()[3]}),
      conv2d_grad_w(x, gy, k, s_, p_)};
    if (num_inputs() == 3) gxs.push_back(sum(gy, {0, 2, 3}));
    return gxs;
  }
  const char* name() const override { return "Conv2d"; }
private:
  Pair s_, p_;
};

class Deconv2d final : public Function {
public:
  Deconv2d(Pair s, Pair p, std::optional<Pair> outsize) : s_(s), p_(p), outsize_(outsize) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    DG_BENCH("deconv2d.forward");
    const Tensor& x = xs[0];
    const Tensor& W = xs[1];
    if (W.ndim() != 4 || x.ndim() != 4 || W.shape()[0] != x.shape()[1])
      throw std::invalid_argument("deconv2d: weight " + shape_str(W.shape()) +
                                  " does not match input " + shape_str(x.shape()));
    const std::size_t N = x.shape()[0], C = x.shape()[1], H = x.shape()[2], Wd = x.shape()[3];
    const std::size_t OC = W.shape()[1], KH = W.shape()[2], KW = W.shape()[3];
    const Pair out = outsize_ ? *outsize_
                              : Pair{get_deconv_outsize(H, KH, s_[0], p_[0]),
                                     get_deconv_outsize(Wd, KW, s_[1], p_[1])};
    const Shape img{N, OC, out[0], out[1]};
    const Geometry g = geometry(img, {KH, KW}, s_, p_);
    if (g.OH != H || g.OW != Wd)
      throw std::invalid_argument("deconv2d: output size " + shape_str({out[0], out[1]}) +
                                  " is inconsistent with input " + shape_str(x.shape()));
    const Tensor xm = x.transpose({0, 2, 3, 1}).reshape({N * H * Wd, C});
    const Tensor gcol = matmul(xm, W.reshape({C, OC * KH * KW}))
                          .reshape({N, H, Wd, OC, KH, KW})
                          .transpose({0, 3, 4, 5, 1, 2});
    Tensor y = detail::col2im_array(gcol, img, {KH, KW}, s_, p_);
    if (xs.size() == 3) y = y + xs[2].reshape({1, OC, 1, 1});
    return {y};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable x = input(0), W = input(1);
    const Variable& gy = gys[0];
    const Pair k{W.shape()[2], W.shape()[3]};
    std::vector<Variable> gxs{conv2d(gy, W, Variable(), s_, p_),
                              conv2d_grad_w(gy, x, k, s_, p_)};
    if (num_inputs() == 3) gxs.push_back(sum(gy, {0, 2, 3}));
    return gxs;
  }
  const char* name() const override { return "Deconv2d"; }
private:
  Pair s_, p_;
  std::optional<Pair> outsize_;
};

class Conv2dGradW final : public Function {
public:
  Conv2dGradW(Pair k, Pair s, Pair p) : k_(k), s_(s), p_(p) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    const Tensor& x = xs[0];
    const Tensor& gy = xs[1];
    const Geometry g = geometry(x.shape(), k_, s_, p_);
    if (gy.ndim() != 4 || gy.shape()[0] != g.N || gy.shape()[2] != g.OH || gy.shape()[3] != g.OW)
      throw std::invalid_argument("conv2d_grad_w: gradient " + shape_str(gy.shape()) +
                                  " does not match input " + shape_str(x.shape()));
    const std::size_t OC = gy.shape()[1];
    const Tensor col = col_matrix(detail::im2col_array(x, k_, s_, p_));
    const Tensor gym = gy.transpose({1, 0, 2, 3}).reshape({OC, g.N * g.OH * g.OW});
    return {matmul(gym, col).reshape({OC, g.C, g.KH, g.KW})};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    const Variable x = input(0), gy = input(1);
    const Variable& gW = gys[0];
    return {deconv2d(gy, gW, Variable(), s_, p_, Pair{x.shape()[2], x.shape()[3]}),
            conv2d(x, gW, Variable(), s_, p_)};
  }
  const char* name() const override { return "Conv2dGradW"; }
private:
  Pair k_, s_, p_;
};

class Pooling final : public Function {
public:
  Pooling(Pair k, Pair s, Pair p) : k_(k), s_(s), p_(p) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    const Tensor& x = xs[0];
    x_shape_ = x.shape();
    const Geometry g = geometry(x_shape_, k_, s_, p_);
    const std::size_t plane = g.H * g.W, oplane = g.OH * g.OW;
    std::vector<double> y(g.N * g.C * oplane), idx(y.size());
    const double* in = x.data().data();
    parallel::parallel_for(g.N * g.C, PLANE_GRAIN, [&](std::size_t p0, std::size_t p1) {
      for (std::size_t nc = p0; nc < p1; ++nc) {
        const double* src = in + nc * plane;
        for (std::size_t oh = 0; oh < g.OH; ++oh)
          for (std::size_t ow = 0; ow < g.OW; ++ow) {
            double best = 0.0;
            std::size_t arg = 0;
            for (std::size_t kh = 0; kh < g.KH; ++kh)
              for (std::size_t kw = 0; kw < g.KW; ++kw) {
                const long long at = pixel(g, oh, ow, kh, kw);
                const double v = at < 0 ? 0.0 : src[at];
                if ((kh == 0 && kw == 0) || v > best) { best = v; arg = kh * g.KW + kw; }
              }
            const std::size_t o = nc * oplane + oh * g.OW + ow;
            y[o] = best;
            idx[o] = double(arg);
          }
      }
    });
    const Shape out{g.N, g.C, g.OH, g.OW};
    indexes_ = Tensor(std::move(idx), out);
    return {Tensor(std::move(y), out)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {pooling2d_grad(gys[0], indexes_, x_shape_, k_, s_, p_)};
  }
  const char* name() const override { return "Pooling"; }
private:
  Pair k_, s_, p_;
  Shape x_shape_;
  Tensor indexes_;
};

class Pooling2DGrad final : public Function {
public:
  Pooling2DGrad(Tensor indexes, Shape in_shape, Pair k, Pair s, Pair p)
    : indexes_(std::move(indexes)), in_shape_(std::move(in_shape)), k_(k), s_(s), p_(p) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    const Tensor& gy = xs[0];
    const Geometry g = geometry(in_shape_, k_, s_, p_);
    if (gy.shape() != indexes_.shape())
      throw std::invalid_argument("pooling2d_grad: gradient " + shape_str(gy.shape()) +
                                  " does not match indexes " + shape_str(indexes_.shape()));
    const std::size_t plane = g.H * g.W, oplane = g.OH * g.OW;
    std::vector<double> gx(numel(in_shape_), 0.0);
    const double* gv = gy.data().data();
    const double* iv = indexes_.data().data();
    parallel::parallel_for(g.N * g.C, PLANE_GRAIN, [&](std::size_t p0, std::size_t p1) {
      for (std::size_t nc = p0; nc < p1; ++nc) {
        double* dst = gx.data() + nc * plane;
        for (std::size_t oh = 0; oh < g.OH; ++oh)
          for (std::size_t ow = 0; ow < g.OW; ++ow) {
            const std::size_t o = nc * oplane + oh * g.OW + ow;
            const std::size_t arg = std::size_t(iv[o]);
            const long long at = pixel(g, oh, ow, arg / g.KW, arg % g.KW);
            if (at >= 0) dst[at] += gv[o];
          }
      }
    });
    return {Tensor(std::move(gx), in_shape_)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {pooling2d_with_indexes(gys[0], indexes_, k_, s_, p_)};
  }
  const char* name() const override { return "Pooling2DGrad"; }
private:
  Tensor indexes_;
  Shape in_shape_;
  Pair k_, s_, p_;
};

class Pooling2DWithIndexes final : public Function {
public:
  Pooling2DWithIndexes(Tensor indexes, Pair k, Pair s, Pair p)
    : indexes_(std::move(indexes)), k_(k), s_(s), p_(p) {}
  std::vector<Tensor> forward(const std::vector<Tensor>& xs) override {
    const Tensor& x = xs[0];
    x_shape_ = x.shape();
    const Geometry g = geometry(x_shape_, k_, s_, p_);
    const Shape out{g.N, g.C, g.OH, g.OW};
    if (out != indexes_.shape())
      throw std::invalid_argument("pooling2d_with_indexes: input " + shape_str(x_shape_) +
                                  " does not match indexes " + shape_str(indexes_.shape()));
    const std::size_t plane = g.H * g.W, oplane = g.OH * g.OW;
    std::vector<double> y(numel(out));
    const double* in = x.data().data();
    const double* iv = indexes_.data().data();
    parallel::parallel_for(g.N * g.C, PLANE_GRAIN, [&](std::size_t p0, std::size_t p1) {
      for (std::size_t nc = p0; nc < p1; ++nc) {
        const double* src = in + nc * plane;
        for (std::size_t oh = 0; oh < g.OH; ++oh)
          for (std::size_t ow = 0; ow < g.OW; ++ow) {
            const std::size_t o = nc * oplane + oh * g.OW + ow;
            const std::size_t arg = std::size_t(iv[o]);
            const long long at = pixel(g, oh, ow, arg / g.KW, arg % g.KW);
            y[o] = at < 0 ? 0.0 : src[at];
          }
      }
    });
    return {Tensor(std::move(y), out)};
  }
  std::vector<Variable> backward(const std::vector<Variable>& gys) override {
    return {pooling2d_grad(gys[0], indexes_, x_shape_, k_, s_, p_)};
  }
  const char* name() const override { return "Pooling2DWithIndexes"; }
private:
  Tensor indexes_;
  Pair k_, s_, p_;
  Shape x_shape_;
};

} // namespace

Variable im2col(const Variable& x, Pair kernel, Pair stride, Pair pad, bool to_matrix) {
  return call<Im2col>({x}, kernel, stride, pad, to_matrix);
}

Variable col2im(const Variable& col, const Shape& img_shape, Pair kernel, Pair stride, Pair pad,
                bool to_matrix) {
  return call<Col2im>({col}, img_shape, kernel, stride, pad, to_matrix);
}

Variable conv2d(const Variable& x, const Variable& W, const Variable& b, Pair stride, Pair pad) {
  if (b.defined()) return call<Conv2d>({x, W, b}, stride, pad);
  return call<Conv2d>({x, W}, stride, pad);
}

Variable deconv2d(const Variable& x, const Variable& W, const Variable& b, Pair stride, Pair pad,
                  std::optional<Pair> outsize) {
  if (b.defined()) return call<Deconv2d>({x, W, b}, stride, pad, outsize);
  return call<Deconv2d>({x, W}, stride, pad, outsize);
}

Variable conv2d_grad_w(const Variable& x, const Variable& gy, Pair kernel, Pair stride, Pair pad) {
  return call<Conv2dGradW>({x, gy}, kernel, stride, pad);
}

Variable pooling(const Variable& x, Pair kernel, Pair stride, Pair pad) {
  return call<Pooling>({x}, kernel, stride, pad);
}

Variable pooling2d_grad(const Variable& gy, const Tensor& indexes, const Shape& in_shape,
                        Pair kernel, Pair stride, Pair pad) {
  return call<Pooling2DGrad>({gy}, indexes, in_shape, kernel, stride, pad);
}

Variable pooling2d_with_indexes(const Variable& x, const Tensor& indexes,
                                Pair kernel, Pair stride, Pair pad) {
  return call<Pooling2DWithIndexes>({x}, indexes, kernel, stride, pad);
}

} // namespace dg
