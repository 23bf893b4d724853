#include "dg/ops/dropout.hpp"
#include "dg/core/config.hpp"
#include "dg/ops/elementwise.hpp"
#include "dg/parallel/parallel_for.hpp"

#include <stdexcept>
#include <vector>

namespace dg {

Variable dropout(const Variable& x, double ratio, std::uint64_t seed) {
  if (!is_training()) return x;
  if (ratio < 0.0 || ratio >= 1.0) throw std::invalid_argument("dropout: ratio must be in [0,1)");

  // Counter-based draws (SplitMix64 finaliser) so the mask does not depend
  // on how the loop is chunked across threads.
  auto splitmix = [](std::uint64_t v) {
    v += 0x9E3779B97F4A7C15ull;
    v = (v ^ (v >> 30)) * 0xBF58476D1CE4E5B9ull;
    v = (v ^ (v >> 27)) * 0x94D049BB133111EBull;
    return v ^ (v >> 31);
  };

  // Mixing the seed first keeps neighbouring seeds from giving shifted
  // copies of one mask.
  const std::uint64_t base = splitmix(seed);
  const std::size_t N = x.size();
  const double keep = 1.0 - ratio;
  const double scale = 1.0 / keep;
  std::vector<double> mask(N);
  parallel::parallel_for(N, 4096, [&](std::size_t i0, std::size_t i1) {
    for (std::size_t i = i0; i < i1; ++i) {
      const double u = double(splitmix(base ^ std::uint64_t(i)) >> 11) *
                       (1.0 / 9007199254740992.0);
      mask[i] = (u < keep) ? scale : 0.0;
    }
  });
  return x * Variable(Tensor(std::move(mask), x.shape()));
}

} // namespace dg
