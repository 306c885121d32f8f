// Four 127-bit operands need 129 bits.
#include <array>

#include <fxp/fxp.hpp>

int main() {
    using T = fxp::ufixed<0, 127>;
    std::array<T, 4> xs{T::max(), T::max(), T::max(), T::max()};
    auto s = fxp::sum(xs);
    return static_cast<int>(s.raw() & 1);
}
