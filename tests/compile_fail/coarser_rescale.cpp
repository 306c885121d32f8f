// Moving to a coarser shift would drop the fractional bits.
#include <fxp/fxp.hpp>

int main() {
    const auto a = fxp::ufixed<-3, 5>::max();
    auto r = a.rescale<0>();
    return static_cast<int>(r.raw());
}
