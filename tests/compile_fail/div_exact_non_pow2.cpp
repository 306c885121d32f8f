// Only power-of-two constants divide exactly.
#include <fxp/fxp.hpp>

int main() {
    const auto a = fxp::ufixed<-3, 5>::max();
    auto q = a.div_exact<3>();
    return static_cast<int>(q.raw());
}
