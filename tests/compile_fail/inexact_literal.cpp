// 0.1 has no exact representation in halves.
#include <fxp/fxp.hpp>

using namespace fxp::literals;

int main() {
    auto x = fxp::from_literal<-1>(0.1_fx);
    return static_cast<int>(x.raw());
}
