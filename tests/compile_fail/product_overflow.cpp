// 100 + 100 bits exceed the widest storage.
#include <fxp/fxp.hpp>

int main() {
    const auto a = fxp::ufixed<0, 100>::max();
    auto p = a * a;
    return static_cast<int>(p.raw() & 1);
}
