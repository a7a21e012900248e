#include "codexec/random.hh"

#include <cstdint>
#include <random>

namespace codexec {

std::string random_hex(size_t len) {
    static thread_local std::mt19937_64 gen{[] {
        std::random_device rd;
        return (static_cast<uint64_t>(rd()) << 32) ^ rd();
    }()};
    constexpr char digits[] = "0123456789abcdef";
    std::uniform_int_distribution<int> dist{0, 15};
    std::string res(len, '0');
    for (auto& c : res) {
        c = digits[dist(gen)];
    }
    return res;
}

} // namespace codexec
