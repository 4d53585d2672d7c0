// Fails to link on platforms where 64 bit atomics live in libatomic.

#include <atomic>
#include <cstdint>

int main()
{
    std::atomic<std::uint64_t> counter{0};

    auto previous = counter.fetch_add(1u);

    return static_cast<int>(previous + counter.load());
}
