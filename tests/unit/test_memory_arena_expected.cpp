#include <cassert>
#include <cstdint>
#include <cstddef>

#include "mrac/core/memory_arena.hpp"
#include "mrac/core/expected.hpp"
#include "mrac/core/time.hpp"
#include "mrac/core/clock.hpp"
#include "mrac/core/status.hpp"
#include "mrac/core/types.hpp"

using namespace mrac;

/*
to check: arena carving (alignment, zeroing, exhaustion, reset), Expected carrier semantics and
the integer nanosecond clock.
*/

struct Moveable{
    int v{0};
    explicit Moveable(int x) noexcept : v(x) {}
};

int main(){
    alignas(64) std::byte buf[256];
    MemoryArena arena(buf, sizeof(buf));
    assert(arena.capacity() == sizeof(buf));

    // // zeroed and aligned
    auto* d = arena.allocate_array<double>(4);
    assert(d != nullptr);
    assert(reinterpret_cast<std::uintptr_t>(d) % alignof(double) == 0);
    for (int i=0; i<4; ++i) assert(d[i] == 0.0);

    void* p = arena.allocate(1, 1);
    assert(p != nullptr);
    void* q = arena.allocate(8, 64);
    assert(q != nullptr);
    assert(reinterpret_cast<std::uintptr_t>(q) % 64 == 0);

    // // bad alignment and zero size
    assert(arena.allocate(8, 3) == nullptr);
    assert(arena.allocate(0) == nullptr);

    // // exhaustion leaves the arena usable
    const std::size_t used = arena.used();
    assert(arena.allocate_array<double>(1000) == nullptr);
    assert(arena.used() == used);
    assert(arena.remaining() == arena.capacity() - used);

    // // rewind to an earlier mark hands the same memory out again; a later mark is ignored
    {
        const std::size_t mark = arena.used();
        auto* a = arena.allocate_array<double>(2);
        assert(a != nullptr);
        arena.rewind(mark);
        assert(arena.used() == mark);
        auto* b = arena.allocate_array<double>(2);
        assert(b == a);
        arena.rewind(arena.used() + 64);
        assert(arena.used() == mark + 2 * sizeof(double));
    }

    arena.reset();
    assert(arena.used() == 0);

    // // null block never hands out memory
    MemoryArena empty(nullptr, 0);
    assert(empty.allocate(8) == nullptr);

    // // Expected
    auto ok = Expected<int>::success(42);
    assert(ok.has_value() && static_cast<bool>(ok));
    assert(ok.status() == Status::kOK);
    assert(ok.value() == 42);
    assert(ok.value_or(7) == 42);

    auto bad = Expected<int>::failure(Status::kNoMem);
    assert(!bad.has_value());
    assert(bad.status() == Status::kNoMem);
    assert(bad.value_or(7) == 7);

    // // failure(kOK) is a caller bug, must not look like success
    auto weird = Expected<int>::failure(Status::kOK);
    assert(!weird.has_value());
    assert(weird.status() == Status::kPreconditionFail);

    auto em = Expected<Moveable>::emplace(5);
    assert(em.has_value() && em.value().v == 5);
    auto copy = em;
    assert(copy.value().v == 5);
    Moveable taken = em.take();
    assert(taken.v == 5);
    assert(!em.has_value());

    auto moved = std::move(copy);
    assert(moved.has_value() && moved.value().v == 5);

    // // clock: tick k sits at exactly k * dt in nanoseconds
    SimulationClock clk{};
    clk.dt = from_seconds(0.01);
    assert(clk.dt == 10'000'000);
    for (int k=0; k<1000; ++k) clk.advance();
    assert(clk.tick == 1000);
    assert(clk.now() == 10'000'000'000);
    assert(clk.seconds() == 10.0);
    clk.rewind();
    assert(clk.tick == 0 && clk.now() == 0);

    assert(from_seconds(1e-12) == 0);
    assert(to_seconds(1'500'000'000) == 1.5);

    return 0;
}
