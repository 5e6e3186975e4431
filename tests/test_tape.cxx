#include <cassert>
#include <cstddef>
#include <cstdint>

#include "tapevm/tape.hxx"

using tapevm::Tape;

static void test_writes_wrap() {
    Tape t(4, 8);
    assert(t.modulus() == 256);
    assert(t.mask() == 255);
    t.write(0, 256 + 5);
    assert(t.read(0) == 5);
    t.write(1, 255 + 1);
    assert(t.read(1) == 0);

    Tape w16(2, 16);
    w16.write(0, 70000);
    assert(w16.read(0) == 70000 - 65536);

    Tape w32(2, 32);
    w32.write(0, 0x100000005ull);
    assert(w32.read(0) == 5);
    w32.write(1, 0xFFFFFFFFull);
    assert(w32.read(1) == 0xFFFFFFFFu);
}

static void test_pointer_wraps() {
    Tape t(4, 8);
    t.advance(-1);
    assert(t.pointer() == 3);
    t.advance(5);
    assert(t.pointer() == 0);
    t.advance(-9);
    assert(t.pointer() == 3);
    t.setPointer(9);
    assert(t.pointer() == 1);
    t.write(7);
    assert(t.read() == 7);
    assert(t.read(1) == 7);
}

static void test_resize_and_clear() {
    Tape t(4, 8);
    t.write(2, 7);
    t.setPointer(3);
    t.resize(8, 16);
    assert(t.size() == 8);
    assert(t.cellWidth() == 16);
    assert(t.bytes() == 16);
    assert(t.pointer() == 0);
    assert(!t.lastNonZero());

    t.write(6, 1);
    assert(t.lastNonZero() == 6u);
    t.setPointer(5);
    t.clear();
    assert(!t.lastNonZero());
    assert(t.pointer() == 0);

    // Larger than one vector register so the bulk path runs.
    Tape big(1000, 32);
    for (std::size_t i = 0; i < big.size(); ++i) big.write(i, i + 1);
    big.resize(1000, 32);
    assert(!big.lastNonZero());
}

static void test_bad_width() {
    bool threw = false;
    try {
        Tape bad(4, 12);
    } catch (const tapevm::ConfigError&) {
        threw = true;
    }
    assert(threw);
    (void)threw;
}

static void test_equality() {
    Tape a(3, 8);
    Tape b(3, 8);
    assert(a == b);
    a.write(1, 2);
    assert(!(a == b));
    b.write(1, 258);
    assert(a == b);
    b.advance(1);
    assert(!(a == b));
}

int main() {
    test_writes_wrap();
    test_pointer_wraps();
    test_resize_and_clear();
    test_bad_width();
    test_equality();
    return 0;
}
