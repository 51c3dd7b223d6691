#include <bpdf/assert_test.h>

#include <bpdf/BPDFMatrix.hh>
#include <bpdf/BUtil.hh>

#include <initializer_list>
#include <iostream>

static std::string
numbers(std::initializer_list<double> values)
{
    std::string result;
    for (double v: values) {
        result += (result.empty() ? "" : " ") + BUtil::double_to_string(v, 2);
    }
    return result;
}

static void
expect(std::string const& actual, std::string const& wanted)
{
    if (actual != wanted) {
        std::cout << "got " << actual << ", wanted " << wanted << std::endl;
    }
    assert(actual == wanted);
}

static std::string
apply(BPDFMatrix const& m, double x, double y)
{
    double xp = 0;
    double yp = 0;
    m.transform(x, y, xp, yp);
    return numbers({xp, yp});
}

static std::string
bounds(BPDFObjectHandle::Rectangle const& r)
{
    return numbers({r.llx, r.lly, r.urx, r.ury});
}

static void
test_placement()
{
    // Stamps are placed by translating to the anchor and then scaling.
    BPDFMatrix m;
    expect(m.unparse(), "1 0 0 1 0 0");
    m.translate(72, 144);
    expect(m.unparse(), "1 0 0 1 72 144");
    m.scale(0.5, 0.25);
    expect(m.unparse(), "0.5 0 0 0.25 72 144");
    expect(apply(m, 100, 400), "122 244");

    m = BPDFMatrix(2, 0, 0, 3, 0, 0);
    m.concat(BPDFMatrix(1, 1, 0, 1, 4, 5));
    expect(m.unparse(), "2 3 0 3 8 15");
    expect(apply(m, 1, 1), "10 21");

    auto from_array = BPDFMatrix(BPDFObjectHandle::parse("[0.5 0 0 0.5 10 -20]"));
    expect(from_array.unparse(), "0.5 0 0 0.5 10 -20");
    // Anything but six numbers is the identity.
    expect(BPDFMatrix(BPDFObjectHandle::parse("[1 2 3]")).unparse(), "1 0 0 1 0 0");
    expect(BPDFMatrix(BPDFObjectHandle::parse("[1 0 0 1 0 (x)]")).unparse(), "1 0 0 1 0 0");
    expect(BPDFMatrix(BPDFObjectHandle::parse("/CTM")).unparse(), "1 0 0 1 0 0");
}

static void
test_page_rotation()
{
    // A letter page turned a quarter turn maps its media box onto a landscape one.
    BPDFMatrix m;
    m.translate(792, 0);
    m.rotatex90(90);
    expect(m.unparse(), "0 1 -1 0 792 0");
    expect(apply(m, 0, 0), "792 0");
    expect(apply(m, 612, 792), "0 612");
    auto media_box = m.transformRectangle(BPDFObjectHandle::Rectangle(0, 0, 612, 792));
    expect(bounds(media_box), "0 0 792 612");

    BPDFMatrix half;
    half.rotatex90(180);
    expect(half.unparse(), "-1 0 0 -1 0 0");
    half.rotatex90(180);
    expect(half.unparse(), "1 0 0 1 0 0");

    BPDFMatrix turned;
    turned.rotatex90(270);
    expect(turned.unparse(), "0 -1 1 0 0 0");
    // Only quarter turns are applied.
    turned.rotatex90(45);
    turned.rotatex90(-90);
    expect(turned.unparse(), "0 -1 1 0 0 0");
}

static void
test_rotate_invert()
{
    BPDFMatrix m;
    m.rotate(90);
    expect(m.unparse(), "0 1 -1 0 0 0");
    m = BPDFMatrix();
    m.rotate(45);
    m.rotate(45);
    expect(m.unparse(), "0 1 -1 0 0 0");

    BPDFMatrix r;
    m = BPDFMatrix(2, 0, 0, 4, 10, 20);
    assert(m.invert(r));
    expect(r.unparse(), "0.5 0 0 0.25 -5 -5");
    double xp = 0;
    double yp = 0;
    m.transform(3, 5, xp, yp);
    expect(apply(r, xp, yp), "3 5");

    BPDFMatrix singular(1, 2, 2, 4, 0, 0);
    BPDFMatrix unchanged(9, 9, 9, 9, 9, 9);
    assert(!singular.invert(unchanged));
    assert(unchanged == BPDFMatrix(9, 9, 9, 9, 9, 9));
    assert(unchanged != BPDFMatrix());
}

int
main()
{
    test_placement();
    test_page_rotation();
    test_rotate_invert();
    std::cout << "matrix tests done" << std::endl;
    return 0;
}
