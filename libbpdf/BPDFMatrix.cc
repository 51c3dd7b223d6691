#include <bpdf/BPDFMatrix.hh>

#include <bpdf/BUtil.hh>

#include <algorithm>
#include <cmath>

BPDFMatrix::BPDFMatrix() :
    a(1.0),
    b(0.0),
    c(0.0),
    d(1.0),
    e(0.0),
    f(0.0)
{
}

BPDFMatrix::BPDFMatrix(double a, double b, double c, double d, double e, double f) :
    a(a),
    b(b),
    c(c),
    d(d),
    e(e),
    f(f)
{
}

BPDFMatrix::BPDFMatrix(BPDFObjectHandle const& array) :
    BPDFMatrix()
{
    if (!(array.isArray() && array.getArrayNItems() == 6)) {
        return;
    }
    double v[6];
    for (int i = 0; i < 6; ++i) {
        if (!array.getArrayItem(i).getValueAsNumber(v[i])) {
            return;
        }
    }
    a = v[0];
    b = v[1];
    c = v[2];
    d = v[3];
    e = v[4];
    f = v[5];
}

static double
fix_rounding(double d)
{
    if ((d > -0.00001) && (d < 0.00001)) {
        d = 0.0;
    }
    return d;
}

std::string
BPDFMatrix::unparse() const
{
    std::string result;
    for (double v: {a, b, c, d, e, f}) {
        if (!result.empty()) {
            result += " ";
        }
        result += BUtil::double_to_string(fix_rounding(v), 5);
    }
    return result;
}

void
BPDFMatrix::concat(BPDFMatrix const& other)
{
    double ap = (a * other.a) + (c * other.b);
    double bp = (b * other.a) + (d * other.b);
    double cp = (a * other.c) + (c * other.d);
    double dp = (b * other.c) + (d * other.d);
    double ep = (a * other.e) + (c * other.f) + e;
    double fp = (b * other.e) + (d * other.f) + f;
    a = ap;
    b = bp;
    c = cp;
    d = dp;
    e = ep;
    f = fp;
}

void
BPDFMatrix::scale(double sx, double sy)
{
    concat(BPDFMatrix(sx, 0, 0, sy, 0, 0));
}

void
BPDFMatrix::translate(double tx, double ty)
{
    concat(BPDFMatrix(1, 0, 0, 1, tx, ty));
}

void
BPDFMatrix::rotatex90(int angle)
{
    switch (angle) {
    case 90:
        concat(BPDFMatrix(0, 1, -1, 0, 0, 0));
        break;
    case 180:
        concat(BPDFMatrix(-1, 0, 0, -1, 0, 0));
        break;
    case 270:
        concat(BPDFMatrix(0, -1, 1, 0, 0, 0));
        break;
    default:
        break;
    }
}

void
BPDFMatrix::rotate(double degrees)
{
    double r = degrees * 3.14159265358979323846 / 180.0;
    double cos_r = std::cos(r);
    double sin_r = std::sin(r);
    concat(BPDFMatrix(cos_r, sin_r, -sin_r, cos_r, 0, 0));
}

bool
BPDFMatrix::invert(BPDFMatrix& result) const
{
    double det = (a * d) - (b * c);
    if (std::fabs(det) < 1e-12) {
        return false;
    }
    result = BPDFMatrix(
        d / det, -b / det, -c / det, a / det, ((c * f) - (d * e)) / det, ((b * e) - (a * f)) / det);
    return true;
}

void
BPDFMatrix::transform(double x, double y, double& xp, double& yp) const
{
    xp = (a * x) + (c * y) + e;
    yp = (b * x) + (d * y) + f;
}

BPDFObjectHandle::Rectangle
BPDFMatrix::transformRectangle(BPDFObjectHandle::Rectangle r) const
{
    double tx[4];
    double ty[4];
    transform(r.llx, r.lly, tx[0], ty[0]);
    transform(r.llx, r.ury, tx[1], ty[1]);
    transform(r.urx, r.lly, tx[2], ty[2]);
    transform(r.urx, r.ury, tx[3], ty[3]);
    return {
        *std::min_element(tx, tx + 4),
        *std::min_element(ty, ty + 4),
        *std::max_element(tx, tx + 4),
        *std::max_element(ty, ty + 4)};
}

bool
BPDFMatrix::operator==(BPDFMatrix const& rhs) const
{
    return a == rhs.a && b == rhs.b && c == rhs.c && d == rhs.d && e == rhs.e && f == rhs.f;
}
