#include "core.h"
#include <QtMath>
#include <algorithm>
#include <cmath>
#include <limits>

namespace hfl {

// ── Sparkline range ──

SparklineRange sparklineRange(const QVector<Row>& rows) {
    SparklineRange r;
    double lo = std::numeric_limits<double>::infinity();
    double hi = -lo;
    for (const Row& row : rows) {
        if (!isNumeric(row.sparkline)) continue;
        double v = row.sparkline.toDouble();
        if (!qIsFinite(v)) continue;
        lo = std::min(lo, v);
        hi = std::max(hi, v);
        r.valid = true;
    }
    if (r.valid) {
        r.min = lo;
        r.max = hi;
    }
    return r;
}

bool SparklineRange::fraction(const QVariant& v, double* out) const {
    if (!valid || !isNumeric(v)) return false;
    const double d = v.toDouble();
    if (!qIsFinite(d)) return false;
    const double span = max - min;
    double f = span > 0 ? (d - min) / span : 1.0;   // flat range draws full bars
    if (out) *out = qBound(0.0, f, 1.0);
    return true;
}

namespace fmt {

static constexpr int kMaxFractionDigits = 3;
static constexpr int kIndentBase        = 8;
static constexpr int kIndentStep        = 14;

// Numbers use locale grouping with at most three fraction digits, trailing
// zeros dropped. Anything else is shown as text; invalid is empty.
QString value(const QVariant& v, const QLocale& locale) {
    if (!v.isValid() || v.isNull()) return {};
    if (!isNumeric(v)) return v.toString();

    const double d = v.toDouble();
    if (!qIsFinite(d)) return v.toString();
    if (d == std::floor(d) && std::abs(d) < 1e15)
        return locale.toString(static_cast<qlonglong>(d));

    QString s = locale.toString(d, 'f', kMaxFractionDigits);
    const QString dot = QString(locale.decimalPoint());
    if (s.contains(dot)) {
        while (s.endsWith(QLatin1Char('0'))) s.chop(1);
        if (s.endsWith(dot)) s.chop(dot.size());
    }
    return s;
}

QString elide(const QString& text, int maxChars) {
    if (maxChars <= 0) return {};
    if (text.size() <= maxChars) return text;
    if (maxChars == 1) return QString(QChar(0x2026));
    return text.left(maxChars - 1) + QChar(0x2026);
}

int indentPx(int depth) {
    return kIndentBase + std::max(0, depth) * kIndentStep;
}

} // namespace fmt

} // namespace hfl
